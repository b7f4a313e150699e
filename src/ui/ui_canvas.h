#pragma once

#include <lvgl.h>

#include <stdint.h>

#include <string>

#include "../core/frame.h"
#include "lvgl_port.h"
#include "ui_theme.h"

// Immediate-mode drawing on top of LVGL. Each frame starts from an empty
// screen, gets its widgets rebuilt and is rendered once.
class UiCanvas {
 public:
  UiCanvas(LvglPort &port, const UiFontSet &fonts);

  // Header bar with the title and "index+1/count", footer bar with hints.
  // An empty footer still reserves the bar.
  void beginScreen(const char *title, int index, int count, const std::string &footer);
  void beginBlank();
  Frame finish();

  lv_obj_t *text(int x, int y, const std::string &value, uint32_t color, UiFontRole role,
                 int width = 0, lv_text_align_t align = LV_TEXT_ALIGN_LEFT);
  lv_obj_t *rect(int x, int y, int w, int h, uint32_t fill);
  lv_obj_t *frameRect(int x, int y, int w, int h, uint32_t border, uint32_t fill);
  void divider(int y);
  void scrollbar(int trackTop, int trackBottom, int thumbTop, int thumbHeight);

  // Rendered width of a label, after layout.
  int measure(lv_obj_t *label) const;

  int width() const { return port_.width(); }
  int height() const { return port_.height(); }
  int bodyBottom() const;

 private:
  lv_obj_t *box(int x, int y, int w, int h);

  LvglPort &port_;
  const UiFontSet &fonts_;
  lv_obj_t *screen_ = nullptr;
};
