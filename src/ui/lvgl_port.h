#pragma once

#include <lvgl.h>

#include <stdint.h>

#include <string>
#include <vector>

#include "../core/frame.h"

// Headless LVGL display. Every render draws the whole active screen into an
// RGB888 buffer and hands it back as a Frame; nothing is pushed to hardware.
class LvglPort {
 public:
  LvglPort();
  ~LvglPort();

  LvglPort(const LvglPort &) = delete;
  LvglPort &operator=(const LvglPort &) = delete;

  bool begin(uint16_t width, uint16_t height, std::string *error = nullptr);
  void end();

  Frame render();

  bool ready() const;
  uint16_t width() const { return width_; }
  uint16_t height() const { return height_; }

 private:
  static void flushCb(lv_display_t *disp, const lv_area_t *area, uint8_t *pxMap);
  void pumpTick();

  lv_display_t *display_ = nullptr;
  std::vector<uint8_t> buffer_;
  uint32_t stride_ = 0;
  uint16_t width_ = 0;
  uint16_t height_ = 0;
  Frame *target_ = nullptr;
  unsigned long lastTickMs_ = 0;
  bool initialized_ = false;
};
