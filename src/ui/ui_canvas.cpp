#include "ui_canvas.h"

#include <stdio.h>

namespace {

constexpr int kHeaderHeight = 15;
constexpr int kFooterHeight = 13;
constexpr int kBodyGap = 2;
constexpr int kScrollbarWidth = 3;
constexpr int kScrollbarInset = 4;
constexpr lv_style_selector_t kStyleAny =
    static_cast<lv_style_selector_t>(LV_PART_MAIN) |
    static_cast<lv_style_selector_t>(LV_STATE_ANY);

void disableScroll(lv_obj_t *obj) {
  lv_obj_clear_flag(obj, LV_OBJ_FLAG_SCROLLABLE);
  lv_obj_set_scrollbar_mode(obj, LV_SCROLLBAR_MODE_OFF);
  lv_obj_set_scroll_dir(obj, LV_DIR_NONE);
}

}  // namespace

UiCanvas::UiCanvas(LvglPort &port, const UiFontSet &fonts) : port_(port), fonts_(fonts) {}

void UiCanvas::beginBlank() {
  screen_ = lv_screen_active();
  lv_obj_clean(screen_);
  disableScroll(screen_);
  lv_obj_set_style_bg_color(screen_, lv_color_hex(kClrBg), 0);
  lv_obj_set_style_bg_opa(screen_, LV_OPA_COVER, 0);
  lv_obj_set_style_text_opa(screen_, LV_OPA_COVER, 0);
  lv_obj_set_style_pad_all(screen_, 0, 0);
}

void UiCanvas::beginScreen(const char *title, int index, int count, const std::string &footer) {
  beginBlank();

  const int w = width();
  const int h = height();

  rect(0, 0, w, kHeaderHeight, kClrGreenDim);
  text(3, 1, title, kClrGreen, UiFontRole::Title, w / 2);

  char nav[16];
  snprintf(nav, sizeof(nav), "%d/%d", index + 1, count);
  text(w / 2, 2, nav, kClrGreenMid, UiFontRole::Small, w / 2 - 3, LV_TEXT_ALIGN_RIGHT);

  rect(0, h - kFooterHeight, w, kFooterHeight, kClrGreenDim);
  if (!footer.empty()) {
    text(2, h - kFooterHeight + 1, footer, kClrGreenMid, UiFontRole::Small, w - 4);
  }
}

Frame UiCanvas::finish() {
  Frame frame = port_.render();
  if (screen_) {
    lv_obj_clean(screen_);
  }
  return frame;
}

lv_obj_t *UiCanvas::box(int x, int y, int w, int h) {
  lv_obj_t *obj = lv_obj_create(screen_);
  lv_obj_remove_style_all(obj);
  disableScroll(obj);
  lv_obj_set_pos(obj, x, y);
  lv_obj_set_size(obj, w < 1 ? 1 : w, h < 1 ? 1 : h);
  return obj;
}

lv_obj_t *UiCanvas::rect(int x, int y, int w, int h, uint32_t fill) {
  lv_obj_t *obj = box(x, y, w, h);
  lv_obj_set_style_bg_color(obj, lv_color_hex(fill), 0);
  lv_obj_set_style_bg_opa(obj, LV_OPA_COVER, 0);
  return obj;
}

lv_obj_t *UiCanvas::frameRect(int x, int y, int w, int h, uint32_t border, uint32_t fill) {
  lv_obj_t *obj = rect(x, y, w, h, fill);
  lv_obj_set_style_border_width(obj, 1, 0);
  lv_obj_set_style_border_color(obj, lv_color_hex(border), 0);
  lv_obj_set_style_border_opa(obj, LV_OPA_COVER, 0);
  return obj;
}

lv_obj_t *UiCanvas::text(int x, int y, const std::string &value, uint32_t color,
                         UiFontRole role, int width, lv_text_align_t align) {
  lv_obj_t *label = lv_label_create(screen_);
  lv_obj_set_style_bg_opa(label, LV_OPA_TRANSP, 0);
  lv_obj_set_style_text_font(label, fonts_.font(role), kStyleAny);
  lv_obj_set_style_text_color(label, lv_color_hex(color), kStyleAny);
  lv_obj_set_style_pad_all(label, 0, kStyleAny);
  if (width > 0) {
    lv_obj_set_width(label, width);
    lv_label_set_long_mode(label, LV_LABEL_LONG_CLIP);
    lv_obj_set_style_text_align(label, align, kStyleAny);
  }
  lv_label_set_text(label, value.c_str());
  lv_obj_set_pos(label, x, y);
  return label;
}

void UiCanvas::divider(int y) {
  rect(0, y, width(), 1, kClrGreenDim);
}

void UiCanvas::scrollbar(int trackTop, int trackBottom, int thumbTop, int thumbHeight) {
  const int x = width() - kScrollbarInset;
  rect(x, trackTop, kScrollbarWidth, trackBottom - trackTop + 1, kClrGreenDim);
  rect(x, thumbTop, kScrollbarWidth, thumbHeight + 1, kClrGreen);
}

int UiCanvas::measure(lv_obj_t *label) const {
  lv_obj_update_layout(label);
  return static_cast<int>(lv_obj_get_width(label));
}

int UiCanvas::bodyBottom() const {
  return height() - kFooterHeight - kBodyGap;
}
