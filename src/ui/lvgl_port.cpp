#include "lvgl_port.h"

#include "../core/clock.h"
#include "../core/log.h"

namespace {

constexpr uint32_t kBytesPerPixel = 3;
constexpr uint32_t kMaxTickStepMs = 1000U;

}  // namespace

LvglPort::LvglPort() = default;

LvglPort::~LvglPort() {
  end();
}

bool LvglPort::begin(uint16_t width, uint16_t height, std::string *error) {
  if (initialized_) {
    return true;
  }
  if (width == 0 || height == 0) {
    if (error) {
      *error = "invalid display size";
    }
    return false;
  }

  lv_init();

  display_ = lv_display_create(static_cast<int32_t>(width), static_cast<int32_t>(height));
  if (!display_) {
    logErrorf("[ui] LVGL display create failed\n");
    if (error) {
      *error = "LVGL display create failed";
    }
    lv_deinit();
    return false;
  }

  width_ = width;
  height_ = height;
  stride_ = lv_draw_buf_width_to_stride(width, LV_COLOR_FORMAT_RGB888);
  buffer_.assign(static_cast<size_t>(stride_) * height, 0);

  lv_display_set_user_data(display_, this);
  lv_display_set_color_format(display_, LV_COLOR_FORMAT_RGB888);
  lv_display_set_flush_cb(display_, flushCb);
  lv_display_set_buffers(display_,
                         buffer_.data(),
                         nullptr,
                         static_cast<uint32_t>(buffer_.size()),
                         LV_DISPLAY_RENDER_MODE_FULL);
  lv_display_set_default(display_);

  lastTickMs_ = monotonicMs();
  initialized_ = true;
  logPrintf("[ui] LVGL %ux%u ready\n", static_cast<unsigned>(width), static_cast<unsigned>(height));
  return true;
}

void LvglPort::end() {
  if (!initialized_) {
    return;
  }
  lv_display_delete(display_);
  display_ = nullptr;
  lv_deinit();
  buffer_.clear();
  initialized_ = false;
}

void LvglPort::pumpTick() {
  const unsigned long now = monotonicMs();
  unsigned long diff = now - lastTickMs_;
  if (diff > kMaxTickStepMs) {
    diff = kMaxTickStepMs;
  }
  if (diff > 0U) {
    lv_tick_inc(static_cast<uint32_t>(diff));
    lastTickMs_ = now;
  }
}

Frame LvglPort::render() {
  Frame frame(width_, height_);
  if (!initialized_) {
    return frame;
  }

  pumpTick();
  target_ = &frame;
  lv_obj_invalidate(lv_screen_active());
  lv_refr_now(display_);
  target_ = nullptr;
  return frame;
}

bool LvglPort::ready() const {
  return initialized_ && display_ != nullptr;
}

// Full render mode: pxMap is the whole screen buffer, so rows are addressed
// from the buffer origin.
void LvglPort::flushCb(lv_display_t *disp, const lv_area_t *area, uint8_t *pxMap) {
  LvglPort *self = static_cast<LvglPort *>(lv_display_get_user_data(disp));
  if (!self || !self->target_) {
    lv_display_flush_ready(disp);
    return;
  }

  Frame &frame = *self->target_;
  for (int32_t y = area->y1; y <= area->y2; ++y) {
    if (y < 0 || y >= self->height_) {
      continue;
    }
    const uint8_t *row = pxMap + static_cast<size_t>(y) * self->stride_;
    for (int32_t x = area->x1; x <= area->x2; ++x) {
      if (x < 0 || x >= self->width_) {
        continue;
      }
      const uint8_t *px = row + static_cast<size_t>(x) * kBytesPerPixel;
      // LVGL stores RGB888 as B, G, R.
      frame.setPixel(x, y, px[2], px[1], px[0]);
    }
  }

  lv_display_flush_ready(disp);
}
