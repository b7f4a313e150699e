#include "confirm_overlay.h"

#include <stdio.h>

#include "../apps/app_state_machine.h"

namespace {

constexpr int kBarMargin = 12;
constexpr int kBarHeight = 8;

}  // namespace

ConfirmOverlay::ConfirmOverlay(UiCanvas &canvas) : canvas_(canvas) {}

Frame ConfirmOverlay::render(double remainingSeconds, double totalSeconds) {
  const int w = canvas_.width();
  const int h = canvas_.height();

  canvas_.beginBlank();
  canvas_.frameRect(1, 1, w - 2, h - 2, kClrAmber, kClrBg);
  canvas_.text(0, 8, "SHUTDOWN?", kClrAmber, UiFontRole::Title, w, LV_TEXT_ALIGN_CENTER);

  char digit[8];
  snprintf(digit, sizeof(digit), "%d", countdownDigit(remainingSeconds, totalSeconds));
  canvas_.text(0, h / 2 - 26, digit, kClrGreen, UiFontRole::Big, w, LV_TEXT_ALIGN_CENTER);

  const int barWidth = w - kBarMargin * 2;
  const int barY = h / 2 + 12;
  canvas_.frameRect(kBarMargin - 1, barY - 1, barWidth + 2, kBarHeight + 2, kClrGreenDim, kClrBg);
  const int filled = countdownBarWidth(barWidth, remainingSeconds, totalSeconds);
  if (filled > 0) {
    canvas_.rect(kBarMargin, barY, filled, kBarHeight, kClrGreen);
  }

  canvas_.text(0, h - 30, "Powering off", kClrGreenMid, UiFontRole::Small, w,
               LV_TEXT_ALIGN_CENTER);
  canvas_.text(0, h - 18, "any key cancels", kClrGreenDim, UiFontRole::Small, w,
               LV_TEXT_ALIGN_CENTER);
  return canvas_.finish();
}
