#pragma once

#include "../apps/screen.h"
#include "ui_canvas.h"

// Full-screen power-off countdown: big digit, draining bar, cancel hint.
class ConfirmOverlay : public ShutdownOverlay {
 public:
  explicit ConfirmOverlay(UiCanvas &canvas);

  Frame render(double remainingSeconds, double totalSeconds) override;

 private:
  UiCanvas &canvas_;
};
