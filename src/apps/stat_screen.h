#pragma once

#include "../core/system_metrics.h"
#include "canvas_screen.h"

// System dashboard. Read-only: every event is ignored.
class StatScreen : public CanvasScreen {
 public:
  StatScreen(UiCanvas &canvas, SystemMetrics &metrics);

  const char *title() const override { return "STAT"; }
  void handleEvent(ButtonEvent event) override;
  Frame render() override;

 private:
  SystemMetrics &metrics_;
};
