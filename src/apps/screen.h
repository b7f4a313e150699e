#pragma once

#include "../core/button_event.h"
#include "../core/frame.h"

// One page of the interface. Left and Right never reach a screen; they
// switch pages. render() is called once per tick for the visible page only.
class Screen {
 public:
  virtual ~Screen() = default;

  virtual const char *title() const = 0;
  virtual void handleEvent(ButtonEvent event) = 0;
  virtual Frame render() = 0;

  // Runs every tick for every page, visible or not.
  virtual void backgroundTick() {}
  virtual void onAttach(int index, int count) {
    (void)index;
    (void)count;
  }
  // Release anything that outlives the loop (audio).
  virtual void onShutdown() {}
};

// Drawn instead of the active page while a power-off is pending.
class ShutdownOverlay {
 public:
  virtual ~ShutdownOverlay() = default;

  virtual Frame render(double remainingSeconds, double totalSeconds) = 0;
};
