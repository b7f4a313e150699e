#pragma once

#include <stdint.h>

#include <memory>
#include <vector>

#include "../core/frame.h"
#include "../core/input_sampler.h"
#include "screen.h"

enum class ShutdownPhase : uint8_t {
  Idle = 0,
  Confirming = 1,
};

enum class TickOutcome : uint8_t {
  Continue = 0,
  PowerOff = 1,
};

// Page navigation plus the hold-to-power-off confirmation.
//
// Idle: holding every combo pin starts the countdown and drops everything
// queued so far. Otherwise one queued event is handled: Left/Right switch
// pages, anything else goes to the active page.
// Confirming: any queued event cancels and is dropped. Reaching the deadline
// reports PowerOff; the caller owns the actual teardown.
class AppStateMachine {
 public:
  AppStateMachine(InputSampler &input,
                  const std::vector<unsigned> &comboPins,
                  unsigned long confirmMs,
                  ShutdownOverlay *overlay);

  AppStateMachine(const AppStateMachine &) = delete;
  AppStateMachine &operator=(const AppStateMachine &) = delete;

  void addScreen(std::unique_ptr<Screen> screen);

  TickOutcome tick(unsigned long nowMs);
  Frame render(unsigned long nowMs);
  void shutdownScreens();

  size_t activeIndex() const { return active_; }
  size_t screenCount() const { return screens_.size(); }
  Screen *activeScreen();
  ShutdownPhase phase() const { return phase_; }
  unsigned long confirmMs() const { return confirmMs_; }
  double remainingSeconds(unsigned long nowMs) const;

 private:
  void dispatch(ButtonEvent event);

  InputSampler &input_;
  std::vector<unsigned> comboPins_;
  unsigned long confirmMs_;
  ShutdownOverlay *overlay_;

  std::vector<std::unique_ptr<Screen>> screens_;
  size_t active_ = 0;
  ShutdownPhase phase_ = ShutdownPhase::Idle;
  unsigned long confirmStartMs_ = 0;
};

// Digit shown on the overlay: floor(remaining) + 1, so a 3 s window reads
// 3, 2, 1. Clamped to [1, ceil(total)].
int countdownDigit(double remainingSeconds, double totalSeconds);
// Filled part of the progress bar, shrinking from barWidth to 0.
int countdownBarWidth(int barWidth, double remainingSeconds, double totalSeconds);
