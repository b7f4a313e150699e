#include "app_state_machine.h"

#include <math.h>

#include <utility>

#include "../core/log.h"

AppStateMachine::AppStateMachine(InputSampler &input,
                                 const std::vector<unsigned> &comboPins,
                                 unsigned long confirmMs,
                                 ShutdownOverlay *overlay)
    : input_(input), comboPins_(comboPins), confirmMs_(confirmMs), overlay_(overlay) {}

void AppStateMachine::addScreen(std::unique_ptr<Screen> screen) {
  if (!screen) {
    return;
  }
  screens_.push_back(std::move(screen));
  const int count = static_cast<int>(screens_.size());
  for (int i = 0; i < count; ++i) {
    screens_[i]->onAttach(i, count);
  }
}

Screen *AppStateMachine::activeScreen() {
  if (screens_.empty()) {
    return nullptr;
  }
  return screens_[active_].get();
}

TickOutcome AppStateMachine::tick(unsigned long nowMs) {
  if (phase_ == ShutdownPhase::Idle) {
    if (input_.pinsHeld(comboPins_)) {
      phase_ = ShutdownPhase::Confirming;
      confirmStartMs_ = nowMs;
      const size_t dropped = input_.drainEvents();
      logPrintf("[power] shutdown combo held, confirming (%lu ms, dropped %u events)\n",
                confirmMs_, static_cast<unsigned>(dropped));
    } else {
      ButtonEvent event;
      if (input_.getEvent(event)) {
        dispatch(event);
      }
    }
  } else {
    ButtonEvent event;
    if (input_.getEvent(event)) {
      phase_ = ShutdownPhase::Idle;
      logPrintf("[power] shutdown cancelled by %s\n", buttonEventName(event));
    } else if (nowMs - confirmStartMs_ >= confirmMs_) {
      logPrintf("[power] shutdown confirmed\n");
      return TickOutcome::PowerOff;
    }
  }

  for (size_t i = 0; i < screens_.size(); ++i) {
    screens_[i]->backgroundTick();
  }
  return TickOutcome::Continue;
}

void AppStateMachine::dispatch(ButtonEvent event) {
  const size_t count = screens_.size();
  if (count == 0) {
    return;
  }

  if (event == ButtonEvent::Left) {
    active_ = (active_ + count - 1) % count;
    logPrintf("[ui] screen=%s\n", screens_[active_]->title());
  } else if (event == ButtonEvent::Right) {
    active_ = (active_ + 1) % count;
    logPrintf("[ui] screen=%s\n", screens_[active_]->title());
  } else {
    screens_[active_]->handleEvent(event);
  }
}

double AppStateMachine::remainingSeconds(unsigned long nowMs) const {
  if (phase_ != ShutdownPhase::Confirming) {
    return 0.0;
  }
  const unsigned long elapsed = nowMs - confirmStartMs_;
  if (elapsed >= confirmMs_) {
    return 0.0;
  }
  return static_cast<double>(confirmMs_ - elapsed) / 1000.0;
}

Frame AppStateMachine::render(unsigned long nowMs) {
  if (phase_ == ShutdownPhase::Confirming && overlay_) {
    return overlay_->render(remainingSeconds(nowMs), static_cast<double>(confirmMs_) / 1000.0);
  }
  Screen *screen = activeScreen();
  if (!screen) {
    return Frame();
  }
  return screen->render();
}

void AppStateMachine::shutdownScreens() {
  for (size_t i = 0; i < screens_.size(); ++i) {
    screens_[i]->onShutdown();
  }
}

int countdownDigit(double remainingSeconds, double totalSeconds) {
  const int maxDigit = static_cast<int>(ceil(totalSeconds));
  int digit = static_cast<int>(floor(remainingSeconds)) + 1;
  if (digit > maxDigit) {
    digit = maxDigit;
  }
  if (digit < 1) {
    digit = 1;
  }
  return digit;
}

int countdownBarWidth(int barWidth, double remainingSeconds, double totalSeconds) {
  if (barWidth <= 0 || totalSeconds <= 0.0 || remainingSeconds <= 0.0) {
    return 0;
  }
  if (remainingSeconds >= totalSeconds) {
    return barWidth;
  }
  return static_cast<int>(barWidth * remainingSeconds / totalSeconds);
}
