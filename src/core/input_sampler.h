#pragma once

#include <stddef.h>

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "button_event.h"
#include "gpio_backend.h"

struct InputBinding {
  unsigned pin = 0;
  ButtonEvent event = ButtonEvent::Up;
};

// Polls active-low buttons. poll() turns fresh presses into queued events,
// at most one per pin per debounce window; getEvent() pops them in order.
// Both run under one lock so sampling may move to another thread.
// pinsHeld() bypasses the queue and reads raw levels without the lock.
class InputSampler {
 public:
  InputSampler(GpioBackend &gpio, const std::vector<InputBinding> &bindings,
               unsigned long debounceMs);
  ~InputSampler();

  InputSampler(const InputSampler &) = delete;
  InputSampler &operator=(const InputSampler &) = delete;

  bool begin(std::string *error = nullptr);
  void end();

  void poll(unsigned long nowMs);
  bool getEvent(ButtonEvent &event);
  size_t drainEvents();
  size_t pendingEvents() const;

  // True only when every listed pin is pressed right now. Empty set: false.
  bool pinsHeld(const std::vector<unsigned> &pins) const;

  unsigned long debounceMs() const { return debounceMs_; }

 private:
  struct DebounceRecord {
    bool lastPressed = false;
    bool hasAccepted = false;
    unsigned long lastAcceptedMs = 0;
  };

  GpioBackend &gpio_;
  std::vector<InputBinding> bindings_;
  unsigned long debounceMs_;

  mutable std::mutex mutex_;
  std::vector<DebounceRecord> records_;
  std::deque<ButtonEvent> queue_;
  bool claimed_ = false;
};
