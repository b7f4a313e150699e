#include "input_sampler.h"

#include "log.h"

InputSampler::InputSampler(GpioBackend &gpio,
                           const std::vector<InputBinding> &bindings,
                           unsigned long debounceMs)
    : gpio_(gpio),
      bindings_(bindings),
      debounceMs_(debounceMs),
      records_(bindings.size()) {}

InputSampler::~InputSampler() {
  end();
}

bool InputSampler::begin(std::string *error) {
  if (claimed_) {
    return true;
  }

  for (size_t i = 0; i < bindings_.size(); ++i) {
    std::string claimErr;
    if (!gpio_.claimInput(bindings_[i].pin, true, &claimErr)) {
      for (size_t j = 0; j < i; ++j) {
        gpio_.release(bindings_[j].pin);
      }
      if (error) {
        *error = std::string(buttonEventName(bindings_[i].event)) + " pin " +
                 std::to_string(bindings_[i].pin) + ": " + claimErr;
      }
      return false;
    }
  }

  claimed_ = true;
  logPrintf("[input] %zu buttons claimed, debounce=%lums\n", bindings_.size(), debounceMs_);
  return true;
}

void InputSampler::end() {
  if (!claimed_) {
    return;
  }
  for (size_t i = 0; i < bindings_.size(); ++i) {
    gpio_.release(bindings_[i].pin);
  }
  claimed_ = false;
}

void InputSampler::poll(unsigned long nowMs) {
  std::vector<bool> pressed(bindings_.size(), false);
  for (size_t i = 0; i < bindings_.size(); ++i) {
    pressed[i] = !gpio_.read(bindings_[i].pin);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < bindings_.size(); ++i) {
    DebounceRecord &rec = records_[i];
    if (pressed[i] && !rec.lastPressed) {
      const bool windowElapsed =
          !rec.hasAccepted || nowMs - rec.lastAcceptedMs >= debounceMs_;
      if (windowElapsed) {
        queue_.push_back(bindings_[i].event);
        rec.lastAcceptedMs = nowMs;
        rec.hasAccepted = true;
        if (verboseLogging()) {
          logPrintf("[input] event=%s t=%lu\n", buttonEventName(bindings_[i].event), nowMs);
        }
      }
    }
    rec.lastPressed = pressed[i];
  }
}

bool InputSampler::getEvent(ButtonEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return false;
  }
  event = queue_.front();
  queue_.pop_front();
  return true;
}

size_t InputSampler::drainEvents() {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t dropped = queue_.size();
  queue_.clear();
  return dropped;
}

size_t InputSampler::pendingEvents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool InputSampler::pinsHeld(const std::vector<unsigned> &pins) const {
  if (pins.empty()) {
    return false;
  }
  for (size_t i = 0; i < pins.size(); ++i) {
    if (gpio_.read(pins[i])) {
      return false;
    }
  }
  return true;
}
