#pragma once

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "apps/screen.h"
#include "core/gpio_backend.h"
#include "core/playback_service.h"
#include "core/spi_channel.h"

// Scriptable GPIO. Every unclaimed or idle line reads high (not pressed).
class FakeGpioBackend : public GpioBackend {
 public:
  const char *name() const override { return "fake"; }

  bool claimInput(unsigned pin, bool pullUp, std::string *error = nullptr) override {
    if (!claim(pin, error)) {
      return false;
    }
    inputs.insert(pin);
    pullUps[pin] = pullUp;
    if (levels.find(pin) == levels.end()) {
      levels[pin] = true;
    }
    return true;
  }

  bool claimOutput(unsigned pin, bool initialHigh, std::string *error = nullptr) override {
    if (!claim(pin, error)) {
      return false;
    }
    outputs.insert(pin);
    levels[pin] = initialHigh;
    return true;
  }

  bool read(unsigned pin) override {
    std::map<unsigned, bool>::const_iterator it = levels.find(pin);
    return it == levels.end() ? true : it->second;
  }

  bool write(unsigned pin, bool high) override {
    if (outputs.find(pin) == outputs.end() || failWrites.count(pin) != 0) {
      return false;
    }
    levels[pin] = high;
    writes.push_back(std::make_pair(pin, high));
    return true;
  }

  void release(unsigned pin) override {
    if (claimed.erase(pin) != 0) {
      released.push_back(pin);
    }
    inputs.erase(pin);
    outputs.erase(pin);
  }

  void releaseAll() override {
    ++releaseAllCalls;
    std::set<unsigned> pins = claimed;
    for (std::set<unsigned>::const_iterator it = pins.begin(); it != pins.end(); ++it) {
      release(*it);
    }
  }

  void press(unsigned pin) { levels[pin] = false; }
  void lift(unsigned pin) { levels[pin] = true; }

  std::vector<bool> writesTo(unsigned pin) const {
    std::vector<bool> out;
    for (size_t i = 0; i < writes.size(); ++i) {
      if (writes[i].first == pin) {
        out.push_back(writes[i].second);
      }
    }
    return out;
  }

  std::map<unsigned, bool> levels;
  std::map<unsigned, bool> pullUps;
  std::set<unsigned> claimed;
  std::set<unsigned> inputs;
  std::set<unsigned> outputs;
  std::set<unsigned> busy;
  std::set<unsigned> failWrites;
  std::vector<std::pair<unsigned, bool>> writes;
  std::vector<unsigned> released;
  int releaseAllCalls = 0;

 private:
  bool claim(unsigned pin, std::string *error) {
    if (busy.count(pin) != 0 || claimed.count(pin) != 0) {
      if (error) {
        *error = "GPIO busy";
      }
      return false;
    }
    claimed.insert(pin);
    return true;
  }
};

// Owned handle onto a FakeGpioBackend that outlives it, for code that takes
// ownership of its backend.
class GpioHandle : public GpioBackend {
 public:
  explicit GpioHandle(FakeGpioBackend &target) : target_(target) {}

  const char *name() const override { return target_.name(); }
  bool claimInput(unsigned pin, bool pullUp, std::string *error = nullptr) override {
    return target_.claimInput(pin, pullUp, error);
  }
  bool claimOutput(unsigned pin, bool initialHigh, std::string *error = nullptr) override {
    return target_.claimOutput(pin, initialHigh, error);
  }
  bool read(unsigned pin) override { return target_.read(pin); }
  bool write(unsigned pin, bool high) override { return target_.write(pin, high); }
  void release(unsigned pin) override { target_.release(pin); }
  void releaseAll() override { target_.releaseAll(); }

 private:
  FakeGpioBackend &target_;
};

struct SpiWrite {
  std::vector<uint8_t> bytes;
  bool dcHigh = false;
};

struct SpiLog {
  std::vector<SpiWrite> writes;
  bool closed = false;

  std::vector<uint8_t> commands() const {
    std::vector<uint8_t> out;
    for (size_t i = 0; i < writes.size(); ++i) {
      if (!writes[i].dcHigh && writes[i].bytes.size() == 1) {
        out.push_back(writes[i].bytes[0]);
      }
    }
    return out;
  }
};

// Records every transfer together with the D/C level at the time it went out.
class RecordingSpiChannel : public SpiChannel {
 public:
  RecordingSpiChannel(FakeGpioBackend &gpio, unsigned dcPin, size_t maxTransfer,
                      std::shared_ptr<SpiLog> log)
      : gpio_(gpio), dcPin_(dcPin), maxTransfer_(maxTransfer), log_(std::move(log)) {}

  bool write(const uint8_t *data, size_t length, std::string *error = nullptr) override {
    if (log_->closed) {
      if (error) {
        *error = "closed";
      }
      return false;
    }
    if (length > maxTransfer_) {
      if (error) {
        *error = "transfer too large";
      }
      return false;
    }
    SpiWrite w;
    w.bytes.assign(data, data + length);
    w.dcHigh = gpio_.read(dcPin_);
    log_->writes.push_back(w);
    return true;
  }

  size_t maxTransfer() const override { return maxTransfer_; }
  void close() override { log_->closed = true; }

 private:
  FakeGpioBackend &gpio_;
  unsigned dcPin_;
  size_t maxTransfer_;
  std::shared_ptr<SpiLog> log_;
};

class FakePlayback : public PlaybackService {
 public:
  const char *name() const override { return "fake"; }

  bool load(const std::string &path, std::string *error = nullptr) override {
    loads.push_back(path);
    if (failLoads) {
      if (error) {
        *error = "cannot open";
      }
      return false;
    }
    loaded = path;
    return true;
  }

  bool play(std::string *error = nullptr) override {
    (void)error;
    ++plays;
    busy = true;
    paused = false;
    failed = false;
    return true;
  }

  void pause() override {
    ++pauses;
    paused = true;
    busy = false;
  }

  void unpause() override {
    ++unpauses;
    paused = false;
    busy = true;
  }

  void stop() override {
    ++stops;
    busy = false;
    paused = false;
  }

  bool isBusy() override { return busy; }
  bool lastPlayFailed() const override { return failed; }

  // Simulates the track reaching its end.
  void finishTrack() { busy = false; }
  // Simulates the player giving up on the track.
  void failTrack() {
    busy = false;
    failed = true;
  }

  bool failLoads = false;
  bool failed = false;
  bool busy = false;
  bool paused = false;
  int plays = 0;
  int pauses = 0;
  int unpauses = 0;
  int stops = 0;
  std::string loaded;
  std::vector<std::string> loads;
};

// Owned handle onto a FakePlayback that outlives it.
class PlaybackHandle : public PlaybackService {
 public:
  explicit PlaybackHandle(FakePlayback &target) : target_(target) {}

  const char *name() const override { return target_.name(); }
  bool load(const std::string &path, std::string *error = nullptr) override {
    return target_.load(path, error);
  }
  bool play(std::string *error = nullptr) override { return target_.play(error); }
  void pause() override { target_.pause(); }
  void unpause() override { target_.unpause(); }
  void stop() override { target_.stop(); }
  bool isBusy() override { return target_.isBusy(); }
  bool lastPlayFailed() const override { return target_.lastPlayFailed(); }

 private:
  FakePlayback &target_;
};

// Shared record of what happened to a FakeScreen, kept outside the screen
// because the state machine owns the screen itself.
struct ScreenRecord {
  std::vector<ButtonEvent> events;
  int renders = 0;
  int backgroundTicks = 0;
  int shutdowns = 0;
  int index = -1;
  int count = 0;
};

class FakeScreen : public Screen {
 public:
  FakeScreen(const char *title, ScreenRecord *record) : title_(title), record_(record) {}

  const char *title() const override { return title_; }
  void handleEvent(ButtonEvent event) override { record_->events.push_back(event); }

  Frame render() override {
    ++record_->renders;
    Frame frame(4, 4);
    frame.fill(0, 255, 0);
    return frame;
  }

  void backgroundTick() override { ++record_->backgroundTicks; }
  void onAttach(int index, int count) override {
    record_->index = index;
    record_->count = count;
  }
  void onShutdown() override { ++record_->shutdowns; }

 private:
  const char *title_;
  ScreenRecord *record_;
};

class FakeOverlay : public ShutdownOverlay {
 public:
  Frame render(double remainingSeconds, double totalSeconds) override {
    ++renders;
    lastRemaining = remainingSeconds;
    lastTotal = totalSeconds;
    Frame frame(4, 4);
    frame.fill(255, 191, 0);
    return frame;
  }

  int renders = 0;
  double lastRemaining = -1.0;
  double lastTotal = -1.0;
};

// Scratch directory removed on destruction.
class TempDir {
 public:
  TempDir();
  ~TempDir();

  const std::string &path() const { return path_; }
  std::string file(const std::string &name) const { return path_ + "/" + name; }
  void write(const std::string &name, const std::string &content) const;

 private:
  std::string path_;
};
