#pragma once

#include <memory>

#include "../core/display_transport.h"
#include "../core/gpio_backend.h"
#include "../core/input_sampler.h"
#include "../core/playback_service.h"
#include "app_state_machine.h"
#include "radio_player.h"

// Everything that holds hardware or a child process. Members are declared in
// dependency order; teardown() runs the cleanup sequence exactly once, on
// every exit path, before the members are destroyed in reverse order.
struct DeviceSession {
  DeviceSession() = default;
  ~DeviceSession();

  DeviceSession(const DeviceSession &) = delete;
  DeviceSession &operator=(const DeviceSession &) = delete;

  // Stop audio, blank the panel, backlight off, release every line, close SPI.
  void teardown();

  // One loop iteration: sample input, advance the state machine, render and
  // push the frame. Blit errors are logged and the loop carries on.
  TickOutcome step(unsigned long nowMs);

  std::unique_ptr<GpioBackend> gpio;
  std::unique_ptr<DisplayTransport> display;
  std::unique_ptr<InputSampler> input;
  std::unique_ptr<PlaybackService> playback;
  std::unique_ptr<RadioPlayer> radio;
  std::unique_ptr<AppStateMachine> apps;
  bool tornDown = false;
};

// Time left in the tick period; zero once the tick has overrun.
unsigned long loopSleepMs(unsigned long periodMs, unsigned long elapsedMs);
