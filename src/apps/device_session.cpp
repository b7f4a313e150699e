#include "device_session.h"

#include <string>

#include "../core/log.h"

DeviceSession::~DeviceSession() {
  teardown();
}

void DeviceSession::teardown() {
  if (tornDown) {
    return;
  }
  tornDown = true;
  logPrintf("[boot] cleanup\n");

  if (apps) {
    apps->shutdownScreens();
  } else if (radio) {
    radio->stop();
  }
  if (playback) {
    playback->stop();
  }
  if (display) {
    std::string err;
    if (display->ready() && !display->blank(&err)) {
      logErrorf("[disp] blank failed: %s\n", err.c_str());
    }
    display->cleanup();
  }
  if (input) {
    input->end();
  }
  if (gpio) {
    gpio->releaseAll();
  }
}

TickOutcome DeviceSession::step(unsigned long nowMs) {
  input->poll(nowMs);
  if (apps->tick(nowMs) == TickOutcome::PowerOff) {
    return TickOutcome::PowerOff;
  }

  const Frame frame = apps->render(nowMs);
  std::string err;
  if (!display->blit(frame, &err)) {
    logErrorf("[disp] blit failed: %s\n", err.c_str());
  }
  return TickOutcome::Continue;
}

unsigned long loopSleepMs(unsigned long periodMs, unsigned long elapsedMs) {
  return elapsedMs < periodMs ? periodMs - elapsedMs : 0;
}
