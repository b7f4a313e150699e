#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "apps/app_state_machine.h"
#include "apps/device_session.h"
#include "apps/inventory_screen.h"
#include "apps/radio_player.h"
#include "apps/radio_screen.h"
#include "apps/stat_screen.h"
#include "core/board_pins.h"
#include "core/clock.h"
#include "core/display_transport.h"
#include "core/gpio_backend.h"
#include "core/input_sampler.h"
#include "core/log.h"
#include "core/playback_service.h"
#include "core/runtime_config.h"
#include "core/spi_channel.h"
#include "core/system_metrics.h"
#include "ui/confirm_overlay.h"
#include "ui/lvgl_port.h"
#include "ui/ui_canvas.h"
#include "ui/ui_theme.h"
#include "user_config.h"

namespace {

volatile sig_atomic_t gStopRequested = 0;

constexpr unsigned long kMsPerSecond = 1000UL;

void onStopSignal(int signum) {
  (void)signum;
  gStopRequested = 1;
}

void installSignalHandlers() {
  struct sigaction action;
  action.sa_handler = onStopSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

void printUsage(const char *argv0) {
  printf("usage: %s [--config PATH] [--write-default-config PATH] [--help]\n", argv0);
  printf("  --config PATH                load this JSON config instead of the search path\n");
  printf("  --write-default-config PATH  write the built-in defaults as JSON and exit\n");
}

std::vector<InputBinding> inputBindings(const PinMap &pins) {
  std::vector<InputBinding> bindings;
  bindings.push_back({pins.up, ButtonEvent::Up});
  bindings.push_back({pins.down, ButtonEvent::Down});
  bindings.push_back({pins.left, ButtonEvent::Left});
  bindings.push_back({pins.right, ButtonEvent::Right});
  bindings.push_back({pins.select, ButtonEvent::Select});
  bindings.push_back({pins.key1, ButtonEvent::Key1});
  bindings.push_back({pins.key2, ButtonEvent::Key2});
  bindings.push_back({pins.key3, ButtonEvent::Key3});
  return bindings;
}

DisplayPanelConfig panelConfig(const RuntimeConfig &config) {
  DisplayPanelConfig panel;
  panel.width = boardpins::kDisplayWidth;
  panel.height = boardpins::kDisplayHeight;
  panel.colStart = boardpins::kDisplayColStart;
  panel.rowStart = boardpins::kDisplayRowStart;
  panel.madctl = config.madctl;
  panel.invertColors = config.invertColors;
  panel.resetPin = config.pins.reset;
  panel.dcPin = config.pins.dc;
  panel.backlightPin = config.pins.backlight;
  panel.backlightActiveHigh = config.backlightActiveHigh;
  return panel;
}

// LVGL and the objects screens draw through. Declared ahead of the
// DeviceSession so the screens it owns are gone before these are.
struct UiResources {
  std::unique_ptr<LvglPort> lvgl;
  std::unique_ptr<UiFontSet> fonts;
  std::unique_ptr<UiCanvas> canvas;
  std::unique_ptr<ConfirmOverlay> overlay;
  std::unique_ptr<SystemMetrics> metrics;
};

bool openSession(const RuntimeConfig &config, UiResources &ui, DeviceSession &session) {
  std::string err;

  session.gpio = openGpioBackend(config.gpioBackend, config.gpioChip, config.gpioSysfsBase, &err);
  if (!session.gpio) {
    logErrorf("[gpio] no usable GPIO backend: %s\n", err.c_str());
    return false;
  }

  std::unique_ptr<SpidevChannel> spi(new SpidevChannel());
  if (!spi->open(config.spiDevice, config.spiSpeedHz, config.spiMaxTransfer, &err)) {
    logErrorf("[disp] %s\n", err.c_str());
    return false;
  }

  session.display.reset(new DisplayTransport(*session.gpio, std::move(spi), panelConfig(config)));
  if (!session.display->initialize(&err)) {
    logErrorf("[disp] init failed: %s\n", err.c_str());
    return false;
  }

  session.input.reset(new InputSampler(*session.gpio, inputBindings(config.pins), config.debounceMs));
  if (!session.input->begin(&err)) {
    logErrorf("[input] %s\n", err.c_str());
    return false;
  }

  ui.lvgl.reset(new LvglPort());
  if (!ui.lvgl->begin(boardpins::kDisplayWidth, boardpins::kDisplayHeight, &err)) {
    logErrorf("[ui] %s\n", err.c_str());
    return false;
  }
  ui.fonts.reset(new UiFontSet());
  ui.fonts->load(config.fontDir, USER_FONT_FILE);
  ui.canvas.reset(new UiCanvas(*ui.lvgl, *ui.fonts));
  ui.overlay.reset(new ConfirmOverlay(*ui.canvas));
  ui.metrics.reset(new SystemMetrics());

  session.playback = makePlaybackService(config.playerCommand);
  session.radio.reset(new RadioPlayer(*session.playback, config.musicDir));
  session.radio->rescan();

  std::vector<unsigned> combo;
  combo.push_back(config.pins.key1);
  combo.push_back(config.pins.key2);
  session.apps.reset(new AppStateMachine(*session.input, combo,
                                         config.confirmSeconds * kMsPerSecond,
                                         ui.overlay.get()));
  session.apps->addScreen(std::unique_ptr<Screen>(new StatScreen(*ui.canvas, *ui.metrics)));
  session.apps->addScreen(
      std::unique_ptr<Screen>(new InventoryScreen(*ui.canvas, config.inventoryFile)));
  session.apps->addScreen(std::unique_ptr<Screen>(new RadioScreen(*ui.canvas, *session.radio)));
  return true;
}

// Returns true when the loop ended because power-off was confirmed.
bool runLoop(const RuntimeConfig &config, DeviceSession &session) {
  const unsigned long periodMs = kMsPerSecond / config.refreshHz;
  logPrintf("[boot] running at %u Hz\n", static_cast<unsigned>(config.refreshHz));

  while (!gStopRequested) {
    const unsigned long startMs = monotonicMs();
    if (session.step(startMs) == TickOutcome::PowerOff) {
      return true;
    }
    const unsigned long sleepMs = loopSleepMs(periodMs, monotonicMs() - startMs);
    if (sleepMs > 0) {
      delayMs(sleepMs);
    }
  }

  logPrintf("[boot] stop requested\n");
  return false;
}

int runPowerOff(const std::string &command) {
  logPrintf("[power] running \"%s\"\n", command.c_str());
  fflush(stdout);
  const int rc = system(command.c_str());
  if (rc != 0) {
    logErrorf("[power] power-off command failed (status %d)\n", rc);
    return 1;
  }
  return 0;
}

int run(int argc, char **argv) {
  static const struct option kOptions[] = {
      {"config", required_argument, nullptr, 'c'},
      {"write-default-config", required_argument, nullptr, 'w'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  std::string configPath;
  std::string defaultConfigOut;
  int opt = 0;
  while ((opt = getopt_long(argc, argv, "c:w:h", kOptions, nullptr)) != -1) {
    switch (opt) {
      case 'c':
        configPath = optarg;
        break;
      case 'w':
        defaultConfigOut = optarg;
        break;
      case 'h':
        printUsage(argv[0]);
        return 0;
      default:
        printUsage(argv[0]);
        return 2;
    }
  }

  if (!defaultConfigOut.empty()) {
    std::string err;
    if (!saveConfig(defaultConfigOut, makeDefaultConfig(), &err)) {
      logErrorf("[cfg] %s\n", err.c_str());
      return 1;
    }
    return 0;
  }

  logPrintf("[boot] start board=\"%s\" host=\"%s\"\n", HAL_BOARD_NAME, HAL_HOST);

  RuntimeConfig config;
  ConfigLoadSource source = ConfigLoadSource::Defaults;
  std::string loadedPath;
  std::string loadErr;
  if (!loadConfig(configPath, config, &source, &loadedPath, &loadErr)) {
    logErrorf("[cfg] %s, using default seeds\n", loadErr.c_str());
    config = makeDefaultConfig();
  }
  if (source == ConfigLoadSource::File) {
    logPrintf("[cfg] loaded %s\n", loadedPath.c_str());
  } else {
    logPrintf("[cfg] using default seeds\n");
  }
  setVerboseLogging(config.verboseLog);

  installSignalHandlers();

  bool powerOff = false;
  {
    UiResources ui;
    DeviceSession session;
    if (!openSession(config, ui, session)) {
      return 1;
    }
    powerOff = runLoop(config, session);
  }

  if (powerOff) {
    return runPowerOff(config.powerOffCommand);
  }
  logPrintf("[boot] bye\n");
  return 0;
}

}  // namespace

int main(int argc, char **argv) {
  try {
    return run(argc, argv);
  } catch (const std::exception &e) {
    logErrorf("[boot] fatal: %s\n", e.what());
    return 1;
  } catch (...) {
    logErrorf("[boot] fatal: unknown\n");
    return 1;
  }
}
