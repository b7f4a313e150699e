#pragma once

#include <stdint.h>

#include <string>

#include "gpio_backend.h"
#include "user_config.h"

struct PinMap {
  unsigned up = HAL_PIN_JOY_UP;
  unsigned down = HAL_PIN_JOY_DOWN;
  unsigned left = HAL_PIN_JOY_LEFT;
  unsigned right = HAL_PIN_JOY_RIGHT;
  unsigned select = HAL_PIN_JOY_PRESS;
  unsigned key1 = HAL_PIN_KEY1;
  unsigned key2 = HAL_PIN_KEY2;
  unsigned key3 = HAL_PIN_KEY3;
  unsigned reset = HAL_PIN_TFT_RST;
  unsigned dc = HAL_PIN_TFT_DC;
  unsigned backlight = HAL_PIN_TFT_BACKLIGHT;
};

struct RuntimeConfig {
  uint32_t version = 1;
  std::string musicDir;
  std::string inventoryFile;
  std::string fontDir;
  std::string spiDevice;
  uint32_t spiSpeedHz = HAL_SPI_FREQUENCY;
  uint32_t spiMaxTransfer = HAL_SPI_MAX_TRANSFER;
  std::string gpioChip;
  GpioBackendKind gpioBackend = GpioBackendKind::Auto;
  uint32_t gpioSysfsBase = HAL_GPIO_SYSFS_BASE;
  uint32_t debounceMs = USER_INPUT_DEBOUNCE_MS;
  uint32_t refreshHz = USER_REFRESH_RATE_HZ;
  uint32_t confirmSeconds = USER_SHUTDOWN_CONFIRM_SECONDS;
  bool invertColors = HAL_TFT_INVERSION_ON != 0;
  uint8_t madctl = HAL_DISPLAY_MADCTL;
  bool backlightActiveHigh = HAL_TFT_BACKLIGHT_ACTIVE_HIGH != 0;
  std::string playerCommand;
  std::string powerOffCommand;
  bool verboseLog = USER_VERBOSE_LOG != 0;
  PinMap pins;
};

enum class ConfigLoadSource : uint8_t {
  Defaults = 0,
  File = 1,
};

RuntimeConfig makeDefaultConfig();

bool validateConfig(const RuntimeConfig &config, std::string *error = nullptr);

// Parses a JSON document on top of the defaults. Missing keys keep defaults.
bool parseConfigJson(const std::string &json, RuntimeConfig &outConfig,
                     std::string *error = nullptr);
std::string configToJson(const RuntimeConfig &config);

bool loadConfigFile(const std::string &path, RuntimeConfig &outConfig,
                    std::string *error = nullptr);

// Lookup order: explicitPath, $PIPMINI_CONFIG, ./pipmini.json,
// /etc/pipmini/pipmini.json. With no file present the defaults are used and
// the call succeeds. A file that fails to parse or validate returns false.
bool loadConfig(const std::string &explicitPath,
                RuntimeConfig &outConfig,
                ConfigLoadSource *source = nullptr,
                std::string *loadedPath = nullptr,
                std::string *error = nullptr);

bool saveConfig(const std::string &path, const RuntimeConfig &config,
                std::string *error = nullptr);
