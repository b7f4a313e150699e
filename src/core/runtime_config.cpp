#include "runtime_config.h"

#include <ArduinoJson.h>

#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>

#include <fstream>
#include <set>
#include <sstream>

#include "log.h"

namespace {

constexpr uint32_t kConfigVersion = 1;
constexpr size_t kConfigDocCapacity = 4096;
constexpr uint32_t kMaxDebounceMs = 2000;
constexpr uint32_t kMinRefreshHz = 1;
constexpr uint32_t kMaxRefreshHz = 60;
constexpr uint32_t kMinConfirmSeconds = 1;
constexpr uint32_t kMaxConfirmSeconds = 30;
constexpr uint32_t kMinSpiTransfer = 64;
constexpr uint32_t kMaxSpiTransfer = 65536;
constexpr unsigned kMaxPin = 1023;

bool fileExists(const std::string &path) {
  struct stat st;
  return !path.empty() && ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string stringOr(JsonVariantConst value, const std::string &fallback) {
  const char *raw = value | static_cast<const char *>(nullptr);
  if (!raw) {
    return fallback;
  }
  return std::string(raw);
}

uint8_t sanitizeMadctl(int value, uint8_t fallback) {
  if (value < 0 || value > 0xFF) {
    return fallback;
  }
  return static_cast<uint8_t>(value);
}

void pinsFromJson(JsonObjectConst obj, PinMap &pins) {
  pins.up = obj["up"] | pins.up;
  pins.down = obj["down"] | pins.down;
  pins.left = obj["left"] | pins.left;
  pins.right = obj["right"] | pins.right;
  pins.select = obj["select"] | pins.select;
  pins.key1 = obj["key1"] | pins.key1;
  pins.key2 = obj["key2"] | pins.key2;
  pins.key3 = obj["key3"] | pins.key3;
  pins.reset = obj["reset"] | pins.reset;
  pins.dc = obj["dc"] | pins.dc;
  pins.backlight = obj["backlight"] | pins.backlight;
}

void pinsToJson(const PinMap &pins, JsonObject obj) {
  obj["up"] = pins.up;
  obj["down"] = pins.down;
  obj["left"] = pins.left;
  obj["right"] = pins.right;
  obj["select"] = pins.select;
  obj["key1"] = pins.key1;
  obj["key2"] = pins.key2;
  obj["key3"] = pins.key3;
  obj["reset"] = pins.reset;
  obj["dc"] = pins.dc;
  obj["backlight"] = pins.backlight;
}

bool fromJson(JsonObjectConst obj, RuntimeConfig &config, std::string *error) {
  config.version = obj["version"] | kConfigVersion;
  config.musicDir = stringOr(obj["musicDir"], config.musicDir);
  config.inventoryFile = stringOr(obj["inventoryFile"], config.inventoryFile);
  config.fontDir = stringOr(obj["fontDir"], config.fontDir);
  config.spiDevice = stringOr(obj["spiDevice"], config.spiDevice);
  config.spiSpeedHz = obj["spiSpeedHz"] | config.spiSpeedHz;
  config.spiMaxTransfer = obj["spiMaxTransfer"] | config.spiMaxTransfer;
  config.gpioChip = stringOr(obj["gpioChip"], config.gpioChip);
  config.gpioSysfsBase = obj["gpioSysfsBase"] | config.gpioSysfsBase;
  config.debounceMs = obj["debounceMs"] | config.debounceMs;
  config.refreshHz = obj["refreshHz"] | config.refreshHz;
  config.confirmSeconds = obj["confirmSeconds"] | config.confirmSeconds;
  config.invertColors = obj["invertColors"] | config.invertColors;
  config.madctl = sanitizeMadctl(obj["madctl"] | static_cast<int>(config.madctl), config.madctl);
  config.backlightActiveHigh = obj["backlightActiveHigh"] | config.backlightActiveHigh;
  config.playerCommand = stringOr(obj["playerCommand"], config.playerCommand);
  config.powerOffCommand = stringOr(obj["powerOffCommand"], config.powerOffCommand);
  config.verboseLog = obj["verboseLog"] | config.verboseLog;

  if (obj.containsKey("gpioBackend")) {
    const std::string raw = stringOr(obj["gpioBackend"], "");
    if (!parseGpioBackendKind(raw, config.gpioBackend)) {
      if (error) {
        *error = "unknown gpioBackend \"" + raw + "\"";
      }
      return false;
    }
  }

  JsonObjectConst pins = obj["pins"];
  if (!pins.isNull()) {
    pinsFromJson(pins, config.pins);
  }
  return true;
}

void toJson(const RuntimeConfig &config, JsonObject obj) {
  obj["version"] = config.version;
  obj["musicDir"] = config.musicDir;
  obj["inventoryFile"] = config.inventoryFile;
  obj["fontDir"] = config.fontDir;
  obj["spiDevice"] = config.spiDevice;
  obj["spiSpeedHz"] = config.spiSpeedHz;
  obj["spiMaxTransfer"] = config.spiMaxTransfer;
  obj["gpioChip"] = config.gpioChip;
  obj["gpioBackend"] = gpioBackendKindName(config.gpioBackend);
  obj["gpioSysfsBase"] = config.gpioSysfsBase;
  obj["debounceMs"] = config.debounceMs;
  obj["refreshHz"] = config.refreshHz;
  obj["confirmSeconds"] = config.confirmSeconds;
  obj["invertColors"] = config.invertColors;
  obj["madctl"] = config.madctl;
  obj["backlightActiveHigh"] = config.backlightActiveHigh;
  obj["playerCommand"] = config.playerCommand;
  obj["powerOffCommand"] = config.powerOffCommand;
  obj["verboseLog"] = config.verboseLog;
  pinsToJson(config.pins, obj.createNestedObject("pins"));
}

bool pinsUnique(const PinMap &pins, std::string *error) {
  const unsigned all[] = {pins.up, pins.down, pins.left, pins.right, pins.select,
                          pins.key1, pins.key2, pins.key3,
                          pins.reset, pins.dc, pins.backlight};
  std::set<unsigned> seen;
  for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
    if (all[i] > kMaxPin) {
      if (error) {
        *error = "pin " + std::to_string(all[i]) + " out of range";
      }
      return false;
    }
    if (!seen.insert(all[i]).second) {
      if (error) {
        *error = "pin " + std::to_string(all[i]) + " assigned twice";
      }
      return false;
    }
  }
  return true;
}

}  // namespace

RuntimeConfig makeDefaultConfig() {
  RuntimeConfig config;
  config.version = kConfigVersion;
  config.musicDir = USER_MUSIC_DIR;
  config.inventoryFile = USER_INVENTORY_FILE;
  config.fontDir = USER_FONT_DIR;
  config.spiDevice = HAL_SPI_DEVICE;
  config.gpioChip = HAL_GPIO_CHIP;
  parseGpioBackendKind(USER_GPIO_BACKEND, config.gpioBackend);
  config.playerCommand = USER_PLAYER_COMMAND;
  config.powerOffCommand = USER_POWER_OFF_COMMAND;
  return config;
}

bool validateConfig(const RuntimeConfig &config, std::string *error) {
  if (config.musicDir.empty() || config.inventoryFile.empty()) {
    if (error) {
      *error = "musicDir and inventoryFile must be set";
    }
    return false;
  }
  if (config.spiDevice.empty() || config.gpioChip.empty()) {
    if (error) {
      *error = "spiDevice and gpioChip must be set";
    }
    return false;
  }
  if (config.debounceMs > kMaxDebounceMs) {
    if (error) {
      *error = "debounceMs must be 0~2000";
    }
    return false;
  }
  if (config.refreshHz < kMinRefreshHz || config.refreshHz > kMaxRefreshHz) {
    if (error) {
      *error = "refreshHz must be 1~60";
    }
    return false;
  }
  if (config.confirmSeconds < kMinConfirmSeconds || config.confirmSeconds > kMaxConfirmSeconds) {
    if (error) {
      *error = "confirmSeconds must be 1~30";
    }
    return false;
  }
  if (config.spiMaxTransfer < kMinSpiTransfer || config.spiMaxTransfer > kMaxSpiTransfer) {
    if (error) {
      *error = "spiMaxTransfer must be 64~65536";
    }
    return false;
  }
  if (config.spiSpeedHz == 0) {
    if (error) {
      *error = "spiSpeedHz must be positive";
    }
    return false;
  }
  return pinsUnique(config.pins, error);
}

bool parseConfigJson(const std::string &json, RuntimeConfig &outConfig, std::string *error) {
  DynamicJsonDocument doc(kConfigDocCapacity);
  const DeserializationError parseErr = deserializeJson(doc, json);
  if (parseErr || !doc.is<JsonObject>()) {
    if (error) {
      *error = std::string("Config parse failed: ") +
               (parseErr ? parseErr.c_str() : "not an object");
    }
    return false;
  }

  RuntimeConfig parsed = outConfig;
  std::string fieldErr;
  if (!fromJson(doc.as<JsonObjectConst>(), parsed, &fieldErr)) {
    if (error) {
      *error = "Config parse failed: " + fieldErr;
    }
    return false;
  }

  std::string validateErr;
  if (!validateConfig(parsed, &validateErr)) {
    if (error) {
      *error = "Config validation failed: " + validateErr;
    }
    return false;
  }

  outConfig = parsed;
  return true;
}

std::string configToJson(const RuntimeConfig &config) {
  DynamicJsonDocument doc(kConfigDocCapacity);
  toJson(config, doc.to<JsonObject>());
  std::string out;
  serializeJsonPretty(doc, out);
  out += "\n";
  return out;
}

bool loadConfigFile(const std::string &path, RuntimeConfig &outConfig, std::string *error) {
  std::ifstream in(path.c_str());
  if (!in) {
    if (error) {
      *error = path + ": open failed";
    }
    return false;
  }

  std::ostringstream content;
  content << in.rdbuf();

  RuntimeConfig parsed = makeDefaultConfig();
  std::string parseErr;
  if (!parseConfigJson(content.str(), parsed, &parseErr)) {
    if (error) {
      *error = path + ": " + parseErr;
    }
    return false;
  }

  outConfig = parsed;
  return true;
}

bool loadConfig(const std::string &explicitPath,
                RuntimeConfig &outConfig,
                ConfigLoadSource *source,
                std::string *loadedPath,
                std::string *error) {
  if (source) {
    *source = ConfigLoadSource::Defaults;
  }
  outConfig = makeDefaultConfig();

  std::string path;
  if (!explicitPath.empty()) {
    if (!fileExists(explicitPath)) {
      if (error) {
        *error = explicitPath + ": not found";
      }
      return false;
    }
    path = explicitPath;
  } else {
    const char *envPath = getenv(USER_CONFIG_ENV_VAR);
    if (envPath && fileExists(envPath)) {
      path = envPath;
    } else if (fileExists(USER_CONFIG_LOCAL_PATH)) {
      path = USER_CONFIG_LOCAL_PATH;
    } else if (fileExists(USER_CONFIG_SYSTEM_PATH)) {
      path = USER_CONFIG_SYSTEM_PATH;
    }
  }

  if (path.empty()) {
    return true;
  }

  if (!loadConfigFile(path, outConfig, error)) {
    outConfig = makeDefaultConfig();
    return false;
  }

  if (source) {
    *source = ConfigLoadSource::File;
  }
  if (loadedPath) {
    *loadedPath = path;
  }
  return true;
}

bool saveConfig(const std::string &path, const RuntimeConfig &config, std::string *error) {
  std::string validateErr;
  if (!validateConfig(config, &validateErr)) {
    if (error) {
      *error = "Config validation failed: " + validateErr;
    }
    return false;
  }

  const std::string blob = configToJson(config);
  const std::string tempPath = path + ".tmp";

  {
    std::ofstream out(tempPath.c_str(), std::ios::out | std::ios::trunc);
    if (!out) {
      if (error) {
        *error = tempPath + ": write open failed";
      }
      return false;
    }
    out << blob;
    out.flush();
    if (!out) {
      out.close();
      remove(tempPath.c_str());
      if (error) {
        *error = tempPath + ": write failed";
      }
      return false;
    }
  }

  if (rename(tempPath.c_str(), path.c_str()) != 0) {
    remove(tempPath.c_str());
    if (error) {
      *error = path + ": rename failed";
    }
    return false;
  }

  logPrintf("[cfg] saved %s\n", path.c_str());
  return true;
}
