#pragma once

#include <stdint.h>

#include <memory>
#include <string>

enum class GpioBackendKind : uint8_t {
  Auto = 0,
  Cdev = 1,
  Sysfs = 2,
};

// Line access shared by the display transport and the input sampler. Pins are
// BCM offsets on the configured chip. A pin may be claimed by one owner only.
class GpioBackend {
 public:
  virtual ~GpioBackend() = default;

  virtual const char *name() const = 0;

  virtual bool claimInput(unsigned pin, bool pullUp, std::string *error = nullptr) = 0;
  virtual bool claimOutput(unsigned pin, bool initialHigh, std::string *error = nullptr) = 0;

  // Raw electrical level. Unclaimed or unreadable lines read high, which is
  // the idle level of an active-low button.
  virtual bool read(unsigned pin) = 0;
  virtual bool write(unsigned pin, bool high) = 0;

  virtual void release(unsigned pin) = 0;
  virtual void releaseAll() = 0;
};

// Opens the preferred backend. Auto tries the character device first and
// falls back to sysfs. Returns nullptr when no backend is usable.
std::unique_ptr<GpioBackend> openGpioBackend(GpioBackendKind kind,
                                             const std::string &chipPath,
                                             unsigned sysfsBase,
                                             std::string *error = nullptr);

const char *gpioBackendKindName(GpioBackendKind kind);
bool parseGpioBackendKind(const std::string &raw, GpioBackendKind &kind);
