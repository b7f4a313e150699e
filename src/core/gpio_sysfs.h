#pragma once

#include <map>
#include <string>

#include "gpio_backend.h"

// Legacy /sys/class/gpio interface. Bias cannot be configured here, so inputs
// depend on the boot-time pull-up overlay (gpio=...=pu in config.txt).
class SysfsGpioBackend : public GpioBackend {
 public:
  explicit SysfsGpioBackend(unsigned base = 0, const std::string &root = "/sys/class/gpio");
  ~SysfsGpioBackend() override;

  bool open(std::string *error = nullptr);

  const char *name() const override;

  bool claimInput(unsigned pin, bool pullUp, std::string *error = nullptr) override;
  bool claimOutput(unsigned pin, bool initialHigh, std::string *error = nullptr) override;

  bool read(unsigned pin) override;
  bool write(unsigned pin, bool high) override;

  void release(unsigned pin) override;
  void releaseAll() override;

 private:
  bool exportPin(unsigned pin, const char *direction, std::string *error);
  void unexportPin(unsigned pin);
  std::string pinDir(unsigned pin) const;

  unsigned base_;
  std::string root_;
  std::map<unsigned, int> valueFds_;
};
