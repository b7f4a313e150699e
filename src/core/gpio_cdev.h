#pragma once

#include <map>
#include <string>

#include "gpio_backend.h"

// GPIO character device (/dev/gpiochipN), v2 line API. One line request per
// claimed pin so each pin can be released on its own.
class CdevGpioBackend : public GpioBackend {
 public:
  CdevGpioBackend();
  ~CdevGpioBackend() override;

  bool open(const std::string &chipPath, std::string *error = nullptr);

  const char *name() const override;

  bool claimInput(unsigned pin, bool pullUp, std::string *error = nullptr) override;
  bool claimOutput(unsigned pin, bool initialHigh, std::string *error = nullptr) override;

  bool read(unsigned pin) override;
  bool write(unsigned pin, bool high) override;

  void release(unsigned pin) override;
  void releaseAll() override;

 private:
  bool requestLine(unsigned pin, uint64_t flags, bool initialHigh, bool setInitial,
                   std::string *error);

  int chipFd_ = -1;
  std::string chipPath_;
  std::map<unsigned, int> lines_;
};
