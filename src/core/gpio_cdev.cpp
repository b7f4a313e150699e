#include "gpio_cdev.h"

#include <errno.h>
#include <fcntl.h>
#include <linux/gpio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdio>

#include "log.h"

namespace {

constexpr const char *kConsumer = "pipmini";

std::string errnoText(const char *what) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), "%s: %s", what, strerror(errno));
  return std::string(buf);
}

}  // namespace

CdevGpioBackend::CdevGpioBackend() = default;

CdevGpioBackend::~CdevGpioBackend() {
  releaseAll();
}

bool CdevGpioBackend::open(const std::string &chipPath, std::string *error) {
  if (chipFd_ >= 0) {
    return true;
  }

  const int fd = ::open(chipPath.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    if (error) {
      *error = errnoText(chipPath.c_str());
    }
    return false;
  }

  struct gpiochip_info info;
  memset(&info, 0, sizeof(info));
  if (ioctl(fd, GPIO_GET_CHIPINFO_IOCTL, &info) < 0) {
    if (error) {
      *error = errnoText("GPIO_GET_CHIPINFO_IOCTL");
    }
    ::close(fd);
    return false;
  }

  chipFd_ = fd;
  chipPath_ = chipPath;
  logPrintf("[gpio] chip %s label=%s lines=%u\n", info.name, info.label, info.lines);
  return true;
}

const char *CdevGpioBackend::name() const {
  return "cdev";
}

bool CdevGpioBackend::requestLine(unsigned pin,
                                  uint64_t flags,
                                  bool initialHigh,
                                  bool setInitial,
                                  std::string *error) {
  if (chipFd_ < 0) {
    if (error) {
      *error = "GPIO chip not open";
    }
    return false;
  }
  if (lines_.count(pin) != 0) {
    if (error) {
      *error = "GPIO busy: pin " + std::to_string(pin) + " already claimed";
    }
    return false;
  }

  struct gpio_v2_line_request req;
  memset(&req, 0, sizeof(req));
  req.offsets[0] = pin;
  req.num_lines = 1;
  std::snprintf(req.consumer, sizeof(req.consumer), "%s", kConsumer);
  req.config.flags = flags;
  if (setInitial) {
    req.config.num_attrs = 1;
    req.config.attrs[0].attr.id = GPIO_V2_LINE_ATTR_ID_OUTPUT_VALUES;
    req.config.attrs[0].attr.values = initialHigh ? 1ULL : 0ULL;
    req.config.attrs[0].mask = 1ULL;
  }

  if (ioctl(chipFd_, GPIO_V2_GET_LINE_IOCTL, &req) < 0) {
    if (error) {
      if (errno == EBUSY) {
        *error = "GPIO busy: pin " + std::to_string(pin) + " is owned by another consumer";
      } else {
        *error = errnoText(("claim pin " + std::to_string(pin)).c_str());
      }
    }
    return false;
  }

  lines_[pin] = req.fd;
  return true;
}

bool CdevGpioBackend::claimInput(unsigned pin, bool pullUp, std::string *error) {
  uint64_t flags = GPIO_V2_LINE_FLAG_INPUT;
  if (pullUp) {
    flags |= GPIO_V2_LINE_FLAG_BIAS_PULL_UP;
  }
  return requestLine(pin, flags, false, false, error);
}

bool CdevGpioBackend::claimOutput(unsigned pin, bool initialHigh, std::string *error) {
  return requestLine(pin, GPIO_V2_LINE_FLAG_OUTPUT, initialHigh, true, error);
}

bool CdevGpioBackend::read(unsigned pin) {
  const std::map<unsigned, int>::const_iterator it = lines_.find(pin);
  if (it == lines_.end()) {
    return true;
  }

  struct gpio_v2_line_values values;
  memset(&values, 0, sizeof(values));
  values.mask = 1ULL;
  if (ioctl(it->second, GPIO_V2_LINE_GET_VALUES_IOCTL, &values) < 0) {
    return true;
  }
  return (values.bits & 1ULL) != 0;
}

bool CdevGpioBackend::write(unsigned pin, bool high) {
  const std::map<unsigned, int>::const_iterator it = lines_.find(pin);
  if (it == lines_.end()) {
    return false;
  }

  struct gpio_v2_line_values values;
  memset(&values, 0, sizeof(values));
  values.mask = 1ULL;
  values.bits = high ? 1ULL : 0ULL;
  return ioctl(it->second, GPIO_V2_LINE_SET_VALUES_IOCTL, &values) == 0;
}

void CdevGpioBackend::release(unsigned pin) {
  const std::map<unsigned, int>::iterator it = lines_.find(pin);
  if (it == lines_.end()) {
    return;
  }
  ::close(it->second);
  lines_.erase(it);
}

void CdevGpioBackend::releaseAll() {
  for (std::map<unsigned, int>::const_iterator it = lines_.begin(); it != lines_.end(); ++it) {
    ::close(it->second);
  }
  lines_.clear();

  if (chipFd_ >= 0) {
    ::close(chipFd_);
    chipFd_ = -1;
  }
}
