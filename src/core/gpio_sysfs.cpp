#include "gpio_sysfs.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>

#include "clock.h"
#include "log.h"

namespace {

// udev applies permissions to a freshly exported pin asynchronously.
constexpr int kExportWaitAttempts = 20;
constexpr unsigned long kExportWaitStepMs = 10UL;

bool writeText(const std::string &path, const std::string &text) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  const ssize_t written = ::write(fd, text.data(), text.size());
  ::close(fd);
  return written == static_cast<ssize_t>(text.size());
}

bool pathExists(const std::string &path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

}  // namespace

SysfsGpioBackend::SysfsGpioBackend(unsigned base, const std::string &root)
    : base_(base), root_(root) {}

SysfsGpioBackend::~SysfsGpioBackend() {
  releaseAll();
}

bool SysfsGpioBackend::open(std::string *error) {
  if (!pathExists(root_ + "/export")) {
    if (error) {
      *error = root_ + "/export not present";
    }
    return false;
  }
  return true;
}

const char *SysfsGpioBackend::name() const {
  return "sysfs";
}

std::string SysfsGpioBackend::pinDir(unsigned pin) const {
  return root_ + "/gpio" + std::to_string(base_ + pin);
}

bool SysfsGpioBackend::exportPin(unsigned pin, const char *direction, std::string *error) {
  if (valueFds_.count(pin) != 0) {
    if (error) {
      *error = "GPIO busy: pin " + std::to_string(pin) + " already claimed";
    }
    return false;
  }

  const std::string dir = pinDir(pin);
  if (!pathExists(dir)) {
    if (!writeText(root_ + "/export", std::to_string(base_ + pin))) {
      if (error) {
        *error = errno == EBUSY
                     ? "GPIO busy: pin " + std::to_string(pin) + " is owned by a driver"
                     : "export pin " + std::to_string(pin) + ": " + strerror(errno);
      }
      return false;
    }
  }

  bool directionSet = false;
  int directionErrno = 0;
  for (int attempt = 0; attempt < kExportWaitAttempts; ++attempt) {
    if (writeText(dir + "/direction", direction)) {
      directionSet = true;
      break;
    }
    directionErrno = errno;
    delayMs(kExportWaitStepMs);
  }
  if (!directionSet) {
    unexportPin(pin);
    if (error) {
      *error = "set direction on pin " + std::to_string(pin) + ": " + strerror(directionErrno);
    }
    return false;
  }

  const int fd = ::open((dir + "/value").c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    const int openErrno = errno;
    unexportPin(pin);
    if (error) {
      *error = "open value of pin " + std::to_string(pin) + ": " + strerror(openErrno);
    }
    return false;
  }

  valueFds_[pin] = fd;
  return true;
}

bool SysfsGpioBackend::claimInput(unsigned pin, bool pullUp, std::string *error) {
  (void)pullUp;
  return exportPin(pin, "in", error);
}

bool SysfsGpioBackend::claimOutput(unsigned pin, bool initialHigh, std::string *error) {
  // "high"/"low" set direction and the initial level atomically.
  return exportPin(pin, initialHigh ? "high" : "low", error);
}

bool SysfsGpioBackend::read(unsigned pin) {
  const std::map<unsigned, int>::const_iterator it = valueFds_.find(pin);
  if (it == valueFds_.end()) {
    return true;
  }

  char c = '1';
  if (::pread(it->second, &c, 1, 0) != 1) {
    return true;
  }
  return c != '0';
}

bool SysfsGpioBackend::write(unsigned pin, bool high) {
  const std::map<unsigned, int>::const_iterator it = valueFds_.find(pin);
  if (it == valueFds_.end()) {
    return false;
  }

  const char c = high ? '1' : '0';
  return ::pwrite(it->second, &c, 1, 0) == 1;
}

void SysfsGpioBackend::release(unsigned pin) {
  const std::map<unsigned, int>::iterator it = valueFds_.find(pin);
  if (it == valueFds_.end()) {
    return;
  }
  ::close(it->second);
  valueFds_.erase(it);
  unexportPin(pin);
}

void SysfsGpioBackend::unexportPin(unsigned pin) {
  if (!writeText(root_ + "/unexport", std::to_string(base_ + pin))) {
    logErrorf("[gpio] unexport pin %u failed: %s\n", pin, strerror(errno));
  }
}

void SysfsGpioBackend::releaseAll() {
  while (!valueFds_.empty()) {
    release(valueFds_.begin()->first);
  }
}
