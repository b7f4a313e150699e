#include "gpio_backend.h"

#include <algorithm>
#include <cctype>

#include "gpio_cdev.h"
#include "gpio_sysfs.h"
#include "log.h"

namespace {

void appendMessage(std::string &target, const std::string &message) {
  if (message.empty()) {
    return;
  }
  if (!target.empty()) {
    target += "; ";
  }
  target += message;
}

}  // namespace

std::unique_ptr<GpioBackend> openGpioBackend(GpioBackendKind kind,
                                             const std::string &chipPath,
                                             unsigned sysfsBase,
                                             std::string *error) {
  std::string failures;

  if (kind == GpioBackendKind::Auto || kind == GpioBackendKind::Cdev) {
    std::unique_ptr<CdevGpioBackend> cdev(new CdevGpioBackend());
    std::string cdevErr;
    if (cdev->open(chipPath, &cdevErr)) {
      logPrintf("[gpio] backend=cdev chip=%s\n", chipPath.c_str());
      return std::move(cdev);
    }
    appendMessage(failures, "cdev: " + cdevErr);
  }

  if (kind == GpioBackendKind::Auto || kind == GpioBackendKind::Sysfs) {
    std::unique_ptr<SysfsGpioBackend> sysfs(new SysfsGpioBackend(sysfsBase));
    std::string sysfsErr;
    if (sysfs->open(&sysfsErr)) {
      logPrintf("[gpio] backend=sysfs base=%u\n", sysfsBase);
      return std::move(sysfs);
    }
    appendMessage(failures, "sysfs: " + sysfsErr);
  }

  if (error) {
    *error = failures.empty() ? std::string("no GPIO backend selected") : failures;
  }
  return nullptr;
}

const char *gpioBackendKindName(GpioBackendKind kind) {
  switch (kind) {
    case GpioBackendKind::Cdev:
      return "cdev";
    case GpioBackendKind::Sysfs:
      return "sysfs";
    case GpioBackendKind::Auto:
    default:
      return "auto";
  }
}

bool parseGpioBackendKind(const std::string &raw, GpioBackendKind &kind) {
  std::string normalized = raw;
  normalized.erase(std::remove_if(normalized.begin(), normalized.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; }),
                   normalized.end());
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (normalized == "auto" || normalized.empty()) {
    kind = GpioBackendKind::Auto;
    return true;
  }
  if (normalized == "cdev" || normalized == "chardev" || normalized == "lgpio") {
    kind = GpioBackendKind::Cdev;
    return true;
  }
  if (normalized == "sysfs") {
    kind = GpioBackendKind::Sysfs;
    return true;
  }
  return false;
}
