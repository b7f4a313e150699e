#include "system_metrics.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <stdio.h>
#include <sys/statvfs.h>

#include <fstream>
#include <sstream>

namespace {

constexpr uint64_t kBytesPerMb = 1024ULL * 1024ULL;

bool readFirstLine(const std::string &path, std::string &line) {
  std::ifstream in(path.c_str());
  if (!in) {
    return false;
  }
  return static_cast<bool>(std::getline(in, line));
}

bool readWhole(const std::string &path, std::string &content) {
  std::ifstream in(path.c_str());
  if (!in) {
    return false;
  }
  std::ostringstream out;
  out << in.rdbuf();
  content = out.str();
  return true;
}

}  // namespace

bool parseCpuSample(const std::string &statLine, CpuSample &out) {
  std::istringstream in(statLine);
  std::string label;
  if (!(in >> label) || label != "cpu") {
    return false;
  }

  CpuSample sample;
  uint64_t value = 0;
  int field = 0;
  while (in >> value) {
    ++field;
    sample.total += value;
    if (field == 4) {
      sample.idle = value;
    }
  }
  if (field < 4) {
    return false;
  }
  out = sample;
  return true;
}

bool parseMemInfo(const std::string &content, MemInfo &out) {
  std::istringstream in(content);
  std::string line;
  bool haveTotal = false;
  bool haveAvailable = false;
  MemInfo info;
  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string key;
    uint64_t kb = 0;
    if (!(fields >> key >> kb)) {
      continue;
    }
    if (key == "MemTotal:") {
      info.totalKb = kb;
      haveTotal = true;
    } else if (key == "MemAvailable:") {
      info.availableKb = kb;
      haveAvailable = true;
    }
  }
  if (!haveTotal || !haveAvailable) {
    return false;
  }
  out = info;
  return true;
}

std::string formatCpuPercent(const CpuSample &previous, const CpuSample &current) {
  const uint64_t deltaTotal = current.total - previous.total;
  const uint64_t deltaIdle = current.idle - previous.idle;
  if (deltaTotal == 0 || current.total < previous.total) {
    return "0%";
  }
  const double busy = 1.0 - static_cast<double>(deltaIdle) / static_cast<double>(deltaTotal);
  int percent = static_cast<int>(busy * 100.0);
  if (percent < 0) {
    percent = 0;
  }
  return std::to_string(percent) + "%";
}

std::string formatUptime(double seconds) {
  if (seconds < 0) {
    seconds = 0;
  }
  const unsigned long total = static_cast<unsigned long>(seconds);
  const unsigned long h = total / 3600;
  const unsigned long m = (total % 3600) / 60;
  const unsigned long s = total % 60;

  char buf[48];
  if (h > 0) {
    snprintf(buf, sizeof(buf), "%luh %lum %lus", h, m, s);
  } else if (m > 0) {
    snprintf(buf, sizeof(buf), "%lum %lus", m, s);
  } else {
    snprintf(buf, sizeof(buf), "%lus", s);
  }
  return buf;
}

std::string formatTemperature(long millidegrees) {
  return std::to_string(millidegrees / 1000) + "C";
}

std::string formatUsageMb(uint64_t usedMb, uint64_t totalMb) {
  return std::to_string(usedMb) + "MB/" + std::to_string(totalMb) + "MB";
}

SystemMetrics::SystemMetrics(const std::string &procRoot,
                             const std::string &thermalPath,
                             const std::string &diskPath)
    : procRoot_(procRoot), thermalPath_(thermalPath), diskPath_(diskPath) {}

std::string SystemMetrics::cpuPercent() {
  std::string line;
  CpuSample sample;
  if (!readFirstLine(procRoot_ + "/stat", line) || !parseCpuSample(line, sample)) {
    return kMetricUnavailable;
  }

  if (!hasCpuBaseline_) {
    hasCpuBaseline_ = true;
    lastCpu_ = sample;
    return kMetricUnavailable;
  }

  const CpuSample previous = lastCpu_;
  lastCpu_ = sample;
  return formatCpuPercent(previous, sample);
}

std::string SystemMetrics::ramUsage() {
  std::string content;
  MemInfo info;
  if (!readWhole(procRoot_ + "/meminfo", content) || !parseMemInfo(content, info)) {
    return kMetricUnavailable;
  }
  const uint64_t totalMb = info.totalKb / 1024;
  const uint64_t availableMb = info.availableKb / 1024;
  const uint64_t usedMb = totalMb > availableMb ? totalMb - availableMb : 0;
  return formatUsageMb(usedMb, totalMb);
}

std::string SystemMetrics::diskUsage() {
  struct statvfs st;
  if (statvfs(diskPath_.c_str(), &st) != 0) {
    return kMetricUnavailable;
  }
  const uint64_t totalMb = static_cast<uint64_t>(st.f_blocks) * st.f_frsize / kBytesPerMb;
  const uint64_t freeMb = static_cast<uint64_t>(st.f_bavail) * st.f_frsize / kBytesPerMb;
  const uint64_t usedMb = totalMb > freeMb ? totalMb - freeMb : 0;
  return formatUsageMb(usedMb, totalMb);
}

std::string SystemMetrics::ipAddress() {
  struct ifaddrs *list = nullptr;
  if (getifaddrs(&list) != 0) {
    return kNoIpAddress;
  }

  std::string found;
  for (struct ifaddrs *it = list; it != nullptr; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if ((it->ifa_flags & IFF_LOOPBACK) || !(it->ifa_flags & IFF_UP)) {
      continue;
    }
    char buf[INET_ADDRSTRLEN] = {0};
    const struct sockaddr_in *addr = reinterpret_cast<const struct sockaddr_in *>(it->ifa_addr);
    if (inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf))) {
      found = buf;
      break;
    }
  }
  freeifaddrs(list);
  return found.empty() ? std::string(kNoIpAddress) : found;
}

std::string SystemMetrics::uptime() {
  std::string line;
  if (!readFirstLine(procRoot_ + "/uptime", line)) {
    return kMetricUnavailable;
  }
  std::istringstream in(line);
  double seconds = 0;
  if (!(in >> seconds)) {
    return kMetricUnavailable;
  }
  return formatUptime(seconds);
}

std::string SystemMetrics::cpuTemperature() {
  std::string line;
  if (!readFirstLine(thermalPath_, line)) {
    return kMetricUnavailable;
  }
  std::istringstream in(line);
  long millidegrees = 0;
  if (!(in >> millidegrees)) {
    return kMetricUnavailable;
  }
  return formatTemperature(millidegrees);
}
