#pragma once

#include <stdint.h>

#include <string>

// Shown in place of any value that could not be read.
constexpr const char *kMetricUnavailable = "N/A";
constexpr const char *kNoIpAddress = "No IP";

struct CpuSample {
  uint64_t idle = 0;
  uint64_t total = 0;
};

struct MemInfo {
  uint64_t totalKb = 0;
  uint64_t availableKb = 0;
};

// First line of /proc/stat ("cpu  user nice system idle ...").
bool parseCpuSample(const std::string &statLine, CpuSample &out);
// Whole /proc/meminfo; needs MemTotal and MemAvailable.
bool parseMemInfo(const std::string &content, MemInfo &out);

std::string formatCpuPercent(const CpuSample &previous, const CpuSample &current);
std::string formatUptime(double seconds);
std::string formatTemperature(long millidegrees);
std::string formatUsageMb(uint64_t usedMb, uint64_t totalMb);

// Text values for the STAT screen. Every getter returns a display-ready
// string and falls back to kMetricUnavailable on read errors.
class SystemMetrics {
 public:
  explicit SystemMetrics(const std::string &procRoot = "/proc",
                         const std::string &thermalPath = "/sys/class/thermal/thermal_zone0/temp",
                         const std::string &diskPath = "/");

  // Usage since the previous call. The first call only takes a baseline.
  std::string cpuPercent();
  std::string ramUsage();
  std::string diskUsage();
  std::string ipAddress();
  std::string uptime();
  std::string cpuTemperature();

 private:
  std::string procRoot_;
  std::string thermalPath_;
  std::string diskPath_;
  bool hasCpuBaseline_ = false;
  CpuSample lastCpu_;
};
