#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hostsnap::model {

// Cumulative jiffies from one /proc/stat cpu line
struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

// One logical CPU as reported by a probe
struct RawCpu {
  std::string name;       // e.g. "cpu0"
  std::string vendor_id;
  std::string brand;
  float cpu_usage{};      // percent 0..100
  uint64_t frequency_mhz{};
};

// Strings fixed at first load
struct CpuIdentity {
  std::string name;
  std::string vendor_id;
  std::string brand;
};

// A single hardware thread
struct LogicalCpu {
  CpuIdentity identity;
  float cpu_usage{};  // percent 0..100
  double frequency{}; // MHz

  static LogicalCpu from_raw(const RawCpu& raw);
  double frequency_ghz() const { return frequency * 0.001; }
};

// The processor package with one child per logical CPU
struct AggregateCpu {
  CpuIdentity identity;
  size_t core_count{0}; // physical cores, 0 when unknown
  float cpu_usage{};
  double frequency{};   // MHz, taken from the first logical CPU
  std::vector<LogicalCpu> processes;

  double frequency_ghz() const { return frequency * 0.001; }
};

} // namespace hostsnap::model
