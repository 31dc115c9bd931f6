#pragma once
#include "probe/IProbe.hpp"

#include <string>

namespace hostsnap::probe {

// Linux probe backed by /proc and /sys. Paths honor HOSTSNAP_PROC_ROOT and
// HOSTSNAP_SYS_ROOT (see util/Procfs.hpp).
class ProcfsProbe : public IProbe {
public:
  static constexpr std::chrono::milliseconds kMinimumCpuUpdateInterval{200};

  ProcfsProbe() = default;
  ~ProcfsProbe() override = default;

  [[nodiscard]] bool refresh_all() override;
  [[nodiscard]] bool refresh_cpu_all() override;
  [[nodiscard]] bool refresh_cpu_usage() override;

  [[nodiscard]] const std::vector<model::RawCpu>& cpus() const override { return cpus_; }
  [[nodiscard]] float global_cpu_usage() const override { return global_usage_; }
  [[nodiscard]] std::optional<size_t> physical_core_count() const override { return physical_cores_; }

  [[nodiscard]] uint64_t available_memory() const override { return mem_available_; }
  [[nodiscard]] uint64_t used_memory() const override { return mem_used_; }
  [[nodiscard]] uint64_t total_memory() const override { return mem_total_; }

  [[nodiscard]] uint64_t boot_time() const override { return boot_time_; }
  [[nodiscard]] uint64_t uptime() const override { return uptime_; }

  [[nodiscard]] size_t process_count() const override { return process_count_; }

  [[nodiscard]] std::chrono::milliseconds minimum_cpu_update_interval() const override {
    return kMinimumCpuUpdateInterval;
  }

private:
  void read_cpuinfo();
  void read_frequencies();
  void read_topology_cores();
  bool read_meminfo();
  bool read_uptime();
  void read_boot_time();
  void count_processes();

  std::vector<model::RawCpu> cpus_;
  std::vector<double> cpuinfo_mhz_; // parallel to cpus_, 0 when not listed
  model::CpuTimes last_total_{};
  std::vector<model::CpuTimes> last_per_{};
  bool has_last_{false};
  std::chrono::steady_clock::time_point last_sample_{};
  float global_usage_{};
  std::optional<size_t> physical_cores_;

  uint64_t mem_total_{};
  uint64_t mem_available_{};
  uint64_t mem_used_{};
  uint64_t boot_time_{};
  uint64_t uptime_{};
  size_t process_count_{};
};

// Default factory used by ResourceSnapshot
std::unique_ptr<IProbe> make_procfs_probe();

} // namespace hostsnap::probe
