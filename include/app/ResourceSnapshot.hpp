#pragma once
#include "app/SnapshotError.hpp"
#include "model/Cpu.hpp"
#include "probe/ProcfsProbe.hpp"

#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>

namespace hostsnap::app {

inline constexpr uint64_t kBytesPerGiB = 1'073'741'824;

// One-shot view of the local machine. load() captures everything once;
// reload() refreshes only the volatile readings and leaves identity strings,
// core count, total memory and boot time as loaded.
class ResourceSnapshot {
public:
  explicit ResourceSnapshot(probe::ProbeFactory factory = probe::make_procfs_probe);
  ResourceSnapshot(const ResourceSnapshot&) = delete;
  ResourceSnapshot& operator=(const ResourceSnapshot&) = delete;

  // Full probe. On failure the snapshot keeps its previous contents and
  // last_error() describes the cause.
  [[nodiscard]] bool load();

  // Cheap refresh of usage, frequency, memory in use, uptime and process
  // count. Blocks for one CPU sampling interval.
  [[nodiscard]] bool reload();

  // Samples global CPU usage across minimum_cpu_update_interval() and stores
  // it as cpu().cpu_usage. Sleeps on the calling thread.
  float get_cpu_usage();

  [[nodiscard]] bool loaded() const { return loaded_; }
  [[nodiscard]] const std::optional<SnapshotError>& last_error() const { return last_error_; }

  [[nodiscard]] const model::AggregateCpu& cpu() const { return cpu_; }
  [[nodiscard]] uint64_t available_memory() const { return available_memory_; }
  [[nodiscard]] uint64_t used_memory() const { return used_memory_; }
  [[nodiscard]] uint64_t total_memory() const { return total_memory_; }
  [[nodiscard]] uint64_t boot_time() const { return boot_time_; }
  [[nodiscard]] uint64_t uptime() const { return uptime_; }
  [[nodiscard]] size_t num_of_processes() const { return num_of_processes_; }

  // Whole gibibytes, fraction dropped
  [[nodiscard]] uint64_t used_memory_gb() const { return used_memory_ / kBytesPerGiB; }
  [[nodiscard]] uint64_t available_memory_gb() const { return available_memory_ / kBytesPerGiB; }
  [[nodiscard]] uint64_t total_memory_gb() const { return total_memory_ / kBytesPerGiB; }

  [[nodiscard]] double get_cpu_frequency_ghz() const { return cpu_.frequency_ghz(); }

  // Stored seconds read as a UTC instant and converted to local time;
  // std::nullopt when the value has no civil representation.
  [[nodiscard]] std::optional<std::tm> get_boot_time() const;
  [[nodiscard]] std::optional<std::tm> get_uptime() const;

private:
  bool load_cpu_info();
  void reload_cpu_info();
  bool fail(ErrorKind kind, std::string message);

  probe::ProbeFactory factory_;
  std::unique_ptr<probe::IProbe> probe_;

  uint64_t available_memory_{0};
  uint64_t used_memory_{0};
  uint64_t total_memory_{0};
  uint64_t boot_time_{0};
  uint64_t uptime_{0};
  model::AggregateCpu cpu_{};
  size_t num_of_processes_{0};

  bool loaded_{false};
  std::optional<SnapshotError> last_error_;
};

// Epoch seconds as local civil time, std::nullopt when out of range
std::optional<std::tm> epoch_to_local(uint64_t seconds);

} // namespace hostsnap::app
