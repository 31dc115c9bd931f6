#pragma once
#include "model/Cpu.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace hostsnap::probe {

// OS-facing source of CPU, memory, time and process readings.
// Readers return the values captured by the most recent refresh of their
// category; a freshly constructed probe has captured nothing yet.
class IProbe {
public:
  virtual ~IProbe() = default;

  // Refresh every category. Return false if any category could not be read.
  [[nodiscard]] virtual bool refresh_all() = 0;

  // Refresh CPU identity, frequency and usage.
  [[nodiscard]] virtual bool refresh_cpu_all() = 0;

  // Refresh CPU usage only. Usage is a delta, so two calls separated by at
  // least minimum_cpu_update_interval() are needed for a meaningful value.
  [[nodiscard]] virtual bool refresh_cpu_usage() = 0;

  // Logical CPUs; index i refers to the same CPU for the life of the probe.
  [[nodiscard]] virtual const std::vector<model::RawCpu>& cpus() const = 0;
  [[nodiscard]] virtual float global_cpu_usage() const = 0;
  [[nodiscard]] virtual std::optional<size_t> physical_core_count() const = 0;

  // Bytes
  [[nodiscard]] virtual uint64_t available_memory() const = 0;
  [[nodiscard]] virtual uint64_t used_memory() const = 0;
  [[nodiscard]] virtual uint64_t total_memory() const = 0;

  // Epoch seconds / seconds since boot
  [[nodiscard]] virtual uint64_t boot_time() const = 0;
  [[nodiscard]] virtual uint64_t uptime() const = 0;

  [[nodiscard]] virtual size_t process_count() const = 0;

  [[nodiscard]] virtual std::chrono::milliseconds minimum_cpu_update_interval() const = 0;
};

// Builds an empty (unrefreshed) probe
using ProbeFactory = std::function<std::unique_ptr<IProbe>()>;

} // namespace hostsnap::probe
