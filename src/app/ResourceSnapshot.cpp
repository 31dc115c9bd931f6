#include "app/ResourceSnapshot.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace hostsnap::app {

// Last second of year +262142, the upper bound of the proleptic civil range
// used for timestamps
static constexpr uint64_t kMaxCivilEpochSeconds = 8'210'298'412'799ULL;

std::optional<std::tm> epoch_to_local(uint64_t seconds) {
  if (seconds > kMaxCivilEpochSeconds) return std::nullopt;
  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm lt{};
  if (::localtime_r(&t, &lt) == nullptr) return std::nullopt;
  return lt;
}

ResourceSnapshot::ResourceSnapshot(probe::ProbeFactory factory)
    : factory_(std::move(factory)), probe_(factory_ ? factory_() : nullptr) {}

bool ResourceSnapshot::fail(ErrorKind kind, std::string message) {
  last_error_ = SnapshotError{kind, std::move(message)};
  return false;
}

bool ResourceSnapshot::load() {
  auto fresh = factory_ ? factory_() : nullptr;
  if (!fresh) return fail(ErrorKind::ProbeUnavailable, "no probe available");
  if (!fresh->refresh_all()) return fail(ErrorKind::ProbeUnavailable, "failed to read system counters");

  // fresh holds the previous probe until the CPU load succeeds
  std::swap(probe_, fresh);
  if (!load_cpu_info()) {
    std::swap(probe_, fresh);
    return false;
  }

  available_memory_ = probe_->available_memory();
  used_memory_      = probe_->used_memory();
  total_memory_     = probe_->total_memory();
  boot_time_        = probe_->boot_time();
  uptime_           = probe_->uptime();
  num_of_processes_ = probe_->process_count();

  loaded_ = true;
  last_error_.reset();
  return true;
}

bool ResourceSnapshot::load_cpu_info() {
  if (!probe_->refresh_cpu_all()) return fail(ErrorKind::ProbeUnavailable, "failed to read cpu counters");
  const auto& raw = probe_->cpus();
  if (raw.empty()) return fail(ErrorKind::EmptyCpuList, "no logical cpus reported");

  model::AggregateCpu cpu;
  const auto& first = raw.front();
  cpu.identity.brand     = first.brand;
  cpu.identity.name      = first.name;
  cpu.identity.vendor_id = first.vendor_id;
  cpu.cpu_usage          = first.cpu_usage;
  cpu.frequency          = static_cast<double>(first.frequency_mhz);
  cpu.core_count         = probe_->physical_core_count().value_or(0);

  cpu.processes.reserve(raw.size());
  for (const auto& r : raw) cpu.processes.push_back(model::LogicalCpu::from_raw(r));

  cpu_ = std::move(cpu);
  return true;
}

bool ResourceSnapshot::reload() {
  if (!probe_) return fail(ErrorKind::ProbeUnavailable, "no probe available");
  if (!probe_->refresh_all()) return fail(ErrorKind::ProbeUnavailable, "failed to refresh system counters");

  uptime_           = probe_->uptime();
  available_memory_ = probe_->available_memory();
  used_memory_      = probe_->used_memory();
  num_of_processes_ = probe_->process_count();
  reload_cpu_info();

  last_error_.reset();
  return true;
}

void ResourceSnapshot::reload_cpu_info() {
  get_cpu_usage();

  const auto& raw = probe_->cpus();
  if (raw.empty()) return;
  cpu_.frequency = static_cast<double>(raw.front().frequency_mhz);

  // Children are matched by position; entries past the loaded count are ignored
  size_t n = std::min(raw.size(), cpu_.processes.size());
  for (size_t i = 0; i < n; ++i) {
    cpu_.processes[i].cpu_usage = raw[i].cpu_usage;
    cpu_.processes[i].frequency = static_cast<double>(raw[i].frequency_mhz);
  }
}

float ResourceSnapshot::get_cpu_usage() {
  if (!probe_) return cpu_.cpu_usage;
  if (!probe_->refresh_cpu_usage()) return cpu_.cpu_usage;
  std::this_thread::sleep_for(probe_->minimum_cpu_update_interval());
  if (!probe_->refresh_cpu_usage()) return cpu_.cpu_usage;
  cpu_.cpu_usage = probe_->global_cpu_usage();
  return cpu_.cpu_usage;
}

std::optional<std::tm> ResourceSnapshot::get_boot_time() const {
  return epoch_to_local(boot_time_);
}

std::optional<std::tm> ResourceSnapshot::get_uptime() const {
  return epoch_to_local(uptime_);
}

} // namespace hostsnap::app
