#include "ui/Report.hpp"
#include "ui/Formatting.hpp"

#include <cstddef>

namespace hostsnap::ui {

static void write_product(std::ostream& os, const model::AggregateCpu& cpu) {
  os << "Product Details\n";
  os << "Brand:     " << cpu.identity.brand << "\n";
  os << "Vendor ID: " << cpu.identity.vendor_id << "\n";
  os << "Frequency: " << format_fixed(cpu.frequency_ghz(), 2) << " GHz\n";
  os << "Cores:     " << cpu.core_count << "\n";
}

static void write_performance(std::ostream& os, const app::ResourceSnapshot& snap) {
  os << "Performance Details\n";
  os << "Usage:            " << format_fixed(snap.cpu().cpu_usage, 1) << " %\n";
  os << "Total memory:     " << snap.total_memory_gb() << " GB\n";
  os << "Available memory: " << snap.available_memory_gb() << " GB\n";
  os << "Used Memory:      " << snap.used_memory_gb() << " GB\n";
  os << "Processes:        " << snap.num_of_processes() << "\n";
}

static void write_logical(std::ostream& os, const model::AggregateCpu& cpu) {
  os << "Logical Processors:\n";
  size_t shown = 0;
  for (const auto& core : cpu.processes) {
    if (shown >= kLogicalShown) break;
    os << core.identity.name << ": " << format_fixed(core.frequency, 0) << " MHz - Usage: "
       << format_fixed(core.cpu_usage, 1) << "%\n";
    ++shown;
  }
  if (cpu.processes.size() > shown) os << "… (truncated)\n";
}

static void write_times(std::ostream& os, const app::ResourceSnapshot& snap) {
  os << "System Time\n";
  auto boot = snap.get_boot_time();
  os << "Boot time: " << (boot ? format_clock_time(*boot) : std::string("unavailable")) << "\n";
  os << "Uptime:    " << format_duration(snap.uptime()) << "\n";
}

void write_report(std::ostream& os, const app::ResourceSnapshot& snap) {
  os << "CPU Information\n\n";
  write_product(os, snap.cpu());
  os << "\n";
  write_performance(os, snap);
  os << "\n";
  write_logical(os, snap.cpu());
  os << "\n";
  write_times(os, snap);
}

} // namespace hostsnap::ui
