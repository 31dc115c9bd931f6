#include "model/Cpu.hpp"

namespace hostsnap::model {

LogicalCpu LogicalCpu::from_raw(const RawCpu& raw) {
  LogicalCpu cpu;
  cpu.identity.name = raw.name;
  cpu.identity.vendor_id = raw.vendor_id;
  cpu.identity.brand = raw.brand;
  cpu.cpu_usage = raw.cpu_usage;
  cpu.frequency = static_cast<double>(raw.frequency_mhz);
  return cpu;
}

} // namespace hostsnap::model
