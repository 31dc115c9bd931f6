#include "app/SnapshotError.hpp"

namespace hostsnap::app {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ProbeUnavailable: return "probe unavailable";
    case ErrorKind::EmptyCpuList: return "empty cpu list";
  }
  return "unknown";
}

} // namespace hostsnap::app
