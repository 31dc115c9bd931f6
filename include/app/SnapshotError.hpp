#pragma once

#include <string>

namespace hostsnap::app {

enum class ErrorKind {
  ProbeUnavailable, // a probe category could not be read
  EmptyCpuList,     // the probe enumerated no logical CPUs
};

struct SnapshotError {
  ErrorKind kind;
  std::string message;
};

const char* to_string(ErrorKind kind);

} // namespace hostsnap::app
