#include "app/ResourceSnapshot.hpp"
#include "ui/Config.hpp"
#include "ui/Report.hpp"
#include "util/Procfs.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>

using clock_type = std::chrono::steady_clock;

static long long elapsed_ms(clock_type::time_point since) {
  return static_cast<long long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - since).count());
}

int main() {
  const auto& cfg = hostsnap::ui::config();
  if (cfg.verbose) {
    std::fprintf(stderr, "hostsnap: config: %s\n", cfg.source.empty() ? "(defaults)" : cfg.source.c_str());
    auto proc = hostsnap::util::map_proc_path("/proc");
    auto sys = hostsnap::util::map_sys_path("/sys");
    if (proc != "/proc") std::fprintf(stderr, "hostsnap: reading /proc from %s\n", proc.c_str());
    if (sys != "/sys") std::fprintf(stderr, "hostsnap: reading /sys from %s\n", sys.c_str());
  }

  hostsnap::app::ResourceSnapshot snap;

  auto t0 = clock_type::now();
  if (!snap.load()) {
    const auto& err = snap.last_error();
    std::fprintf(stderr, "hostsnap: load failed: %s: %s\n",
                 err ? hostsnap::app::to_string(err->kind) : "unknown",
                 err ? err->message.c_str() : "");
    return 1;
  }
  if (cfg.verbose) std::fprintf(stderr, "hostsnap: load took %lldms\n", elapsed_ms(t0));

  auto t1 = clock_type::now();
  if (!snap.reload()) {
    // Loaded figures are still valid; report them unsampled
    const auto& err = snap.last_error();
    std::fprintf(stderr, "hostsnap: usage sampling failed: %s\n", err ? err->message.c_str() : "unknown");
  } else if (cfg.verbose) {
    std::fprintf(stderr, "hostsnap: sampling took %lldms\n", elapsed_ms(t1));
  }

  hostsnap::ui::write_report(std::cout, snap);
  std::cout.flush();
  return 0;
}
