#pragma once

#include "app/ResourceSnapshot.hpp"

#include <cstddef>
#include <ostream>

namespace hostsnap::ui {

inline constexpr size_t kLogicalShown = 3;

// Fixed plaintext report: product details, performance details, the first
// kLogicalShown logical processors, boot time and uptime.
void write_report(std::ostream& os, const app::ResourceSnapshot& snap);

} // namespace hostsnap::ui
