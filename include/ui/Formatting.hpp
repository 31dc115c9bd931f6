#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace hostsnap::ui {

// "YYYY-MM-DD hh:MM:SS AM/PM", 12-hour clock
std::string format_clock_time(const std::tm& tm);

// "dd:HH:MM:SS"; days widen past two digits as needed
std::string format_duration(uint64_t total_secs);

// Fixed-point number with the given count of decimals
std::string format_fixed(double value, int decimals);

} // namespace hostsnap::ui
