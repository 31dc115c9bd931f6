#include "ui/Formatting.hpp"
#include <cstdio>

namespace hostsnap::ui {

std::string format_clock_time(const std::tm& tm) {
  char buf[64];
  // %p is "AM"/"PM" in the C locale, which is never switched here
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %I:%M:%S %p", &tm) == 0) return std::string();
  return std::string(buf);
}

std::string format_duration(uint64_t total_secs) {
  uint64_t days = total_secs / 86400;
  uint64_t hours = (total_secs % 86400) / 3600;
  uint64_t minutes = (total_secs % 3600) / 60;
  uint64_t seconds = total_secs % 60;

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu:%02llu",
                static_cast<unsigned long long>(days), static_cast<unsigned long long>(hours),
                static_cast<unsigned long long>(minutes), static_cast<unsigned long long>(seconds));
  return std::string(buf);
}

std::string format_fixed(double value, int decimals) {
  if (decimals < 0) decimals = 0;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  return std::string(buf);
}

} // namespace hostsnap::ui
