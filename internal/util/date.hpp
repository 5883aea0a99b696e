#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace recon::util {

/*
  Calendar day without a time zone. Stored and exchanged as "YYYY-MM-DD".
*/
using Date = std::chrono::sys_days;

// Accepts "YYYY-MM-DD", "YYYY/MM/DD" and "MM/DD/YYYY".
std::optional<Date> ParseDate(std::string_view text);

std::string FormatDate(Date d);

// |a - b| in days.
int64_t DaysBetween(Date a, Date b);

inline Date AddDays(Date d, int64_t days) {
  return d + std::chrono::days{days};
}

} // namespace recon::util
