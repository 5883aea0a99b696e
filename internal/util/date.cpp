#include "date.hpp"

#include <cctype>
#include <cstdio>

namespace recon::util {

namespace {

bool ParseNumber(std::string_view s, int& out) {
  if (s.empty() || s.size() > 4) return false;
  int v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

std::optional<Date> Build(int y, int m, int d) {
  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                                        std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return std::nullopt;
  return Date{ymd};
}

} // namespace

std::optional<Date> ParseDate(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

  const char sep = text.find('-') != std::string_view::npos ? '-' : '/';
  const auto p1  = text.find(sep);
  if (p1 == std::string_view::npos) return std::nullopt;
  const auto p2 = text.find(sep, p1 + 1);
  if (p2 == std::string_view::npos || text.find(sep, p2 + 1) != std::string_view::npos) return std::nullopt;

  int a = 0, b = 0, c = 0;
  if (!ParseNumber(text.substr(0, p1), a) || !ParseNumber(text.substr(p1 + 1, p2 - p1 - 1), b) || !ParseNumber(text.substr(p2 + 1), c)) {
    return std::nullopt;
  }

  if (p1 == 4) return Build(a, b, c);         // YYYY-MM-DD
  if (text.size() - p2 - 1 == 4) return Build(c, a, b); // MM/DD/YYYY
  return std::nullopt;
}

std::string FormatDate(Date d) {
  const std::chrono::year_month_day ymd{d};
  char                              buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

int64_t DaysBetween(Date a, Date b) {
  const auto diff = (a - b).count();
  return diff < 0 ? -diff : diff;
}

} // namespace recon::util
