#include "money.hpp"

#include <cctype>
#include <limits>

namespace recon::util {

std::optional<Cents> ParseCents(std::string_view text) {
  size_t begin = 0;
  size_t end   = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  text = text.substr(begin, end - begin);
  if (text.empty()) return std::nullopt;

  bool negative = false;
  if (text.front() == '(' && text.back() == ')') {
    negative = true;
    text     = text.substr(1, text.size() - 2);
  }
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = negative || text.front() == '-';
    text.remove_prefix(1);
  }
  if (!text.empty() && text.front() == '$') text.remove_prefix(1);
  if (text.empty()) return std::nullopt;

  int64_t whole      = 0;
  int64_t fraction   = 0;
  int     frac_digits = 0;
  bool    seen_dot   = false;
  bool    seen_digit = false;

  for (char c : text) {
    if (c == ',') {
      if (seen_dot) return std::nullopt;
      continue;
    }
    if (c == '.') {
      if (seen_dot) return std::nullopt;
      seen_dot = true;
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    seen_digit = true;

    const int digit = c - '0';
    if (seen_dot) {
      // sub-cent digits are rejected rather than rounded
      if (frac_digits == 2) {
        if (digit != 0) return std::nullopt;
        continue;
      }
      fraction = fraction * 10 + digit;
      ++frac_digits;
    } else {
      if (whole > (std::numeric_limits<int64_t>::max() - digit) / 10 / 100) return std::nullopt;
      whole = whole * 10 + digit;
    }
  }
  if (!seen_digit) return std::nullopt;
  if (frac_digits == 1) fraction *= 10;

  const Cents cents = whole * 100 + fraction;
  return negative ? -cents : cents;
}

std::string FormatCents(Cents cents) {
  const bool     negative = cents < 0;
  const uint64_t magnitude =
      negative ? static_cast<uint64_t>(-(cents + 1)) + 1 : static_cast<uint64_t>(cents);

  std::string out = negative ? "-" : "";
  out += std::to_string(magnitude / 100);
  out += '.';
  const auto frac = magnitude % 100;
  if (frac < 10) out += '0';
  out += std::to_string(frac);
  return out;
}

} // namespace recon::util
