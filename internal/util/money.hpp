#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace recon::util {

/*
  Money is signed integer cents. Never floating point.
*/
using Cents = int64_t;

// Accepts "1234", "1,234.5", "-12.30", "$12.30", "(12.30)" (negative).
// Returns nullopt for empty or malformed input.
std::optional<Cents> ParseCents(std::string_view text);

// "-12.30"
std::string FormatCents(Cents cents);

inline Cents AbsCents(Cents c) {
  return c < 0 ? -c : c;
}

} // namespace recon::util
