#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/money.hpp"

namespace recon::db::model {

enum class BookingStatus {
  kActive,
  kCancelled,
  kClosed,
};

inline std::string_view ToString(BookingStatus status) {
  switch (status) {
    case BookingStatus::kActive:
      return "active";
    case BookingStatus::kCancelled:
      return "cancelled";
    case BookingStatus::kClosed:
      return "closed";
  }
  return "active";
}

inline std::optional<BookingStatus> BookingStatusFromString(std::string_view s) {
  if (s == "active") return BookingStatus::kActive;
  if (s == "cancelled") return BookingStatus::kCancelled;
  if (s == "closed") return BookingStatus::kClosed;
  return std::nullopt;
}

/*
  Booking (charter) row.

  paid_cents and balance_cents are derived; only the balance
  recalculator writes them. total_due_cents may be unknown and is
  never treated as zero.
*/
struct BookingRecord {
  std::string id;

  std::optional<util::Cents> total_due_cents;

  util::Cents paid_cents    = 0;
  util::Cents balance_cents = 0;

  BookingStatus status = BookingStatus::kActive;

  uint64_t updated_at_ms = 0;
};

} // namespace recon::db::model
