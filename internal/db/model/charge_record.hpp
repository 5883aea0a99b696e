#pragma once

#include <string>

#include "internal/util/money.hpp"

namespace recon::db::model {

// Line item of a booking. Charges of a booking should sum to its total due.
struct ChargeRecord {
  std::string id;
  std::string booking_id;
  std::string description;
  util::Cents amount_cents = 0;
};

} // namespace recon::db::model
