#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/util/date.hpp"
#include "internal/util/money.hpp"

namespace recon::fingerprint {

using FingerprintKey = std::string;

/*
  Immutable fields of an incoming bank line.

  occurrence distinguishes genuine identical lines inside one feed
  (0 for the first, 1 for the second, ...). Re-importing the same
  feed reproduces the same ordinals and therefore the same keys.
*/
struct FingerprintInput {
  std::optional<util::Date>  posted_on;
  std::optional<util::Cents> amount_cents;
  std::string                description;
  std::string                account_id;
  uint32_t                   occurrence = 0;
};

// Upper-cased, whitespace collapsed, trimmed.
std::string NormalizeDescription(std::string_view description);

/*
  Deterministic SHA-256 (lowercase hex) over the immutable fields.

  Throws util::MissingFieldError naming the first missing field.
  A placeholder key is never produced.
*/
FingerprintKey Fingerprint(const FingerprintInput& input);

/*
  Row id for the external transaction carrying key.

  A version 8 UUID taken from the leading digest bytes. Every pass over
  the same feed assigns the same id, so a preview and the apply that
  follows it walk the same rows in the same order.
*/
std::string TransactionId(const FingerprintKey& key);

/*
  Assigns occurrence ordinals within one feed.

  Lines are identical when date, amount, normalized description and
  account are equal. Incomplete lines are never counted.
*/
class OccurrenceCounter {
 public:
  uint32_t Next(const FingerprintInput& input);

 private:
  std::unordered_map<std::string, uint32_t> seen_;
};

} // namespace recon::fingerprint
