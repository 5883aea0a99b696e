#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace recon::util {

/*
  UUID helpers

  Row identifiers (links, runs, quarantine entries) are random
  RFC4122 v4 UUIDs in canonical string form. Imported transactions
  take theirs from the fingerprint instead.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewId();

} // namespace recon::util
