#pragma once

#include <cstdint>
#include <string>

namespace recon::db::model {

// Import line that could not be fingerprinted; waits for manual review.
struct QuarantineRecord {
  std::string id;
  std::string import_batch_id;
  std::string source_file;
  uint32_t    line_number = 0;
  std::string reason;
  std::string raw_line;
  uint64_t    created_at_ms = 0;
};

} // namespace recon::db::model
