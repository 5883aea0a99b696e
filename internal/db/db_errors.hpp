#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace recon::db {

/*
  Maps a failed Result onto the util:: exception hierarchy.

  AlreadyExists -> util::AlreadyExists
  NotFound      -> util::NotFound
  Conflict      -> util::InvalidState
  anything else -> std::runtime_error
*/
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace recon::db
