#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace recon::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMs();

// "20240501T101502Z", safe for file names.
std::string CompactUtcStamp(TimePoint tp);

} // namespace recon::util
