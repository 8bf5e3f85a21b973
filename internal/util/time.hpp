#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace uplink::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// Zero or unset durations resolve to `fallback`.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration, std::chrono::milliseconds fallback);

} // namespace uplink::util
