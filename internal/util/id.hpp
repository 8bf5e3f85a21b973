#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace uplink::util {

/*
  Trace and segment ids.

  Trace ids are random RFC4122 v4 UUIDs in canonical text form. Segment ids
  are "<trace id>.<sequence>" so a collector can group them without decoding.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewTraceId();
std::string NewSegmentId(const std::string& trace_id);

} // namespace uplink::util
