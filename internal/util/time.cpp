#include "time.hpp"

namespace uplink::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration, std::chrono::milliseconds fallback) {
  const auto value = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(duration.seconds()) +
                                                                           std::chrono::nanoseconds(duration.nanos()));
  if (value.count() <= 0) {
    return fallback;
  }
  return value;
}

} // namespace uplink::util
