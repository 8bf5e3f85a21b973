#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace uplink::core {

/*
  Sent / abandoned segment counters, logged and reset once per interval.

  Owned by the single upload loop; not thread-safe.
*/
class UplinkTelemetry {
 public:
  using Clock     = std::chrono::steady_clock;
  using NowSource = std::function<Clock::time_point()>;

  explicit UplinkTelemetry(std::chrono::milliseconds flush_interval, NowSource now = Clock::now);

  void RecordUplinked(std::uint64_t count);
  void RecordAbandoned(std::uint64_t count);

  // Logs and resets the counters when the interval has elapsed.
  bool MaybeFlush();

  std::uint64_t uplinked() const {
    return uplinked_;
  }

  std::uint64_t abandoned() const {
    return abandoned_;
  }

 private:
  const std::chrono::milliseconds flush_interval_;
  NowSource                       now_;

  Clock::time_point last_flush_;
  std::uint64_t     uplinked_  = 0;
  std::uint64_t     abandoned_ = 0;
};

} // namespace uplink::core
