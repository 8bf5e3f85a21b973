#include "uplink_telemetry.hpp"

#include "internal/observability/logging.hpp"

namespace uplink::core {

using observability::IntField;

UplinkTelemetry::UplinkTelemetry(std::chrono::milliseconds flush_interval, NowSource now)
    : flush_interval_(flush_interval), now_(std::move(now)), last_flush_(now_()) {
}

void UplinkTelemetry::RecordUplinked(std::uint64_t count) {
  uplinked_ += count;
}

void UplinkTelemetry::RecordAbandoned(std::uint64_t count) {
  abandoned_ += count;
}

bool UplinkTelemetry::MaybeFlush() {
  const auto now = now_();
  if (now - last_flush_ < flush_interval_) {
    return false;
  }

  last_flush_ = now;
  if (uplinked_ > 0) {
    UPLINK_LOG_INFO("Trace segments sent to collector", {IntField("count", static_cast<std::int64_t>(uplinked_))});
  }
  if (abandoned_ > 0) {
    UPLINK_LOG_INFO("Trace segments abandoned, no available channel", {IntField("count", static_cast<std::int64_t>(abandoned_))});
  }
  uplinked_  = 0;
  abandoned_ = 0;
  return true;
}

} // namespace uplink::core
