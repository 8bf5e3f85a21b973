#include "async_segment_forwarder.hpp"

#include <thread>

#include "internal/observability/logging.hpp"

namespace uplink::core {

AsyncSegmentForwarder::AsyncSegmentForwarder(buffer::DataCarrier<segment::SegmentPtr>& upload_carrier,
                                             buffer::DataCarrier<segment::SegmentPtr>& async_buffer, std::chrono::milliseconds retry_delay,
                                             Sleeper sleeper)
    : upload_carrier_(upload_carrier), async_buffer_(async_buffer), retry_delay_(retry_delay), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

void AsyncSegmentForwarder::Consume(std::vector<segment::SegmentPtr>& batch) {
  std::vector<segment::SegmentPtr> retry;
  retry.swap(held_);

  bool has_unfinished = false;
  for (auto& segment : retry) {
    has_unfinished |= !Forward(std::move(segment));
  }
  for (auto& segment : batch) {
    has_unfinished |= !Forward(std::move(segment));
  }

  if (has_unfinished) {
    sleeper_(retry_delay_);
  }
}

bool AsyncSegmentForwarder::Forward(segment::SegmentPtr segment) {
  if (segment->IsReadyToTransform()) {
    if (!upload_carrier_.Produce(std::move(segment))) {
      UPLINK_LOG_DEBUG("One async trace segment has been abandoned, cause by buffer is full");
    }
    return true;
  }

  // Offer, not Produce: blocking here would wait on this very loop
  if (!async_buffer_.Offer(segment)) {
    held_.push_back(std::move(segment));
  }
  return false;
}

void AsyncSegmentForwarder::OnError(const std::vector<segment::SegmentPtr>& batch, const std::exception& error) {
  UPLINK_LOG_ERROR("Failed to forward async trace segments",
                   {observability::IntField("count", static_cast<std::int64_t>(batch.size())),
                    observability::StringField("error", error.what())});
}

void AsyncSegmentForwarder::OnExit() {
  std::vector<segment::SegmentPtr> remaining;
  remaining.swap(held_);

  std::size_t unfinished = 0;
  for (auto& segment : remaining) {
    if (!Forward(std::move(segment))) ++unfinished;
  }
  held_.clear();

  if (unfinished > 0) {
    UPLINK_LOG_DEBUG("Unfinished trace segments dropped at shutdown", {observability::IntField("count", static_cast<std::int64_t>(unfinished))});
  }
}

} // namespace uplink::core
