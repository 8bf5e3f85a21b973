#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "channel_status_tracker.hpp"
#include "internal/buffer/consumer.hpp"
#include "internal/buffer/data_carrier.hpp"
#include "internal/channel/channel_manager.hpp"
#include "internal/segment/segment.hpp"
#include "uplink_telemetry.hpp"

namespace uplink::core {

/*
  Drains batches of finished segments into one Collect stream per batch.

  While the channel is down the whole batch is counted as abandoned and no
  I/O happens. Segments that turn out not to be ready are moved to the async
  buffer instead of being sent. A batch is counted as uplinked only if the
  collector finishes the stream within `completion_timeout`; late
  completions and timeouts are never retried. Each stream carries a deadline
  of twice `completion_timeout`.

  Stream errors are reported to the channel manager until OnExit() or
  destruction; a stream that fails after that no longer touches the manager.
*/
class SegmentUplinkConsumer final : public buffer::IConsumer<segment::SegmentPtr> {
 public:
  SegmentUplinkConsumer(const ChannelStatusTracker& tracker, channel::ChannelManager& manager,
                        buffer::DataCarrier<segment::SegmentPtr>& async_buffer, std::chrono::milliseconds completion_timeout,
                        UplinkTelemetry telemetry);
  ~SegmentUplinkConsumer() override;

  void Consume(std::vector<segment::SegmentPtr>& batch) override;

  void OnError(const std::vector<segment::SegmentPtr>& batch, const std::exception& error) override;

  void OnExit() override;

  const UplinkTelemetry& telemetry() const {
    return telemetry_;
  }

 private:
  class ErrorReporter;

  void Upload(std::vector<segment::SegmentPtr>& batch, transport::CollectorStub& stub);
  void RedirectToAsyncBuffer(segment::SegmentPtr segment);

  const ChannelStatusTracker&               tracker_;
  std::shared_ptr<ErrorReporter>            reporter_;
  buffer::DataCarrier<segment::SegmentPtr>& async_buffer_;
  const std::chrono::milliseconds           completion_timeout_;
  UplinkTelemetry                           telemetry_;
};

} // namespace uplink::core
