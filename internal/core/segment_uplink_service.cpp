#include "segment_uplink_service.hpp"

#include <memory>

#include "async_segment_forwarder.hpp"
#include "internal/observability/logging.hpp"
#include "segment_uplink_consumer.hpp"
#include "uplink_telemetry.hpp"

namespace uplink::core {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

SegmentUplinkService::SegmentUplinkService(config::UplinkOptions options, channel::ChannelManager& manager,
                                           ChannelStatusTracker::StubFactory stub_factory)
    : options_(std::move(options)),
      manager_(manager),
      tracker_(manager, std::move(stub_factory)),
      carrier_(options_.channel_size, options_.buffer_size, buffer::BufferStrategy::kIfPossible),
      async_buffer_(options_.channel_size, options_.buffer_size, buffer::BufferStrategy::kBlocking) {
}

SegmentUplinkService::~SegmentUplinkService() {
  Shutdown();
}

void SegmentUplinkService::Start() {
  if (started_.exchange(true)) return;

  manager_.AddChannelListener(&tracker_);

  async_buffer_.Consume(std::make_shared<AsyncSegmentForwarder>(carrier_, async_buffer_, options_.async_retry_delay), options_.batch_size,
                        options_.consume_cycle);
  carrier_.Consume(std::make_shared<SegmentUplinkConsumer>(tracker_, manager_, async_buffer_, options_.completion_timeout,
                                                           UplinkTelemetry(options_.flush_interval)),
                   options_.batch_size, options_.consume_cycle);

  UPLINK_LOG_INFO("Segment uplink started", {IntField("channels", static_cast<std::int64_t>(options_.channel_size)),
                                             IntField("buffer_size", static_cast<std::int64_t>(options_.buffer_size)),
                                             IntField("batch_size", static_cast<std::int64_t>(options_.batch_size)),
                                             StringField("strategy", buffer::ToString(carrier_.GetBufferStrategy())),
                                             DurationField("completion_timeout", options_.completion_timeout)});
}

void SegmentUplinkService::Shutdown() {
  if (shut_down_.exchange(true)) return;

  if (started_.load()) {
    manager_.RemoveChannelListener(&tracker_);
  }
  async_buffer_.ShutdownConsumers();
  carrier_.ShutdownConsumers();

  UPLINK_LOG_INFO("Segment uplink stopped");
}

void SegmentUplinkService::AfterFinished(const segment::SegmentPtr& segment) {
  if (!segment || segment->IsIgnored()) return;

  if (!carrier_.Produce(segment)) {
    UPLINK_LOG_DEBUG("One trace segment has been abandoned, cause by buffer is full");
  }
}

std::size_t SegmentUplinkService::BufferedSegments() const {
  return carrier_.Size();
}

std::size_t SegmentUplinkService::BufferedAsyncSegments() const {
  return async_buffer_.Size();
}

} // namespace uplink::core
