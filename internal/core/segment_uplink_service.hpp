#pragma once

#include <atomic>
#include <cstddef>

#include "channel_status_tracker.hpp"
#include "internal/buffer/data_carrier.hpp"
#include "internal/channel/channel_manager.hpp"
#include "internal/config/uplink_options.hpp"
#include "internal/segment/segment_listener.hpp"

namespace uplink::core {

/*
  SegmentUplinkService

  Composition root of the uplink pipeline:

      producers ──AfterFinished──► upload carrier (IF_POSSIBLE) ──► SegmentUplinkConsumer ──► collector
                                        ▲                                   │ not ready
                                        └──── AsyncSegmentForwarder ◄── async buffer (BLOCKING)

  The channel manager is borrowed and must outlive the service.
*/
class SegmentUplinkService final : public segment::SegmentListener {
 public:
  SegmentUplinkService(config::UplinkOptions options, channel::ChannelManager& manager,
                       ChannelStatusTracker::StubFactory stub_factory = transport::NewGrpcCollectorStub);
  ~SegmentUplinkService() override;

  SegmentUplinkService(const SegmentUplinkService&)            = delete;
  SegmentUplinkService& operator=(const SegmentUplinkService&) = delete;

  void Start();

  // Idempotent. Stops the async buffer first so its last ready segments can
  // still be uploaded by the final drain of the upload carrier.
  void Shutdown();

  // Never blocks the producer.
  void AfterFinished(const segment::SegmentPtr& segment) override;

  const ChannelStatusTracker& tracker() const {
    return tracker_;
  }

  std::size_t BufferedSegments() const;
  std::size_t BufferedAsyncSegments() const;

 private:
  const config::UplinkOptions options_;
  channel::ChannelManager&    manager_;
  ChannelStatusTracker        tracker_;

  buffer::DataCarrier<segment::SegmentPtr> carrier_;
  buffer::DataCarrier<segment::SegmentPtr> async_buffer_;

  std::atomic<bool> started_{false};
  std::atomic<bool> shut_down_{false};
};

} // namespace uplink::core
