#include "channel_status_tracker.hpp"

#include "internal/observability/logging.hpp"

namespace uplink::core {

using channel::ChannelStatus;

ChannelStatusTracker::ChannelStatusTracker(channel::ChannelManager& manager, StubFactory stub_factory)
    : manager_(manager), stub_factory_(std::move(stub_factory)) {
}

void ChannelStatusTracker::StatusChanged(ChannelStatus status) {
  if (status == ChannelStatus::kDisconnected) {
    std::lock_guard lock(mutex_);
    status_ = ChannelStatus::kDisconnected;
    return;
  }

  auto channel = manager_.GetChannel();
  if (!channel) {
    UPLINK_LOG_WARN("Channel reported connected without a transport; staying disconnected");
    Publish(ChannelStatus::kDisconnected, nullptr);
    return;
  }

  std::shared_ptr<transport::CollectorStub> stub;
  try {
    stub = stub_factory_(std::move(channel));
  } catch (const std::exception& e) {
    UPLINK_LOG_ERROR("Failed to bind collector stub", {observability::StringField("error", e.what())});
  }
  if (!stub) {
    Publish(ChannelStatus::kDisconnected, nullptr);
    return;
  }

  Publish(ChannelStatus::kConnected, std::move(stub));
}

ChannelStatusTracker::Snapshot ChannelStatusTracker::Current() const {
  std::lock_guard lock(mutex_);
  if (status_ != ChannelStatus::kConnected) {
    return {};
  }
  return {status_, stub_};
}

void ChannelStatusTracker::Publish(ChannelStatus status, std::shared_ptr<transport::CollectorStub> stub) {
  std::lock_guard lock(mutex_);
  status_ = status;
  stub_   = std::move(stub);
}

} // namespace uplink::core
