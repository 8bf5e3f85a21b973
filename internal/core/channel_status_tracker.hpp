#pragma once

#include <functional>
#include <memory>
#include <mutex>

#include "internal/channel/channel_manager.hpp"
#include "internal/channel/channel_status.hpp"
#include "internal/transport/collector_stub.hpp"

namespace uplink::core {

/*
  Follows the collector channel and keeps a stub bound to the current one.

  Status and stub are published together: a reader that sees CONNECTED
  always gets the stub built for the most recent CONNECTED notification.
*/
class ChannelStatusTracker final : public channel::ChannelListener {
 public:
  using StubFactory = std::function<std::shared_ptr<transport::CollectorStub>(std::shared_ptr<::grpc::Channel>)>;

  struct Snapshot {
    channel::ChannelStatus                    status = channel::ChannelStatus::kDisconnected;
    std::shared_ptr<transport::CollectorStub> stub;
  };

  explicit ChannelStatusTracker(channel::ChannelManager& manager, StubFactory stub_factory = transport::NewGrpcCollectorStub);

  void StatusChanged(channel::ChannelStatus status) override;

  Snapshot Current() const;

 private:
  void Publish(channel::ChannelStatus status, std::shared_ptr<transport::CollectorStub> stub);

  channel::ChannelManager& manager_;
  StubFactory              stub_factory_;

  mutable std::mutex                        mutex_;
  channel::ChannelStatus                    status_ = channel::ChannelStatus::kDisconnected;
  std::shared_ptr<transport::CollectorStub> stub_;
};

} // namespace uplink::core
