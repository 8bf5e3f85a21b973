#pragma once

#include <memory>

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include "channel_status.hpp"

namespace uplink::channel {

/*
  Owner of the transport to the collector.

  Listeners are told about every CONNECTED / DISCONNECTED transition; after a
  CONNECTED notification GetChannel() returns the fresh transport. Anyone
  that sees a transport failure reports it through ReportError() so the
  manager can reconnect.
*/
class ChannelManager {
 public:
  virtual ~ChannelManager() = default;

  virtual void AddChannelListener(ChannelListener* listener)    = 0;
  virtual void RemoveChannelListener(ChannelListener* listener) = 0;

  virtual std::shared_ptr<::grpc::Channel> GetChannel() const = 0;

  virtual void ReportError(const ::grpc::Status& status) = 0;
};

} // namespace uplink::channel
