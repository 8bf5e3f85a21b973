#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/channel/grpc_channel_manager.hpp"
#include "internal/collector/segment_sink.hpp"
#include "internal/config/uplink_options.hpp"
#include "internal/core/segment_uplink_service.hpp"
#include "internal/segment/segment_listener.hpp"

namespace uplink::factory {

/*
  AgentRuntime

  Everything an instrumented process needs to ship segments. Members are
  declared so that destruction stops the uplink before the channel manager.
*/
struct AgentRuntime {
  config::UplinkOptions                          options;
  std::unique_ptr<channel::GrpcChannelManager>   channel_manager;
  std::unique_ptr<core::SegmentUplinkService>    uplink;
  std::unique_ptr<segment::ListenerRegistry>     listeners;

  void Start();
  void Stop();
};

struct CollectorRuntime {
  std::shared_ptr<collector::SegmentSink>        sink;
  std::vector<std::unique_ptr<::grpc::Service>>  grpc_services;
};

/*
  Composition roots. These are the only places that know concrete transport
  types.
*/
AgentRuntime     BuildAgent(const uplink::runtime::config::RuntimeConfig& config);
CollectorRuntime BuildCollector(const uplink::runtime::config::RuntimeConfig& config);

} // namespace uplink::factory
