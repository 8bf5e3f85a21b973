#include "factory.hpp"

#include "internal/grpc/collector_server.hpp"

namespace uplink::factory {

void AgentRuntime::Start() {
  uplink->Start();
  listeners->Add(uplink.get());
  channel_manager->Start();
}

void AgentRuntime::Stop() {
  listeners->Remove(uplink.get());
  uplink->Shutdown();
  channel_manager->Stop();
}

AgentRuntime BuildAgent(const uplink::runtime::config::RuntimeConfig& config) {
  AgentRuntime runtime;
  runtime.options         = config::UplinkOptions::FromConfig(config);
  runtime.channel_manager = std::make_unique<channel::GrpcChannelManager>(runtime.options.collector_target, runtime.options.check_interval,
                                                                          runtime.options.connect_timeout);
  runtime.uplink          = std::make_unique<core::SegmentUplinkService>(runtime.options, *runtime.channel_manager);
  runtime.listeners       = std::make_unique<segment::ListenerRegistry>();
  return runtime;
}

CollectorRuntime BuildCollector(const uplink::runtime::config::RuntimeConfig&) {
  CollectorRuntime runtime;
  runtime.sink = std::make_shared<collector::SegmentSink>();
  runtime.grpc_services.push_back(std::make_unique<grpc::CollectorServer>(runtime.sink));
  return runtime;
}

} // namespace uplink::factory
