#include <algorithm>
#include <chrono>
#include <csignal>
#include <deque>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/segment/trace_segment.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"

using uplink::observability::IntField;
using uplink::observability::StringField;
using uplink::segment::TraceSegment;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

struct PendingAsync {
  std::shared_ptr<TraceSegment>         segment;
  std::chrono::steady_clock::time_point due;
};

uplink::v1::SpanObject MakeSpan(int span_id, int parent_span_id, std::string operation, uplink::v1::SpanType type) {
  const auto now = uplink::util::ToUnixMillis(uplink::util::Now());

  uplink::v1::SpanObject span;
  span.set_span_id(span_id);
  span.set_parent_span_id(parent_span_id);
  span.set_start_time_ms(static_cast<int64_t>(now) - 5);
  span.set_end_time_ms(static_cast<int64_t>(now));
  span.set_operation_name(std::move(operation));
  span.set_span_type(type);
  return span;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: segment-uplink-agent <config.yaml> OR segment-uplink-agent --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = uplink::config::ConfigLoader::LoadFromYaml(config_path);
    uplink::observability::InitializeLogging(config);

    const auto& agent            = config.agent();
    const auto  service          = agent.service().empty() ? std::string("synthetic-service") : agent.service();
    const auto  instance         = agent.service_instance().empty() ? std::string("instance-0") : agent.service_instance();
    const auto  per_second       = agent.segments_per_second() > 0 ? agent.segments_per_second() : 10u;
    const auto  async_percent    = std::min(agent.async_percent(), 100u);
    const auto  async_completion = uplink::util::FromProto(agent.async_completion_delay(), std::chrono::milliseconds(200));

    auto app = uplink::factory::BuildAgent(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    UPLINK_LOG_INFO("Segment uplink agent started", {StringField("collector", app.options.collector_target), StringField("service", service),
                                                     IntField("segments_per_second", per_second)});

    std::mt19937                            rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> percent(0, 99);
    std::deque<PendingAsync>                pending;
    const auto                              tick = std::chrono::microseconds(1000000 / per_second);

    while (g_running) {
      const auto trace_id = uplink::util::NewTraceId();
      auto       segment  = std::make_shared<TraceSegment>(trace_id, uplink::util::NewSegmentId(trace_id), service, instance);

      segment->AddSpan(MakeSpan(0, -1, "/synthetic/entry", uplink::v1::SPAN_TYPE_ENTRY));
      segment->AddSpan(MakeSpan(1, 0, "synthetic.local", uplink::v1::SPAN_TYPE_LOCAL));

      if (percent(rng) < async_percent) {
        segment->BeginAsync();
        pending.push_back({segment, std::chrono::steady_clock::now() + async_completion});
      }
      app.listeners->NotifyFinished(segment);

      const auto now = std::chrono::steady_clock::now();
      while (!pending.empty() && pending.front().due <= now) {
        auto& async = pending.front();
        async.segment->AddSpan(MakeSpan(2, 1, "synthetic.async", uplink::v1::SPAN_TYPE_EXIT));
        async.segment->EndAsync();
        pending.pop_front();
      }

      std::this_thread::sleep_for(tick);
    }

    UPLINK_LOG_INFO("Shutting down segment uplink agent");
    for (auto& async : pending) async.segment->EndAsync();

    app.Stop();
    uplink::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    UPLINK_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    uplink::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
