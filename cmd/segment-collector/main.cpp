#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/time.hpp"

using uplink::observability::IntField;
using uplink::observability::StringField;
using uplink::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string listen_address;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc == 3 && std::string(argv[1]) == "--listen") {
    listen_address = argv[2];
  } else {
    std::cerr << "Usage: segment-collector <config.yaml> | --config <config.yaml> | --listen <host:port>" << std::endl;
    return 1;
  }

  try {
    uplink::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = uplink::config::ConfigLoader::LoadFromYaml(config_path);
    } else {
      config.mutable_server()->set_bind_address(listen_address);
    }
    uplink::observability::InitializeLogging(config);

    const auto bind_address    = config.server().bind_address().empty() ? std::string("0.0.0.0:11800") : config.server().bind_address();
    const auto report_interval = uplink::util::FromProto(config.server().report_interval(), std::chrono::seconds(30));

    auto app = uplink::factory::BuildCollector(config);

    Server server(bind_address, std::move(app.grpc_services));

    // handlers go in before Start() so an early signal is not lost
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    auto next_report = std::chrono::steady_clock::now() + report_interval;
    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (std::chrono::steady_clock::now() < next_report) continue;

      next_report       = std::chrono::steady_clock::now() + report_interval;
      const auto totals = app.sink->Snapshot();
      UPLINK_LOG_INFO("Collector totals", {IntField("segments", static_cast<std::int64_t>(totals.segments)),
                                           IntField("spans", static_cast<std::int64_t>(totals.spans)),
                                           IntField("streams", static_cast<std::int64_t>(totals.streams))});
    }

    UPLINK_LOG_INFO("Shutting down segment collector");

    server.Stop();
    uplink::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    UPLINK_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    uplink::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
