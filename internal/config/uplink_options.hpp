#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "config/config.pb.h"

namespace uplink::config {

/*
  Resolved runtime knobs for the uplink pipeline.

  Every field carries its production default; FromConfig only overrides what
  the YAML actually sets.
*/
struct UplinkOptions {
  std::string               collector_target{"127.0.0.1:11800"};
  std::chrono::milliseconds check_interval{std::chrono::seconds(30)};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(3)};

  std::size_t               channel_size{5};
  std::size_t               buffer_size{300};
  std::size_t               batch_size{300};
  std::chrono::milliseconds consume_cycle{20};

  std::chrono::milliseconds completion_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds flush_interval{std::chrono::seconds(30)};
  std::chrono::milliseconds async_retry_delay{50};

  // Throws util::InvalidConfig.
  static UplinkOptions FromConfig(const uplink::runtime::config::RuntimeConfig& config);

  void Validate() const;
};

} // namespace uplink::config
