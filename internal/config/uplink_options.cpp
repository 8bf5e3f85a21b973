#include "uplink_options.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace uplink::config {

UplinkOptions UplinkOptions::FromConfig(const uplink::runtime::config::RuntimeConfig& config) {
  UplinkOptions options;

  const auto& collector = config.collector();
  if (!collector.target().empty()) {
    options.collector_target = collector.target();
  }
  options.check_interval  = util::FromProto(collector.check_interval(), options.check_interval);
  options.connect_timeout = util::FromProto(collector.connect_timeout(), options.connect_timeout);

  const auto& buffer = config.buffer();
  if (buffer.channel_size() > 0) options.channel_size = buffer.channel_size();
  if (buffer.buffer_size() > 0) options.buffer_size = buffer.buffer_size();
  // batch defaults to one full channel
  options.batch_size    = buffer.batch_size() > 0 ? buffer.batch_size() : options.buffer_size;
  options.consume_cycle = util::FromProto(buffer.consume_cycle(), options.consume_cycle);

  const auto& uplink = config.uplink();
  options.completion_timeout = util::FromProto(uplink.completion_timeout(), options.completion_timeout);
  options.flush_interval     = util::FromProto(uplink.flush_interval(), options.flush_interval);
  options.async_retry_delay  = util::FromProto(uplink.async_retry_delay(), options.async_retry_delay);

  options.Validate();
  return options;
}

void UplinkOptions::Validate() const {
  if (collector_target.empty()) {
    throw util::InvalidConfig("collector.target must not be empty");
  }
  if (channel_size == 0 || buffer_size == 0 || batch_size == 0) {
    throw util::InvalidConfig("buffer.channel_size, buffer.buffer_size and buffer.batch_size must be positive");
  }
  if (completion_timeout.count() <= 0 || flush_interval.count() <= 0) {
    throw util::InvalidConfig("uplink.completion_timeout and uplink.flush_interval must be positive");
  }
}

} // namespace uplink::config
