#pragma once

#include <string_view>

namespace uplink::channel {

enum class ChannelStatus {
  kDisconnected,
  kConnected,
};

inline std::string_view ToString(ChannelStatus status) {
  return status == ChannelStatus::kConnected ? "CONNECTED" : "DISCONNECTED";
}

class ChannelListener {
 public:
  virtual ~ChannelListener() = default;

  virtual void StatusChanged(ChannelStatus status) = 0;
};

} // namespace uplink::channel
