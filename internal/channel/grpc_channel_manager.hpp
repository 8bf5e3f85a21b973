#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "channel_manager.hpp"

namespace uplink::channel {

/*
  ChannelManager over a single insecure gRPC channel.

  A background loop (re)connects every `check_interval` while disconnected,
  and watches the connectivity state while connected. Listener callbacks run
  on the loop thread (or on the thread calling ReportError) and never under
  the manager's lock, so a listener may call GetChannel().
*/
class GrpcChannelManager final : public ChannelManager {
 public:
  GrpcChannelManager(std::string target, std::chrono::milliseconds check_interval, std::chrono::milliseconds connect_timeout);
  ~GrpcChannelManager() override;

  GrpcChannelManager(const GrpcChannelManager&)            = delete;
  GrpcChannelManager& operator=(const GrpcChannelManager&) = delete;

  void Start();
  void Stop();

  void AddChannelListener(ChannelListener* listener) override;
  void RemoveChannelListener(ChannelListener* listener) override;

  std::shared_ptr<::grpc::Channel> GetChannel() const override;

  void ReportError(const ::grpc::Status& status) override;

  ChannelStatus Status() const;

  static bool IsNetworkError(const ::grpc::Status& status);

 private:
  void Loop();
  void TryConnect();
  void CheckConnectivity();
  void MarkDisconnected(const std::string& reason);
  void NotifyCurrentStatus();

  const std::string               target_;
  const std::chrono::milliseconds check_interval_;
  const std::chrono::milliseconds connect_timeout_;

  mutable std::mutex               mutex_;
  std::condition_variable          cv_;
  std::shared_ptr<::grpc::Channel> channel_;
  ChannelStatus                    status_ = ChannelStatus::kDisconnected;
  bool                             reconnect_ = true;
  bool                             stopping_  = false;
  bool                             wake_      = false;

  // serializes deliveries so listeners always end on the latest status
  std::mutex notify_mutex_;

  mutable std::mutex             listeners_mutex_;
  std::vector<ChannelListener*>  listeners_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace uplink::channel
