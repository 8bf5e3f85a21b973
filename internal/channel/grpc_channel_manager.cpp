#include "grpc_channel_manager.hpp"

#include <algorithm>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/observability/logging.hpp"

namespace uplink::channel {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

GrpcChannelManager::GrpcChannelManager(std::string target, std::chrono::milliseconds check_interval,
                                       std::chrono::milliseconds connect_timeout)
    : target_(std::move(target)), check_interval_(check_interval), connect_timeout_(connect_timeout) {
}

GrpcChannelManager::~GrpcChannelManager() {
  Stop();
}

void GrpcChannelManager::Start() {
  if (running_.exchange(true)) return;

  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&GrpcChannelManager::Loop, this);
}

void GrpcChannelManager::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void GrpcChannelManager::AddChannelListener(ChannelListener* listener) {
  if (listener == nullptr) return;
  {
    std::lock_guard lock(listeners_mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) return;
    listeners_.push_back(listener);
  }

  // late subscribers still learn about an established channel
  std::lock_guard notify_lock(notify_mutex_);
  if (Status() == ChannelStatus::kConnected) {
    listener->StatusChanged(ChannelStatus::kConnected);
  }
}

void GrpcChannelManager::RemoveChannelListener(ChannelListener* listener) {
  std::lock_guard notify_lock(notify_mutex_);
  std::lock_guard lock(listeners_mutex_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

std::shared_ptr<::grpc::Channel> GrpcChannelManager::GetChannel() const {
  std::lock_guard lock(mutex_);
  return channel_;
}

ChannelStatus GrpcChannelManager::Status() const {
  std::lock_guard lock(mutex_);
  return status_;
}

bool GrpcChannelManager::IsNetworkError(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::UNKNOWN:
    case ::grpc::StatusCode::PERMISSION_DENIED:
    case ::grpc::StatusCode::UNAUTHENTICATED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return true;
    default:
      return false;
  }
}

void GrpcChannelManager::ReportError(const ::grpc::Status& status) {
  if (!IsNetworkError(status)) {
    UPLINK_LOG_WARN("Collector call failed without a transport error",
                    {IntField("code", static_cast<int>(status.error_code())), StringField("error", status.error_message())});
    return;
  }
  MarkDisconnected(status.error_message());
}

void GrpcChannelManager::Loop() {
  for (;;) {
    bool reconnect = false;
    {
      std::lock_guard lock(mutex_);
      if (stopping_) break;
      reconnect = reconnect_;
    }

    if (reconnect) {
      TryConnect();
    } else {
      CheckConnectivity();
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, check_interval_, [&] { return stopping_ || wake_; });
    wake_ = false;
  }
}

void GrpcChannelManager::TryConnect() {
  auto channel = ::grpc::CreateChannel(target_, ::grpc::InsecureChannelCredentials());
  if (!channel->WaitForConnected(std::chrono::system_clock::now() + connect_timeout_)) {
    UPLINK_LOG_WARN("Collector unreachable", {StringField("target", target_), DurationField("timeout", connect_timeout_)});
    return;
  }

  {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    channel_   = std::move(channel);
    status_    = ChannelStatus::kConnected;
    reconnect_ = false;
  }
  UPLINK_LOG_INFO("Connected to collector", {StringField("target", target_)});
  NotifyCurrentStatus();
}

void GrpcChannelManager::CheckConnectivity() {
  auto channel = GetChannel();
  if (!channel) return;

  const auto state = channel->GetState(true);
  if (state == GRPC_CHANNEL_TRANSIENT_FAILURE || state == GRPC_CHANNEL_SHUTDOWN) {
    MarkDisconnected("channel state " + std::to_string(static_cast<int>(state)));
  }
}

void GrpcChannelManager::MarkDisconnected(const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    if (reconnect_) return;
    reconnect_ = true;
    status_    = ChannelStatus::kDisconnected;
    wake_      = true;
  }
  cv_.notify_all();

  UPLINK_LOG_ERROR("Collector channel lost", {StringField("target", target_), StringField("reason", reason)});
  NotifyCurrentStatus();
}

void GrpcChannelManager::NotifyCurrentStatus() {
  std::lock_guard notify_lock(notify_mutex_);

  std::vector<ChannelListener*> snapshot;
  {
    std::lock_guard lock(listeners_mutex_);
    snapshot = listeners_;
  }

  const auto status = Status();
  for (auto* listener : snapshot) {
    listener->StatusChanged(status);
  }
}

} // namespace uplink::channel
