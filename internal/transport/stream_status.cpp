#include "stream_status.hpp"

namespace uplink::transport {

void StreamStatus::Finished() {
  {
    std::lock_guard lock(mutex_);
    finished_ = true;
  }
  cv_.notify_all();
}

bool StreamStatus::WaitForFinish(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return finished_; });
}

bool StreamStatus::IsFinished() const {
  std::lock_guard lock(mutex_);
  return finished_;
}

} // namespace uplink::transport
