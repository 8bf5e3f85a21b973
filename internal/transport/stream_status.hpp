#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace uplink::transport {

/*
  Completion flag of one upload stream.

  Finished() is called from a transport thread when the collector completes
  or fails the stream; the sender waits on it with a bound.
*/
class StreamStatus {
 public:
  void Finished();

  // True if Finished() happened within `timeout`.
  bool WaitForFinish(std::chrono::milliseconds timeout);

  bool IsFinished() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    finished_ = false;
};

} // namespace uplink::transport
