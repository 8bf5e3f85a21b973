#include "segment_listener.hpp"

#include <algorithm>

namespace uplink::segment {

void ListenerRegistry::Add(SegmentListener* listener) {
  if (listener == nullptr) return;

  std::lock_guard lock(mutex_);
  if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
    listeners_.push_back(listener);
  }
}

void ListenerRegistry::Remove(SegmentListener* listener) {
  std::lock_guard lock(mutex_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void ListenerRegistry::NotifyFinished(const SegmentPtr& segment) const {
  if (!segment) return;

  std::vector<SegmentListener*> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = listeners_;
  }
  for (auto* listener : snapshot) {
    listener->AfterFinished(segment);
  }
}

std::size_t ListenerRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return listeners_.size();
}

} // namespace uplink::segment
