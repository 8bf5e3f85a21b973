#pragma once

#include <mutex>
#include <vector>

#include "segment.hpp"

namespace uplink::segment {

class SegmentListener {
 public:
  virtual ~SegmentListener() = default;

  virtual void AfterFinished(const SegmentPtr& segment) = 0;
};

/*
  Explicit registration list for segment completion.

  The producer side calls NotifyFinished() once per finished segment.
  Listeners are not owned and must be removed before they are destroyed.
*/
class ListenerRegistry {
 public:
  void Add(SegmentListener* listener);
  void Remove(SegmentListener* listener);

  void NotifyFinished(const SegmentPtr& segment) const;

  std::size_t Size() const;

 private:
  mutable std::mutex            mutex_;
  std::vector<SegmentListener*> listeners_;
};

} // namespace uplink::segment
