#include "segment_sink.hpp"

#include "internal/util/errors.hpp"

namespace uplink::collector {

SegmentSink::SegmentSink(std::size_t recent_capacity) : recent_capacity_(recent_capacity) {
}

uplink::v1::SegmentObject SegmentSink::Accept(const uplink::v1::UpstreamSegment& upstream) {
  uplink::v1::SegmentObject object;
  if (!object.ParseFromString(upstream.segment())) {
    throw util::InvalidSegment("segment body of trace " + upstream.trace_id() + " does not decode");
  }
  if (object.trace_segment_id().empty()) {
    throw util::InvalidSegment("segment of trace " + upstream.trace_id() + " has no id");
  }

  std::lock_guard lock(mutex_);
  totals_.segments += 1;
  totals_.spans += static_cast<std::uint64_t>(object.spans_size());
  if (recent_capacity_ > 0) {
    if (recent_.size() == recent_capacity_) recent_.pop_front();
    recent_.push_back(object.trace_segment_id());
  }
  return object;
}

void SegmentSink::StreamFinished() {
  std::lock_guard lock(mutex_);
  totals_.streams += 1;
}

SegmentSink::Totals SegmentSink::Snapshot() const {
  std::lock_guard lock(mutex_);
  return totals_;
}

std::vector<std::string> SegmentSink::RecentSegmentIds() const {
  std::lock_guard lock(mutex_);
  return {recent_.begin(), recent_.end()};
}

} // namespace uplink::collector
