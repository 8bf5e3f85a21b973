#include "trace_segment.hpp"

#include "internal/util/errors.hpp"

namespace uplink::segment {

TraceSegment::TraceSegment(std::string trace_id, std::string trace_segment_id, std::string service, std::string service_instance)
    : trace_id_(std::move(trace_id)),
      trace_segment_id_(std::move(trace_segment_id)),
      service_(std::move(service)),
      service_instance_(std::move(service_instance)) {
}

void TraceSegment::AddSpan(uplink::v1::SpanObject span) {
  std::lock_guard lock(mutex_);
  spans_.push_back(std::move(span));
}

void TraceSegment::BeginAsync() {
  pending_async_.fetch_add(1);
}

void TraceSegment::EndAsync() {
  // unbalanced EndAsync must not drive the count negative
  auto current = pending_async_.load();
  while (current > 0 && !pending_async_.compare_exchange_weak(current, current - 1)) {
  }
}

void TraceSegment::SetIgnored(bool ignored) {
  ignored_ = ignored;
}

void TraceSegment::SetSizeLimited(bool size_limited) {
  std::lock_guard lock(mutex_);
  size_limited_ = size_limited;
}

bool TraceSegment::IsReadyToTransform() const {
  return pending_async_.load() == 0;
}

bool TraceSegment::IsIgnored() const {
  return ignored_.load();
}

std::size_t TraceSegment::SpanCount() const {
  std::lock_guard lock(mutex_);
  return spans_.size();
}

uplink::v1::UpstreamSegment TraceSegment::Transform() const {
  uplink::v1::SegmentObject object;
  object.set_trace_segment_id(trace_segment_id_);
  object.set_service(service_);
  object.set_service_instance(service_instance_);
  {
    std::lock_guard lock(mutex_);
    if (spans_.empty()) {
      throw util::TransformError("segment " + trace_segment_id_ + " has no spans");
    }
    for (const auto& span : spans_) {
      *object.add_spans() = span;
    }
    object.set_is_size_limited(size_limited_);
  }

  uplink::v1::UpstreamSegment upstream;
  upstream.set_trace_id(trace_id_);
  if (!object.SerializeToString(upstream.mutable_segment())) {
    throw util::TransformError("failed to serialize segment " + trace_segment_id_);
  }
  return upstream;
}

} // namespace uplink::segment
