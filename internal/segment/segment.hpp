#pragma once

#include <memory>

#include "uplink/v1/segment.pb.h"

namespace uplink::segment {

/*
  A finished unit of trace data handed to the uplink.

  Some segments still have asynchronous parts running when they are handed
  over; they must not be serialized until IsReadyToTransform() turns true.
  Implementations must make both methods safe to call from any thread.
*/
class Segment {
 public:
  virtual ~Segment() = default;

  virtual bool IsReadyToTransform() const = 0;

  // Throws util::TransformError when the segment cannot be serialized.
  virtual uplink::v1::UpstreamSegment Transform() const = 0;

  // Ignored segments are dropped before they reach any buffer.
  virtual bool IsIgnored() const {
    return false;
  }
};

using SegmentPtr = std::shared_ptr<Segment>;

} // namespace uplink::segment
