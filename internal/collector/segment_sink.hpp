#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "uplink/v1/segment.pb.h"

namespace uplink::collector {

/*
  Terminal store of the collector: decodes and counts received segments and
  remembers the ids of the most recent ones.
*/
class SegmentSink {
 public:
  struct Totals {
    std::uint64_t segments = 0;
    std::uint64_t spans    = 0;
    std::uint64_t streams  = 0;
  };

  explicit SegmentSink(std::size_t recent_capacity = 64);

  // Throws util::InvalidSegment when the body is not a SegmentObject.
  uplink::v1::SegmentObject Accept(const uplink::v1::UpstreamSegment& upstream);

  void StreamFinished();

  Totals Snapshot() const;

  std::vector<std::string> RecentSegmentIds() const;

 private:
  const std::size_t recent_capacity_;

  mutable std::mutex      mutex_;
  Totals                  totals_;
  std::deque<std::string> recent_;
};

} // namespace uplink::collector
