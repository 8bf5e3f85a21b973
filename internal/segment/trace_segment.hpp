#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "segment.hpp"
#include "uplink/v1/segment.pb.h"

namespace uplink::segment {

/*
  In-process segment: a list of already finished spans plus a count of
  asynchronous parts that have not completed yet.

  Spans may be appended from any thread (async parts usually finish on a
  different thread than the one that created the segment).
*/
class TraceSegment final : public Segment {
 public:
  TraceSegment(std::string trace_id, std::string trace_segment_id, std::string service, std::string service_instance);

  void AddSpan(uplink::v1::SpanObject span);

  void BeginAsync();
  void EndAsync();

  void SetIgnored(bool ignored);
  void SetSizeLimited(bool size_limited);

  bool IsReadyToTransform() const override;
  bool IsIgnored() const override;

  uplink::v1::UpstreamSegment Transform() const override;

  const std::string& trace_id() const {
    return trace_id_;
  }

  std::size_t SpanCount() const;

 private:
  const std::string trace_id_;
  const std::string trace_segment_id_;
  const std::string service_;
  const std::string service_instance_;

  mutable std::mutex                   mutex_;
  std::vector<uplink::v1::SpanObject>  spans_;
  bool                                 size_limited_ = false;

  std::atomic<int32_t> pending_async_{0};
  std::atomic<bool>    ignored_{false};
};

} // namespace uplink::segment
