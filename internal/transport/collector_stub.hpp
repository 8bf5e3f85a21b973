#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include "uplink/v1/segment.pb.h"

namespace uplink::transport {

struct StreamCallbacks {
  std::function<void()>                      on_completed;
  std::function<void(const ::grpc::Status&)> on_error;
};

/*
  Send side of one client stream. WritesDone() must be called exactly once,
  after the last Write(). Writes after the stream has failed are dropped.
*/
class UpstreamWriter {
 public:
  virtual ~UpstreamWriter() = default;

  virtual void Write(uplink::v1::UpstreamSegment segment) = 0;
  virtual void WritesDone()                               = 0;
};

/*
  Opens TraceSegmentReportService.Collect streams.

  Exactly one of the callbacks fires per stream, on a transport thread, and
  possibly after the caller has stopped waiting. A stream still open at
  `deadline` ends with DEADLINE_EXCEEDED.
*/
class CollectorStub {
 public:
  virtual ~CollectorStub() = default;

  virtual std::unique_ptr<UpstreamWriter> Collect(StreamCallbacks callbacks, std::chrono::system_clock::time_point deadline) = 0;
};

std::shared_ptr<CollectorStub> NewGrpcCollectorStub(std::shared_ptr<::grpc::Channel> channel);

} // namespace uplink::transport
