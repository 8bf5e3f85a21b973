#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/collector/segment_sink.hpp"
#include "uplink/v1.hpp"

namespace uplink::grpc {

class CollectorServer final : public uplink::v1::TraceSegmentReportService::Service {
public:
  explicit CollectorServer(std::shared_ptr<uplink::collector::SegmentSink> sink);

  ::grpc::Status Collect(::grpc::ServerContext*,
                         ::grpc::ServerReader<uplink::v1::UpstreamSegment>*,
                         uplink::v1::Downstream*) override;

private:
  std::shared_ptr<uplink::collector::SegmentSink> sink_;
};

} // namespace uplink::grpc
