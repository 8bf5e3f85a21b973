#include "collector_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace uplink::grpc {

CollectorServer::CollectorServer(std::shared_ptr<uplink::collector::SegmentSink> sink)
    : sink_(std::move(sink)) {}

::grpc::Status CollectorServer::Collect(::grpc::ServerContext*,
                                        ::grpc::ServerReader<uplink::v1::UpstreamSegment>* reader,
                                        uplink::v1::Downstream*) {
  uplink::v1::UpstreamSegment upstream;
  try {
    while (reader->Read(&upstream)) {
      sink_->Accept(upstream);
    }
    sink_->StreamFinished();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    UPLINK_LOG_WARN("Rejected upstream segment", {observability::StringField("trace_id", upstream.trace_id()),
                                                  observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

} // namespace uplink::grpc
