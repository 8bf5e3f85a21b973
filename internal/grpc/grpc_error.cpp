#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace uplink::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace uplink::util;

  if (dynamic_cast<const InvalidSegment*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const TransformError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidConfig*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace uplink::grpc
