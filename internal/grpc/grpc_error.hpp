#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace uplink::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace uplink::grpc
