#pragma once

#include <stdexcept>
#include <string>

namespace uplink::util {

/*
  Central error types.

  Segment-side failures never leave the uplink loop; server-side they are
  translated to gRPC status codes.
*/

class TransformError : public std::runtime_error {
 public:
  explicit TransformError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidSegment : public std::runtime_error {
 public:
  explicit InvalidSegment(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace uplink::util
