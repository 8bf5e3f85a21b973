#pragma once

#include <exception>
#include <vector>

namespace uplink::buffer {

/*
  Batch consumer driven by a DataCarrier loop.

  All four hooks run on the carrier's consumer thread. Consume() may keep or
  move out of the batch elements; the carrier clears the vector afterwards.
*/
template <typename T>
class IConsumer {
 public:
  virtual ~IConsumer() = default;

  virtual void Init() {
  }

  virtual void Consume(std::vector<T>& batch) = 0;

  // Called with the same batch when Consume() throws.
  virtual void OnError(const std::vector<T>& batch, const std::exception& error) = 0;

  // Called once, after the final drain on shutdown.
  virtual void OnExit() {
  }
};

} // namespace uplink::buffer
