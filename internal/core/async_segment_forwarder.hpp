#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <vector>

#include "internal/buffer/consumer.hpp"
#include "internal/buffer/data_carrier.hpp"
#include "internal/segment/segment.hpp"

namespace uplink::core {

/*
  Consumer of the async segment buffer.

  Ready segments go to the upload carrier (never blocking); the rest are put
  back into the async buffer. When a batch held unfinished segments the loop
  sleeps `retry_delay` so it does not spin on them.

  Offer() only reaches the channel of the consumer thread, so an unfinished
  segment may not fit back in. Such segments are held here and go first on
  the next cycle. On exit, held segments that became ready are still handed
  to the upload carrier.
*/
class AsyncSegmentForwarder final : public buffer::IConsumer<segment::SegmentPtr> {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  AsyncSegmentForwarder(buffer::DataCarrier<segment::SegmentPtr>& upload_carrier, buffer::DataCarrier<segment::SegmentPtr>& async_buffer,
                        std::chrono::milliseconds retry_delay, Sleeper sleeper = {});

  void Consume(std::vector<segment::SegmentPtr>& batch) override;

  void OnError(const std::vector<segment::SegmentPtr>& batch, const std::exception& error) override;

  void OnExit() override;

  // Consumer thread only.
  std::size_t HeldSegments() const {
    return held_.size();
  }

 private:
  // Returns false if the segment is still unfinished.
  bool Forward(segment::SegmentPtr segment);

  buffer::DataCarrier<segment::SegmentPtr>& upload_carrier_;
  buffer::DataCarrier<segment::SegmentPtr>& async_buffer_;
  const std::chrono::milliseconds           retry_delay_;
  Sleeper                                   sleeper_;
  std::vector<segment::SegmentPtr>          held_;
};

} // namespace uplink::core
