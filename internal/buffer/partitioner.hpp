#pragma once

#include <atomic>
#include <cstddef>

namespace uplink::buffer {

/*
  Channel selection for DataCarrier::Produce.

  kProducerThread keeps every producer thread on one channel, so records of a
  single producer stay FIFO. kRolling spreads load evenly.
*/
enum class Partitioner {
  kProducerThread,
  kRolling,
};

std::size_t SelectChannel(Partitioner partitioner, std::size_t channel_count, std::atomic<std::size_t>& rolling_index);

} // namespace uplink::buffer
