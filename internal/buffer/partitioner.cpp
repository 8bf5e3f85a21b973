#include "partitioner.hpp"

#include <functional>
#include <thread>

namespace uplink::buffer {

std::size_t SelectChannel(Partitioner partitioner, std::size_t channel_count, std::atomic<std::size_t>& rolling_index) {
  if (channel_count <= 1) return 0;

  switch (partitioner) {
    case Partitioner::kRolling:
      return rolling_index.fetch_add(1, std::memory_order_relaxed) % channel_count;
    case Partitioner::kProducerThread:
      break;
  }
  return std::hash<std::thread::id>{}(std::this_thread::get_id()) % channel_count;
}

} // namespace uplink::buffer
