#pragma once

#include <string_view>

namespace uplink::buffer {

/*
  What Produce() does when the selected channel is full.

    kBlocking   - the caller waits for space (or for shutdown)
    kIfPossible - the item is rejected immediately
*/
enum class BufferStrategy {
  kBlocking,
  kIfPossible,
};

inline std::string_view ToString(BufferStrategy strategy) {
  switch (strategy) {
    case BufferStrategy::kBlocking:
      return "BLOCKING";
    case BufferStrategy::kIfPossible:
      return "IF_POSSIBLE";
  }
  return "UNKNOWN";
}

} // namespace uplink::buffer
