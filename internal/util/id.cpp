#include "id.hpp"

#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>

namespace uplink::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::string NewTraceId() {
  return ToString(GenerateUUID());
}

std::string NewSegmentId(const std::string& trace_id) {
  static std::atomic<uint64_t> sequence{0};
  return trace_id + "." + std::to_string(sequence.fetch_add(1, std::memory_order_relaxed));
}

} // namespace uplink::util
