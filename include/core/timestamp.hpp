#pragma once

#include <chrono>
#include <cstdint>

namespace infer_gateway::core {

inline std::int64_t unix_timestamp_now_s() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

}  // namespace infer_gateway::core
