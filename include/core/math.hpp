#pragma once

#include <algorithm>

namespace infer_gateway::core {

inline constexpr double clamp_percent(const double value) noexcept {
  return std::clamp(value, 0.0, 100.0);
}

}  // namespace infer_gateway::core
