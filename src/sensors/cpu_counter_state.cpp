#include "sensors/cpu_counter_state.hpp"

#include "core/math.hpp"

namespace infer_gateway::sensors {

std::optional<double> CpuCounterState::advance(const std::uint64_t total, const std::uint64_t idle) {
  const std::lock_guard<std::mutex> lock(mutex_);

  if (!prev_.has_value()) {
    prev_ = Baseline{total, idle};
    return std::nullopt;
  }

  if (total <= prev_->total) {
    return std::nullopt;
  }

  const std::uint64_t total_delta = total - prev_->total;
  const std::uint64_t idle_delta = idle >= prev_->idle ? (idle - prev_->idle) : 0;
  prev_ = Baseline{total, idle};

  const double busy = static_cast<double>(total_delta) - static_cast<double>(idle_delta);
  return core::clamp_percent((busy / static_cast<double>(total_delta)) * 100.0);
}

std::optional<CpuCounterState::Baseline> CpuCounterState::baseline() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return prev_;
}

}  // namespace infer_gateway::sensors
