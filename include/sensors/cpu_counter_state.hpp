#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

namespace infer_gateway::sensors {

// Process-wide /proc/stat baseline. Every read-modify-write happens under
// one lock so concurrent snapshots cannot lose or regress an update.
class CpuCounterState {
 public:
  struct Baseline {
    std::uint64_t total{0};
    std::uint64_t idle{0};
  };

  // Records an observation and returns the busy percentage since the stored
  // baseline. Returns nullopt when there is no baseline yet (the observation
  // becomes the baseline) or when total did not advance (the baseline is
  // left untouched).
  std::optional<double> advance(std::uint64_t total, std::uint64_t idle);

  [[nodiscard]] std::optional<Baseline> baseline() const;

 private:
  mutable std::mutex mutex_;
  std::optional<Baseline> prev_{};
};

}  // namespace infer_gateway::sensors
