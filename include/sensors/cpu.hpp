#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>

#include "model/telemetry_sample.hpp"
#include "sensors/cpu_counter_state.hpp"

namespace infer_gateway::sensors {

class CpuSensor {
 public:
  explicit CpuSensor(std::shared_ptr<CpuCounterState> state);
  CpuSensor(std::FILE* file, std::shared_ptr<CpuCounterState> state, bool owns_file = false);
  ~CpuSensor();

  CpuSensor(const CpuSensor&) = delete;
  CpuSensor& operator=(const CpuSensor&) = delete;

  // Fills cpu_percent. Returns false when /proc/stat could not be read.
  bool sample(model::TelemetrySample& sample);

 private:
  static constexpr std::size_t kReadBufferSize = 512;
  static constexpr std::size_t kRequiredCounters = 8;

  std::FILE* file_{nullptr};
  bool owns_file_{true};
  std::shared_ptr<CpuCounterState> state_;
  std::mutex mutex_;
};

}  // namespace infer_gateway::sensors
