#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "core/config.hpp"
#include "model/telemetry_sample.hpp"
#include "sensors/cpu.hpp"
#include "sensors/cpu_counter_state.hpp"
#include "sensors/cpufreq.hpp"
#include "sensors/gpu/gpu.hpp"
#include "sensors/memory.hpp"

namespace infer_gateway::telemetry {

// Composes the host metric sources into one TelemetrySample. Each source is
// collected independently; a failing source only empties its own fields.
class TelemetryCollector {
 public:
  struct Sources {
    std::unique_ptr<sensors::MemorySensor> memory;
    std::unique_ptr<sensors::CpuSensor> cpu;
    std::unique_ptr<sensors::CpuFreqSensor> cpufreq;
    std::unique_ptr<sensors::gpu::GpuMetricsSource> gpu;
  };

  explicit TelemetryCollector(Sources sources);

  model::TelemetrySample sample();

  // Sources that produced no value, summed over all samples.
  [[nodiscard]] std::uint64_t source_failures() const noexcept;

 private:
  Sources sources_;
  std::atomic<std::uint64_t> source_failures_{0};
};

std::unique_ptr<TelemetryCollector> make_host_collector(const core::TelemetryConfig& config,
                                                        std::shared_ptr<sensors::CpuCounterState> cpu_state);

}  // namespace infer_gateway::telemetry
