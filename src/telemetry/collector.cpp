#include "telemetry/collector.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "core/timestamp.hpp"

namespace infer_gateway::telemetry {
namespace {

template <typename Collect>
bool collect_source(const char* name, Collect&& collect) {
  try {
    return collect();
  } catch (const std::exception& ex) {
    std::cerr << "[telemetry] " << name << " source failed: " << ex.what() << '\n';
    return false;
  }
}

}  // namespace

TelemetryCollector::TelemetryCollector(Sources sources) : sources_(std::move(sources)) {}

std::uint64_t TelemetryCollector::source_failures() const noexcept {
  return source_failures_.load(std::memory_order_relaxed);
}

model::TelemetrySample TelemetryCollector::sample() {
  model::TelemetrySample sample{};
  std::uint64_t failures = 0;

  const auto count = [&failures](const bool ok) {
    if (!ok) {
      ++failures;
    }
  };

  if (sources_.memory != nullptr) {
    count(collect_source("memory", [&] { return sources_.memory->sample(sample); }));
  }

  if (sources_.gpu != nullptr) {
    count(collect_source("gpu utilization", [&] {
      sample.gpu_percent = sources_.gpu->utilization_percent();
      return sample.gpu_percent.has_value();
    }));
  }

  if (sources_.cpu != nullptr) {
    count(collect_source("cpu", [&] { return sources_.cpu->sample(sample); }));
  }

  if (sources_.cpufreq != nullptr) {
    count(collect_source("cpu clock", [&] { return sources_.cpufreq->sample(sample); }));
  }

  if (sources_.gpu != nullptr) {
    count(collect_source("gpu clock", [&] {
      const auto clocks = sources_.gpu->graphics_clocks();
      sample.gpu_clock_mhz = clocks.current_mhz;
      sample.gpu_clock_max_mhz = clocks.max_mhz;
      return clocks.current_mhz.has_value();
    }));
  }

  sample.timestamp = core::unix_timestamp_now_s();
  source_failures_.fetch_add(failures, std::memory_order_relaxed);
  return sample;
}

std::unique_ptr<TelemetryCollector> make_host_collector(const core::TelemetryConfig& config,
                                                        std::shared_ptr<sensors::CpuCounterState> cpu_state) {
  TelemetryCollector::Sources sources;
  sources.memory = std::make_unique<sensors::MemorySensor>();
  sources.cpu = std::make_unique<sensors::CpuSensor>(std::move(cpu_state));
  sources.cpufreq = std::make_unique<sensors::CpuFreqSensor>();
  sources.gpu = config.nvidia_smi.empty()
                    ? sensors::gpu::make_none_source()
                    : sensors::gpu::make_nvidia_smi_source(config.nvidia_smi, config.gpu_query_timeout);
  return std::make_unique<TelemetryCollector>(std::move(sources));
}

}  // namespace infer_gateway::telemetry
