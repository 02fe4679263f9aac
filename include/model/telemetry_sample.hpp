#pragma once

#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

namespace infer_gateway::model {

// One point-in-time reading of host utilization. Every metric is
// independently optional; an unavailable source leaves its fields empty.
struct TelemetrySample {
  std::optional<double> memory_percent;
  std::optional<double> memory_used_gb;
  std::optional<double> memory_total_gb;
  std::optional<double> gpu_percent;
  std::optional<double> cpu_percent;
  std::optional<double> cpu_clock_mhz;
  std::optional<double> cpu_clock_max_mhz;
  std::optional<double> gpu_clock_mhz;
  std::optional<double> gpu_clock_max_mhz;
  std::int64_t timestamp{0};
};

nlohmann::json to_json(const TelemetrySample& sample);

}  // namespace infer_gateway::model
