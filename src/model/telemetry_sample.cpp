#include "model/telemetry_sample.hpp"

namespace infer_gateway::model {
namespace {

nlohmann::json optional_value(const std::optional<double>& value) {
  if (!value.has_value()) {
    return nullptr;
  }
  return *value;
}

}  // namespace

nlohmann::json to_json(const TelemetrySample& sample) {
  return nlohmann::json{{"memory_percent", optional_value(sample.memory_percent)},
                        {"memory_used_gb", optional_value(sample.memory_used_gb)},
                        {"memory_total_gb", optional_value(sample.memory_total_gb)},
                        {"gpu_percent", optional_value(sample.gpu_percent)},
                        {"cpu_percent", optional_value(sample.cpu_percent)},
                        {"cpu_clock_mhz", optional_value(sample.cpu_clock_mhz)},
                        {"cpu_clock_max_mhz", optional_value(sample.cpu_clock_max_mhz)},
                        {"gpu_clock_mhz", optional_value(sample.gpu_clock_mhz)},
                        {"gpu_clock_max_mhz", optional_value(sample.gpu_clock_max_mhz)},
                        {"ts", sample.timestamp}};
}

}  // namespace infer_gateway::model
