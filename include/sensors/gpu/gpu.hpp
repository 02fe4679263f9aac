#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace infer_gateway::sensors::gpu {

struct GpuClocks {
  std::optional<double> current_mhz;
  std::optional<double> max_mhz;
};

// Capability interface for GPU metrics. Implementations never throw; an
// unavailable metric is returned as nullopt.
class GpuMetricsSource {
 public:
  // Highest utilization across devices, in [0,100].
  virtual std::optional<double> utilization_percent() = 0;
  // Graphics clocks of the first device.
  virtual GpuClocks graphics_clocks() = 0;
  virtual ~GpuMetricsSource() = default;
};

std::unique_ptr<GpuMetricsSource> make_nvidia_smi_source(std::string executable = "nvidia-smi",
                                                         std::chrono::milliseconds timeout = std::chrono::seconds(2));
std::unique_ptr<GpuMetricsSource> make_none_source();

// Parsers for `--format=csv,noheader,nounits` output.
std::optional<double> parse_max_utilization(const std::string& output);
GpuClocks parse_graphics_clocks(const std::string& output);

}  // namespace infer_gateway::sensors::gpu
