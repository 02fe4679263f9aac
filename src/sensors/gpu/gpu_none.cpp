#include "sensors/gpu/gpu.hpp"

#include <memory>

namespace infer_gateway::sensors::gpu {
namespace {

class NoneGpuSource final : public GpuMetricsSource {
 public:
  std::optional<double> utilization_percent() override { return std::nullopt; }

  GpuClocks graphics_clocks() override { return {}; }
};

}  // namespace

std::unique_ptr<GpuMetricsSource> make_none_source() { return std::make_unique<NoneGpuSource>(); }

}  // namespace infer_gateway::sensors::gpu
