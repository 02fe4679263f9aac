#pragma once

#include <cstdio>
#include <mutex>
#include <optional>

#include "model/telemetry_sample.hpp"

namespace infer_gateway::sensors {

class CpuFreqSensor {
 public:
  // Any source may be null when the host does not expose it.
  struct Sources {
    std::FILE* cpuinfo{nullptr};
    std::FILE* scaling_cur_freq{nullptr};
    std::FILE* cpuinfo_cur_freq{nullptr};
    std::FILE* cpuinfo_max_freq{nullptr};
    std::FILE* scaling_max_freq{nullptr};
  };

  CpuFreqSensor();
  explicit CpuFreqSensor(Sources sources, bool owns_files = false);
  ~CpuFreqSensor();

  CpuFreqSensor(const CpuFreqSensor&) = delete;
  CpuFreqSensor& operator=(const CpuFreqSensor&) = delete;

  // Fills cpu_clock_mhz and cpu_clock_max_mhz.
  bool sample(model::TelemetrySample& sample);

 private:
  static constexpr std::size_t kReadBufferSize = 4096;

  std::optional<double> average_cpuinfo_mhz() noexcept;
  static std::optional<double> read_khz_as_mhz(std::FILE* file) noexcept;

  Sources sources_{};
  bool owns_files_{true};
  std::mutex mutex_;
};

}  // namespace infer_gateway::sensors
