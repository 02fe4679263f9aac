#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>

#include "model/telemetry_sample.hpp"

namespace infer_gateway::sensors {

class MemorySensor {
 public:
  struct RawFields {
    std::uint64_t mem_total_kb{0};
    std::uint64_t mem_available_kb{0};
    bool has_available{false};
  };

  MemorySensor();
  explicit MemorySensor(std::FILE* meminfo, bool owns_file = false);
  ~MemorySensor();

  MemorySensor(const MemorySensor&) = delete;
  MemorySensor& operator=(const MemorySensor&) = delete;

  // Fills memory_percent, memory_used_gb and memory_total_gb, or leaves all
  // three empty.
  bool sample(model::TelemetrySample& sample);

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  bool parse_meminfo(RawFields& raw) noexcept;

  std::FILE* meminfo_{nullptr};
  bool owns_file_{true};
  std::mutex mutex_;
};

}  // namespace infer_gateway::sensors
