#include "sensors/memory.hpp"

#include <cstring>

#include "core/math.hpp"

namespace infer_gateway::sensors {
namespace {

constexpr double kKbPerGb = 1024.0 * 1024.0;

}  // namespace

MemorySensor::MemorySensor() : meminfo_(std::fopen("/proc/meminfo", "r")) {}

MemorySensor::MemorySensor(std::FILE* meminfo, const bool owns_file) : meminfo_(meminfo), owns_file_(owns_file) {}

MemorySensor::~MemorySensor() {
  if (owns_file_ && meminfo_ != nullptr) {
    std::fclose(meminfo_);
    meminfo_ = nullptr;
  }
}

bool MemorySensor::sample(model::TelemetrySample& sample) {
  sample.memory_percent.reset();
  sample.memory_used_gb.reset();
  sample.memory_total_gb.reset();

  RawFields raw{};
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (!parse_meminfo(raw)) {
      return false;
    }
  }

  if (raw.mem_total_kb == 0 || !raw.has_available) {
    return false;
  }

  const double total_kb = static_cast<double>(raw.mem_total_kb);
  const double used_kb = total_kb - static_cast<double>(raw.mem_available_kb);

  sample.memory_percent = core::clamp_percent((used_kb / total_kb) * 100.0);
  sample.memory_used_gb = used_kb / kKbPerGb;
  sample.memory_total_gb = total_kb / kKbPerGb;
  return true;
}

bool MemorySensor::parse_meminfo(RawFields& raw) noexcept {
  if (meminfo_ == nullptr) {
    return false;
  }

  if (std::fseek(meminfo_, 0L, SEEK_SET) != 0) {
    return false;
  }

  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), meminfo_) != nullptr) {
    char key[64]{};
    unsigned long long value = 0;
    if (std::sscanf(buffer, "%63[^:]: %llu", key, &value) != 2) {
      continue;
    }

    if (std::strcmp(key, "MemTotal") == 0) {
      raw.mem_total_kb = value;
    } else if (std::strcmp(key, "MemAvailable") == 0) {
      raw.mem_available_kb = value;
      raw.has_available = true;
    }
  }

  if (std::ferror(meminfo_) != 0) {
    std::clearerr(meminfo_);
    return false;
  }

  return true;
}

}  // namespace infer_gateway::sensors
