#include "sensors/cpu.hpp"

#include <cerrno>
#include <cstdlib>
#include <utility>

namespace infer_gateway::sensors {

CpuSensor::CpuSensor(std::shared_ptr<CpuCounterState> state)
    : file_(std::fopen("/proc/stat", "r")), owns_file_(true), state_(std::move(state)) {}

CpuSensor::CpuSensor(std::FILE* file, std::shared_ptr<CpuCounterState> state, const bool owns_file)
    : file_(file), owns_file_(owns_file), state_(std::move(state)) {}

CpuSensor::~CpuSensor() {
  if (owns_file_ && file_ != nullptr) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool CpuSensor::sample(model::TelemetrySample& sample) {
  sample.cpu_percent.reset();

  const std::lock_guard<std::mutex> lock(mutex_);
  if (file_ == nullptr || state_ == nullptr) {
    return false;
  }

  if (std::fseek(file_, 0L, SEEK_SET) != 0) {
    return false;
  }

  char buffer[kReadBufferSize]{};
  if (std::fgets(buffer, static_cast<int>(sizeof(buffer)), file_) == nullptr) {
    std::clearerr(file_);
    return false;
  }

  const char* cursor = buffer;
  if (cursor[0] != 'c' || cursor[1] != 'p' || cursor[2] != 'u' || cursor[3] != ' ') {
    return false;
  }
  cursor += 4;

  // user nice system idle iowait irq softirq steal [guest guest_nice]
  std::uint64_t values[10]{};
  std::size_t parsed_count = 0;
  for (std::size_t i = 0; i < 10; ++i) {
    while (*cursor == ' ') {
      ++cursor;
    }
    if (*cursor == '\0' || *cursor == '\n') {
      break;
    }

    char* end = nullptr;
    errno = 0;
    const unsigned long long parsed = std::strtoull(cursor, &end, 10);
    if (errno != 0 || end == cursor) {
      return false;
    }
    values[i] = parsed;
    ++parsed_count;
    cursor = end;
  }

  if (parsed_count < kRequiredCounters) {
    return false;
  }

  const std::uint64_t idle = values[3] + values[4];
  const std::uint64_t non_idle = values[0] + values[1] + values[2] + values[5] + values[6] + values[7];
  sample.cpu_percent = state_->advance(idle + non_idle, idle);
  return true;
}

}  // namespace infer_gateway::sensors
