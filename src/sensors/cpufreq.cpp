#include "sensors/cpufreq.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

namespace infer_gateway::sensors {
namespace {

constexpr const char* kCpuFreqDir = "/sys/devices/system/cpu/cpu0/cpufreq/";

std::FILE* open_cpufreq(const char* name) {
  const std::string path = std::string(kCpuFreqDir) + name;
  return std::fopen(path.c_str(), "r");
}

bool starts_with_cpu_mhz(const char* line) noexcept {
  constexpr const char* kPrefix = "cpu mhz";
  for (std::size_t i = 0; kPrefix[i] != '\0'; ++i) {
    if (line[i] == '\0' || std::tolower(static_cast<unsigned char>(line[i])) != kPrefix[i]) {
      return false;
    }
  }
  return true;
}

std::optional<double> parse_double(const char* text) noexcept {
  while (*text == ' ' || *text == '\t') {
    ++text;
  }

  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(text, &end);
  if (errno != 0 || end == text || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

void close_if_open(std::FILE*& file) noexcept {
  if (file != nullptr) {
    std::fclose(file);
    file = nullptr;
  }
}

}  // namespace

CpuFreqSensor::CpuFreqSensor()
    : sources_{std::fopen("/proc/cpuinfo", "r"), open_cpufreq("scaling_cur_freq"), open_cpufreq("cpuinfo_cur_freq"),
               open_cpufreq("cpuinfo_max_freq"), open_cpufreq("scaling_max_freq")},
      owns_files_(true) {}

CpuFreqSensor::CpuFreqSensor(Sources sources, const bool owns_files)
    : sources_(std::move(sources)), owns_files_(owns_files) {}

CpuFreqSensor::~CpuFreqSensor() {
  if (!owns_files_) {
    return;
  }

  close_if_open(sources_.cpuinfo);
  close_if_open(sources_.scaling_cur_freq);
  close_if_open(sources_.cpuinfo_cur_freq);
  close_if_open(sources_.cpuinfo_max_freq);
  close_if_open(sources_.scaling_max_freq);
}

bool CpuFreqSensor::sample(model::TelemetrySample& sample) {
  const std::lock_guard<std::mutex> lock(mutex_);

  std::optional<double> current_mhz = average_cpuinfo_mhz();
  if (!current_mhz.has_value()) {
    current_mhz = read_khz_as_mhz(sources_.scaling_cur_freq);
  }
  if (!current_mhz.has_value()) {
    current_mhz = read_khz_as_mhz(sources_.cpuinfo_cur_freq);
  }

  std::optional<double> max_mhz = read_khz_as_mhz(sources_.cpuinfo_max_freq);
  if (!max_mhz.has_value()) {
    max_mhz = read_khz_as_mhz(sources_.scaling_max_freq);
  }
  if (!max_mhz.has_value()) {
    max_mhz = current_mhz;
  }

  sample.cpu_clock_mhz = current_mhz;
  sample.cpu_clock_max_mhz = max_mhz;
  return current_mhz.has_value() || max_mhz.has_value();
}

std::optional<double> CpuFreqSensor::average_cpuinfo_mhz() noexcept {
  std::FILE* cpuinfo = sources_.cpuinfo;
  if (cpuinfo == nullptr || std::fseek(cpuinfo, 0L, SEEK_SET) != 0) {
    return std::nullopt;
  }

  double total_mhz = 0.0;
  std::size_t count = 0;
  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), cpuinfo) != nullptr) {
    if (!starts_with_cpu_mhz(buffer)) {
      continue;
    }

    const char* colon = std::strchr(buffer, ':');
    if (colon == nullptr) {
      continue;
    }

    if (const auto mhz = parse_double(colon + 1); mhz.has_value()) {
      total_mhz += *mhz;
      ++count;
    }
  }
  std::clearerr(cpuinfo);

  if (count == 0) {
    return std::nullopt;
  }
  return total_mhz / static_cast<double>(count);
}

std::optional<double> CpuFreqSensor::read_khz_as_mhz(std::FILE* file) noexcept {
  if (file == nullptr || std::fseek(file, 0L, SEEK_SET) != 0) {
    return std::nullopt;
  }

  char value_buffer[64]{};
  if (std::fgets(value_buffer, static_cast<int>(sizeof(value_buffer)), file) == nullptr) {
    std::clearerr(file);
    return std::nullopt;
  }

  const auto khz = parse_double(value_buffer);
  if (!khz.has_value()) {
    return std::nullopt;
  }
  return *khz / 1000.0;
}

}  // namespace infer_gateway::sensors
