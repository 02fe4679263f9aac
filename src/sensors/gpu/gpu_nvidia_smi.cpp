#include "sensors/gpu/gpu.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <utility>
#include <vector>

#include "core/math.hpp"
#include "core/subprocess.hpp"

namespace infer_gateway::sensors::gpu {
namespace {

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

// Whole-field parse: "[N/A]" or "12 MHz" are rejected.
std::optional<double> parse_number(const std::string& field) {
  const std::string text = trim(field);
  if (text.empty()) {
    return std::nullopt;
  }

  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::vector<std::string> non_empty_lines(const std::string& output) {
  std::vector<std::string> lines;
  std::istringstream input(output);
  std::string line;
  while (std::getline(input, line)) {
    line = trim(line);
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

class NvidiaSmiGpuSource final : public GpuMetricsSource {
 public:
  NvidiaSmiGpuSource(std::string executable, const std::chrono::milliseconds timeout)
      : executable_(std::move(executable)), timeout_(timeout) {}

  std::optional<double> utilization_percent() override {
    const auto output = query("--query-gpu=utilization.gpu");
    if (!output.has_value()) {
      return std::nullopt;
    }
    return parse_max_utilization(*output);
  }

  GpuClocks graphics_clocks() override {
    const auto output = query("--query-gpu=clocks.current.graphics,clocks.max.graphics");
    if (!output.has_value()) {
      return {};
    }
    return parse_graphics_clocks(*output);
  }

 private:
  std::optional<std::string> query(const std::string& query_arg) const {
    if (executable_.empty()) {
      return std::nullopt;
    }
    return core::run_bounded({executable_, query_arg, "--format=csv,noheader,nounits"}, timeout_);
  }

  std::string executable_;
  std::chrono::milliseconds timeout_;
};

}  // namespace

std::optional<double> parse_max_utilization(const std::string& output) {
  const auto lines = non_empty_lines(output);
  if (lines.empty()) {
    return std::nullopt;
  }

  double highest = 0.0;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto value = parse_number(lines[i]);
    if (!value.has_value()) {
      return std::nullopt;
    }
    highest = i == 0 ? *value : std::max(highest, *value);
  }
  return core::clamp_percent(highest);
}

GpuClocks parse_graphics_clocks(const std::string& output) {
  const auto lines = non_empty_lines(output);
  if (lines.empty()) {
    return {};
  }

  const std::string& first = lines.front();
  const auto comma = first.find(',');
  if (comma == std::string::npos) {
    return {};
  }

  const auto second_comma = first.find(',', comma + 1);
  const auto current = parse_number(first.substr(0, comma));
  const auto maximum = parse_number(first.substr(comma + 1, second_comma == std::string::npos
                                                                ? std::string::npos
                                                                : second_comma - comma - 1));
  if (!current.has_value() || !maximum.has_value()) {
    return {};
  }
  return GpuClocks{current, maximum};
}

std::unique_ptr<GpuMetricsSource> make_nvidia_smi_source(std::string executable,
                                                         const std::chrono::milliseconds timeout) {
  return std::make_unique<NvidiaSmiGpuSource>(std::move(executable), timeout);
}

}  // namespace infer_gateway::sensors::gpu
