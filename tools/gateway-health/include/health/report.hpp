#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"

namespace infer_gateway::health {

constexpr std::size_t kSnippetBytes = 800;
constexpr const char* kUsage = "Usage: gateway-health [full|compact|?compact] [config]";

enum class report_mode {
  FULL,
  COMPACT,
};

std::optional<report_mode> parse_mode(std::string_view mode);
const char* to_string(report_mode mode) noexcept;

struct Targets {
  std::string reasoning_url;
  std::string multimodal_url;
  std::string gateway_url;
  std::string reasoning_model;
  std::string multimodal_model;
};

// The gateway is probed over loopback on its configured port.
Targets make_targets(const core::GatewayConfig& config);

struct CheckResult {
  std::string name;
  std::string url;
  // 0 when no HTTP response arrived.
  int code{0};
  bool ok{false};
  std::string body;
};

struct ProbeTimeouts {
  std::chrono::seconds models{12};
  std::chrono::seconds smoke{30};
};

CheckResult check_models(const std::string& name, const std::string& base_url, std::chrono::seconds timeout);
CheckResult check_smoke(const std::string& name, const std::string& gateway_url, const nlohmann::json& payload,
                        std::chrono::seconds timeout);

nlohmann::json reasoning_smoke_payload(const std::string& model_id);
nlohmann::json multimodal_smoke_payload(const std::string& model_id);

// Models endpoints of both backends and the gateway, then one smoke
// completion per model through the gateway.
std::vector<CheckResult> run_checks(const Targets& targets, const ProbeTimeouts& timeouts = {});

nlohmann::json build_report(report_mode mode, const std::vector<CheckResult>& checks);
nlohmann::json usage_error();

}  // namespace infer_gateway::health
