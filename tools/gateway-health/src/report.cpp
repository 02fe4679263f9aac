#include "health/report.hpp"

#include <algorithm>

#include <httplib.h>

#include "dispatch/forwarder.hpp"

namespace infer_gateway::health {
namespace {

struct Exchange {
  int code{0};
  std::string body;
};

Exchange exchange(const std::string& base_url, const std::string& path, const std::optional<std::string>& body,
                  const std::chrono::seconds timeout) {
  const auto backend = dispatch::split_backend_url(base_url);
  if (!backend.has_value()) {
    return {};
  }

  httplib::Client client(backend->origin);
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);

  const std::string target = backend->path_prefix + path;
  auto result = body.has_value() ? client.Post(target, *body, "application/json") : client.Get(target);
  if (!result) {
    return {};
  }
  return Exchange{result->status, result->body};
}

}  // namespace

std::optional<report_mode> parse_mode(const std::string_view mode) {
  if (mode == "full") {
    return report_mode::FULL;
  }
  if (mode == "compact" || mode == "?compact") {
    return report_mode::COMPACT;
  }
  return std::nullopt;
}

const char* to_string(const report_mode mode) noexcept {
  return mode == report_mode::COMPACT ? "compact" : "full";
}

Targets make_targets(const core::GatewayConfig& config) {
  return Targets{
      .reasoning_url = config.reasoning.url,
      .multimodal_url = config.multimodal.url,
      .gateway_url = "http://127.0.0.1:" + std::to_string(config.port),
      .reasoning_model = config.reasoning.model_id,
      .multimodal_model = config.multimodal.model_id,
  };
}

CheckResult check_models(const std::string& name, const std::string& base_url, const std::chrono::seconds timeout) {
  auto response = exchange(base_url, "/v1/models", std::nullopt, timeout);
  const bool ok = response.code == 200;
  return CheckResult{name, base_url + "/v1/models", response.code, ok, std::move(response.body)};
}

CheckResult check_smoke(const std::string& name, const std::string& gateway_url, const nlohmann::json& payload,
                        const std::chrono::seconds timeout) {
  auto response = exchange(gateway_url, "/v1/chat/completions", payload.dump(), timeout);
  const bool ok = response.code == 200 && response.body.find("choices") != std::string::npos;
  return CheckResult{name, gateway_url + "/v1/chat/completions", response.code, ok, std::move(response.body)};
}

nlohmann::json reasoning_smoke_payload(const std::string& model_id) {
  return {{"model", model_id},
          {"messages", nlohmann::json::array({{{"role", "user"}, {"content", "Reply with READY_REASONING"}}})},
          {"max_tokens", 16}};
}

nlohmann::json multimodal_smoke_payload(const std::string& model_id) {
  const nlohmann::json content = nlohmann::json::array({{{"type", "text"}, {"text", "Reply with READY_MM"}}});
  return {{"model", model_id},
          {"messages", nlohmann::json::array({{{"role", "user"}, {"content", content}}})},
          {"max_tokens", 16}};
}

std::vector<CheckResult> run_checks(const Targets& targets, const ProbeTimeouts& timeouts) {
  std::vector<CheckResult> checks;
  checks.push_back(check_models("reasoning_models", targets.reasoning_url, timeouts.models));
  checks.push_back(check_models("multimodal_models", targets.multimodal_url, timeouts.models));
  checks.push_back(check_models("gateway_models", targets.gateway_url, timeouts.models));
  checks.push_back(check_smoke("reasoning_smoke", targets.gateway_url, reasoning_smoke_payload(targets.reasoning_model),
                               timeouts.smoke));
  checks.push_back(check_smoke("multimodal_smoke", targets.gateway_url,
                               multimodal_smoke_payload(targets.multimodal_model), timeouts.smoke));
  return checks;
}

nlohmann::json build_report(const report_mode mode, const std::vector<CheckResult>& checks) {
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& check : checks) {
    nlohmann::json row{{"name", check.name}, {"url", check.url}, {"code", check.code}, {"ok", check.ok}};
    if (mode == report_mode::FULL) {
      row["body_snippet"] = check.body.substr(0, std::min(check.body.size(), kSnippetBytes));
    }
    rows.push_back(std::move(row));
  }

  const bool all_ok = std::all_of(checks.begin(), checks.end(), [](const CheckResult& check) { return check.ok; });
  return {{"ok", all_ok}, {"mode", to_string(mode)}, {"checks", std::move(rows)}};
}

nlohmann::json usage_error() { return {{"ok", false}, {"error", kUsage}}; }

}  // namespace infer_gateway::health
