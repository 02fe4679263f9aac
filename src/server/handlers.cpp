#include "server/handlers.hpp"

#include <utility>

namespace infer_gateway::server {
namespace {

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n\f\v");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n\f\v");
  return value.substr(begin, end - begin + 1);
}

bool truthy(const nlohmann::json& value) {
  if (value.is_null()) {
    return false;
  }
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number()) {
    return value.get<double>() != 0.0;
  }
  if (value.is_string() || value.is_array() || value.is_object()) {
    return !value.empty();
  }
  return false;
}

const nlohmann::json& field(const nlohmann::json& payload, const char* name) {
  static const nlohmann::json kNull = nullptr;
  const auto it = payload.find(name);
  return it == payload.end() ? kNull : *it;
}

std::string text_field(const nlohmann::json& payload) {
  const auto& text = field(payload, "text");
  if (text.is_null()) {
    return {};
  }
  return trim(text.is_string() ? text.get<std::string>() : text.dump());
}

std::optional<std::string> non_empty_string(const nlohmann::json& value) {
  if (!value.is_string() || value.get_ref<const std::string&>().empty()) {
    return std::nullopt;
  }
  return value.get<std::string>();
}

nlohmann::json probabilities_json(const model::RouteDecision& decision) {
  nlohmann::json probabilities = nlohmann::json::object();
  for (const auto& [model_id, probability] : decision.probability_distribution) {
    probabilities[model_id] = probability;
  }
  return probabilities;
}

}  // namespace

HttpReply json_reply(const int status, const nlohmann::json& payload) {
  return HttpReply{status, "application/json", payload.dump()};
}

HttpReply error_reply(const int status, const std::string& message) {
  return json_reply(status, nlohmann::json{{"error", message}});
}

std::optional<nlohmann::json> parse_json_object(const std::string& body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }

  try {
    auto payload = nlohmann::json::parse(body);
    if (!payload.is_object()) {
      return std::nullopt;
    }
    return payload;
  } catch (const nlohmann::json::parse_error&) {
    return std::nullopt;
  }
}

HttpReply health_reply() { return json_reply(200, nlohmann::json{{"status", "ok"}}); }

HttpReply models_reply(const model::ModelCatalog& catalog) {
  const auto entry = [](const std::string& id, const char* owned_by) {
    return nlohmann::json{{"id", id}, {"object", "model"}, {"owned_by", owned_by}};
  };

  return json_reply(200, nlohmann::json{{"object", "list"},
                                        {"data", nlohmann::json::array({entry(catalog.reasoning.canonical_id, "nvidia"),
                                                                        entry(catalog.reasoning.alias, "local"),
                                                                        entry(catalog.multimodal.canonical_id, "nvidia"),
                                                                        entry(catalog.multimodal.alias, "local")})}});
}

RouteHandler::RouteHandler(model::ModelCatalog catalog, std::shared_ptr<const dispatch::DispatchForwarder> forwarder)
    : classifier_(std::move(catalog)), forwarder_(std::move(forwarder)) {}

HttpReply RouteHandler::handle(const nlohmann::json& payload) const {
  const std::string text = text_field(payload);
  if (text.empty()) {
    return error_reply(400, "text is required");
  }

  const auto image_url = non_empty_string(field(payload, "image_url"));
  const auto image_path = non_empty_string(field(payload, "image_path"));
  const bool has_image =
      truthy(field(payload, "has_image")) || truthy(field(payload, "image_url")) || truthy(field(payload, "image_path"));

  const auto decision = classifier_.classify(text, has_image);
  const auto& target = decision.target_model;
  const auto worker = forwarder_->invoke(target, text, image_url, image_path);

  std::string worker_status;
  nlohmann::json worker_response;
  if (worker.ok) {
    worker_status = "ok";
    worker_response = {{"details",
                        {{"target_model", target.canonical_id},
                         {"target_alias", target.alias},
                         {"result", {{"text", worker.text}, {"used_precision", "runtime"}, {"raw", worker.raw}}}}}};
  } else {
    const std::string error = worker.error.empty() ? "unknown" : worker.error;
    worker_status = "error: " + error;
    worker_response = {{"details", {{"error", error}}}};
  }

  return json_reply(200, nlohmann::json{{"model", target.canonical_id},
                                        {"confidence", decision.confidence},
                                        {"source", model::to_string(decision.source)},
                                        {"probabilities", probabilities_json(decision)},
                                        {"top_k_models", decision.ranked_candidates},
                                        {"dispatch_target", target.alias},
                                        {"dispatch_backend", kDispatchBackend},
                                        {"worker_invoked", true},
                                        {"worker_status", worker_status},
                                        {"worker_response", worker_response}});
}

PassthroughHandler::PassthroughHandler(model::ModelCatalog catalog,
                                       std::shared_ptr<const dispatch::DispatchForwarder> forwarder)
    : resolver_(std::move(catalog)), forwarder_(std::move(forwarder)) {}

HttpReply PassthroughHandler::handle(const std::string& path, const std::string& raw_body,
                                     const nlohmann::json& payload,
                                     const std::optional<std::string>& authorization) const {
  const auto& model_name = field(payload, "model");
  if (!truthy(model_name)) {
    return error_reply(400, "Request must include model");
  }

  const auto backend = model_name.is_string() ? resolver_.resolve(model_name.get<std::string>()) : std::nullopt;
  if (!backend.has_value()) {
    return error_reply(400, resolver_.unknown_model_message());
  }

  const auto forwarded = forwarder_->relay(*backend, path, "POST", raw_body, authorization);
  return HttpReply{forwarded.status_code.value_or(502), forwarded.content_type.value_or("application/json"),
                   forwarded.body.value_or(std::string{})};
}

TelemetryHandler::TelemetryHandler(std::unique_ptr<telemetry::TelemetryCollector> collector)
    : collector_(std::move(collector)) {}

HttpReply TelemetryHandler::handle() {
  const auto sample = collector_->sample();

  auto payload = model::to_json(sample);
  payload["ok"] = true;
  payload["source"] = "local_system";
  payload["auth_mode"] = "local_only";
  return json_reply(200, payload);
}

}  // namespace infer_gateway::server
