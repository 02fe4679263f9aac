#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "dispatch/forwarder.hpp"
#include "model/model_identity.hpp"
#include "routing/backend_resolver.hpp"
#include "routing/classifier.hpp"
#include "telemetry/collector.hpp"

namespace infer_gateway::server {

constexpr const char* kDispatchBackend = "trtllm-serve";

struct HttpReply {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
};

HttpReply json_reply(int status, const nlohmann::json& payload);
HttpReply error_reply(int status, const std::string& message);

// Empty bodies parse as {}. Returns nullopt for malformed JSON or a
// non-object document.
std::optional<nlohmann::json> parse_json_object(const std::string& body);

HttpReply health_reply();
HttpReply models_reply(const model::ModelCatalog& catalog);

// POST /route: classify free text, invoke the chosen backend and report both.
class RouteHandler {
 public:
  RouteHandler(model::ModelCatalog catalog, std::shared_ptr<const dispatch::DispatchForwarder> forwarder);

  HttpReply handle(const nlohmann::json& payload) const;

 private:
  routing::Classifier classifier_;
  std::shared_ptr<const dispatch::DispatchForwarder> forwarder_;
};

// POST /v1/chat/completions and /v1/completions: relay to the named model.
class PassthroughHandler {
 public:
  PassthroughHandler(model::ModelCatalog catalog, std::shared_ptr<const dispatch::DispatchForwarder> forwarder);

  HttpReply handle(const std::string& path, const std::string& raw_body, const nlohmann::json& payload,
                   const std::optional<std::string>& authorization) const;

 private:
  routing::BackendResolver resolver_;
  std::shared_ptr<const dispatch::DispatchForwarder> forwarder_;
};

// GET /telemetry/snapshot.
class TelemetryHandler {
 public:
  explicit TelemetryHandler(std::unique_ptr<telemetry::TelemetryCollector> collector);

  HttpReply handle();

 private:
  std::unique_ptr<telemetry::TelemetryCollector> collector_;
};

}  // namespace infer_gateway::server
