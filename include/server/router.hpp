#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "server/handlers.hpp"
#include "server/static_files.hpp"

namespace infer_gateway::server {

struct GatewayRequest {
  std::string method;
  // Decoded path without the query string.
  std::string path;
  std::string body;
  std::optional<std::string> authorization;
};

// The gateway's route table, independent of the HTTP transport.
class GatewayRouter {
 public:
  struct Components {
    model::ModelCatalog catalog;
    std::shared_ptr<const dispatch::DispatchForwarder> forwarder;
    std::unique_ptr<telemetry::TelemetryCollector> collector;
    std::filesystem::path static_root;
  };

  explicit GatewayRouter(Components components);

  HttpReply handle(const GatewayRequest& request);

 private:
  HttpReply handle_get(const std::string& path);
  HttpReply handle_post(const GatewayRequest& request) const;

  model::ModelCatalog catalog_;
  RouteHandler route_;
  PassthroughHandler passthrough_;
  TelemetryHandler telemetry_;
  StaticFiles static_files_;
};

// Wires a router from configuration: host collector and forwarder.
std::unique_ptr<GatewayRouter> make_gateway_router(const core::GatewayConfig& config);

}  // namespace infer_gateway::server
