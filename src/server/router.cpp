#include "server/router.hpp"

#include <utility>

#include "sensors/cpu_counter_state.hpp"

namespace infer_gateway::server {

GatewayRouter::GatewayRouter(Components components)
    : catalog_(components.catalog),
      route_(components.catalog, components.forwarder),
      passthrough_(components.catalog, components.forwarder),
      telemetry_(std::move(components.collector)),
      static_files_(std::move(components.static_root)) {}

HttpReply GatewayRouter::handle(const GatewayRequest& request) {
  if (request.method == "GET" || request.method == "HEAD") {
    return handle_get(request.path);
  }
  if (request.method == "POST") {
    return handle_post(request);
  }
  return error_reply(404, "Not Found");
}

HttpReply GatewayRouter::handle_get(const std::string& path) {
  if (path == "/healthz" || path == "/health") {
    return health_reply();
  }
  if (path == "/v1/models") {
    return models_reply(catalog_);
  }
  if (path == "/telemetry/snapshot") {
    return telemetry_.handle();
  }
  if (path == "/" || path.rfind("/static/", 0) == 0) {
    return static_files_.serve(path);
  }
  return error_reply(404, "Not Found");
}

HttpReply GatewayRouter::handle_post(const GatewayRequest& request) const {
  const bool is_route = request.path == "/route";
  const bool is_passthrough = request.path == "/v1/chat/completions" || request.path == "/v1/completions";
  if (!is_route && !is_passthrough) {
    return error_reply(404, "Not Found");
  }

  const auto payload = parse_json_object(request.body);
  if (!payload.has_value()) {
    return error_reply(400, "Invalid JSON payload");
  }

  if (is_route) {
    return route_.handle(*payload);
  }
  return passthrough_.handle(request.path, request.body, *payload, request.authorization);
}

std::unique_ptr<GatewayRouter> make_gateway_router(const core::GatewayConfig& config) {
  GatewayRouter::Components components{};
  components.catalog = core::make_model_catalog(config);
  components.forwarder = std::make_shared<const dispatch::DispatchForwarder>(
      dispatch::ForwarderOptions{.timeout = config.dispatch_timeout, .max_tokens = config.max_tokens});
  components.collector =
      telemetry::make_host_collector(config.telemetry, std::make_shared<sensors::CpuCounterState>());
  components.static_root = config.static_dir;

  return std::make_unique<GatewayRouter>(std::move(components));
}

}  // namespace infer_gateway::server
