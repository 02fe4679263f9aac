#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "model/model_identity.hpp"

namespace infer_gateway::core {

struct BackendConfig {
  std::string url;
  std::string model_id;
  std::string alias;
};

struct TelemetryConfig {
  std::string nvidia_smi{"nvidia-smi"};
  std::chrono::milliseconds gpu_query_timeout{2000};
};

struct GatewayConfig {
  std::string bind_address{"0.0.0.0"};
  std::uint16_t port{8080};
  std::string static_dir{"static"};
  BackendConfig reasoning{"http://127.0.0.1:8355", "nvidia/Phi-4-reasoning-plus-FP8", "phi-4-reasoning-plus"};
  BackendConfig multimodal{"http://127.0.0.1:8356", "nvidia/Phi-4-multimodal-instruct-NVFP4",
                           "phi-4-multimodal-instruct"};
  std::chrono::seconds dispatch_timeout{600};
  int max_tokens{256};
  TelemetryConfig telemetry{};
};

using EnvLookup = std::function<const char*(const char*)>;

// Reads a YAML-style file (two-space nesting, '#' comments) over the defaults.
GatewayConfig load_gateway_config(const std::string& path);

// Applies PUBLIC_PORT, REASONING_URL, MULTIMODAL_URL, MODEL_*_ID,
// MODEL_*_ALIAS and STATIC_DIR when set.
void apply_environment(GatewayConfig& config, const EnvLookup& lookup);

// Throws std::runtime_error on the first invalid setting.
void validate_config(const GatewayConfig& config);

model::ModelCatalog make_model_catalog(const GatewayConfig& config);

std::string format_config_settings(const GatewayConfig& config);

}  // namespace infer_gateway::core
