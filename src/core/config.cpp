#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace infer_gateway::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer: " + value);
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer: " + value);
  }
  return parsed;
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  const auto parsed_port = parse_integer(key, value);
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error(key + " must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(parsed_port);
}

bool apply_backend_key(BackendConfig& backend, const std::string& field, const std::string& value) {
  if (field == "url") {
    backend.url = value;
    return true;
  }
  if (field == "model_id") {
    backend.model_id = value;
    return true;
  }
  if (field == "alias") {
    backend.alias = value;
    return true;
  }
  return false;
}

void apply_key_value(GatewayConfig& config, const std::string& key, const std::string& value) {
  if (key == "server.port") {
    config.port = parse_port(key, value);
    return;
  }

  if (key == "server.bind_address") {
    config.bind_address = value;
    return;
  }

  if (key == "server.static_dir") {
    config.static_dir = value;
    return;
  }

  if (key.rfind("backends.reasoning.", 0) == 0 &&
      apply_backend_key(config.reasoning, key.substr(std::string("backends.reasoning.").size()), value)) {
    return;
  }

  if (key.rfind("backends.multimodal.", 0) == 0 &&
      apply_backend_key(config.multimodal, key.substr(std::string("backends.multimodal.").size()), value)) {
    return;
  }

  if (key == "dispatch.timeout_s") {
    const auto seconds = parse_integer(key, value);
    if (seconds <= 0) {
      throw std::runtime_error("dispatch.timeout_s must be greater than 0");
    }
    config.dispatch_timeout = std::chrono::seconds(seconds);
    return;
  }

  if (key == "dispatch.max_tokens") {
    const auto max_tokens = parse_integer(key, value);
    if (max_tokens <= 0 || max_tokens > 1000000) {
      throw std::runtime_error("dispatch.max_tokens must be in range 1..1000000");
    }
    config.max_tokens = static_cast<int>(max_tokens);
    return;
  }

  if (key == "telemetry.nvidia_smi") {
    config.telemetry.nvidia_smi = value;
    return;
  }

  if (key == "telemetry.gpu_query_timeout_ms") {
    const auto timeout_ms = parse_integer(key, value);
    if (timeout_ms <= 0) {
      throw std::runtime_error("telemetry.gpu_query_timeout_ms must be greater than 0");
    }
    config.telemetry.gpu_query_timeout = std::chrono::milliseconds(timeout_ms);
  }
}

}  // namespace

GatewayConfig load_gateway_config(const std::string& path) {
  GatewayConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_environment(GatewayConfig& config, const EnvLookup& lookup) {
  const auto read = [&lookup](const char* name, std::string& target) {
    const char* value = lookup(name);
    if (value != nullptr && *value != '\0') {
      target = value;
    }
  };

  std::string port;
  read("PUBLIC_PORT", port);
  if (!port.empty()) {
    config.port = parse_port("PUBLIC_PORT", port);
  }

  read("REASONING_URL", config.reasoning.url);
  read("MULTIMODAL_URL", config.multimodal.url);
  read("MODEL_REASONING_ID", config.reasoning.model_id);
  read("MODEL_MULTIMODAL_ID", config.multimodal.model_id);
  read("MODEL_REASONING_ALIAS", config.reasoning.alias);
  read("MODEL_MULTIMODAL_ALIAS", config.multimodal.alias);
  read("STATIC_DIR", config.static_dir);
}

void validate_config(const GatewayConfig& config) {
  for (const auto* backend : {&config.reasoning, &config.multimodal}) {
    if (backend->url.empty() || backend->model_id.empty() || backend->alias.empty()) {
      throw std::runtime_error("backend url, model_id and alias must not be empty");
    }
    if (backend->url.rfind("http://", 0) != 0) {
      throw std::runtime_error("backend url must start with http://: " + backend->url);
    }
  }

  const std::vector<std::string> names{config.reasoning.model_id, config.reasoning.alias, config.multimodal.model_id,
                                       config.multimodal.alias};
  for (std::size_t i = 0; i < names.size(); ++i) {
    for (std::size_t j = i + 1; j < names.size(); ++j) {
      if (names[i] == names[j]) {
        throw std::runtime_error("model names must be distinct: " + names[i]);
      }
    }
  }
}

model::ModelCatalog make_model_catalog(const GatewayConfig& config) {
  return model::ModelCatalog{
      .reasoning = {model::model_kind::REASONING, config.reasoning.model_id, config.reasoning.alias,
                    config.reasoning.url},
      .multimodal = {model::model_kind::MULTIMODAL, config.multimodal.model_id, config.multimodal.alias,
                     config.multimodal.url},
  };
}

std::string format_config_settings(const GatewayConfig& config) {
  std::ostringstream output;
  output << "[gateway] listen=" << config.bind_address << ':' << config.port
         << " | reasoning=" << config.reasoning.model_id << " (" << config.reasoning.alias << ") -> "
         << config.reasoning.url << " | multimodal=" << config.multimodal.model_id << " ("
         << config.multimodal.alias << ") -> " << config.multimodal.url
         << " | dispatch_timeout_s=" << config.dispatch_timeout.count() << " | static_dir=" << config.static_dir;
  return output.str();
}

}  // namespace infer_gateway::core
