#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace infer_gateway::model {

// Outcome of a passthrough relay.
struct ForwardResult {
  bool ok{false};
  std::optional<int> status_code;
  std::optional<std::string> body;
  std::optional<std::string> content_type;
  std::optional<std::string> error;
};

// Outcome of an auto-route invocation of a backend.
struct WorkerResult {
  bool ok{false};
  std::string text;
  nlohmann::json raw;
  std::string error;
};

}  // namespace infer_gateway::model
