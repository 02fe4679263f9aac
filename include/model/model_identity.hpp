#pragma once

#include <string>

namespace infer_gateway::model {

enum class model_kind {
  REASONING,
  MULTIMODAL,
};

struct ModelIdentity {
  model_kind kind{model_kind::REASONING};
  std::string canonical_id;
  std::string alias;
  // Base URL of the backend, e.g. http://127.0.0.1:8355.
  std::string backend_endpoint;
};

// The two models the gateway fronts. Built once from configuration.
struct ModelCatalog {
  ModelIdentity reasoning;
  ModelIdentity multimodal;

  [[nodiscard]] const ModelIdentity& get(const model_kind kind) const noexcept {
    return kind == model_kind::MULTIMODAL ? multimodal : reasoning;
  }
};

}  // namespace infer_gateway::model
