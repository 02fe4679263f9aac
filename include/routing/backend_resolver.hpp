#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model/model_identity.hpp"

namespace infer_gateway::routing {

// Maps a canonical model id or alias to its backend. Matching is exact and
// case-sensitive against the four names in the catalog.
class BackendResolver {
 public:
  explicit BackendResolver(model::ModelCatalog catalog);

  [[nodiscard]] std::optional<std::string> resolve(const std::string& model_name) const;
  [[nodiscard]] std::optional<model::ModelIdentity> find_model(const std::string& model_name) const;

  // Reasoning id, reasoning alias, multimodal id, multimodal alias.
  [[nodiscard]] std::vector<std::string> accepted_names() const;
  [[nodiscard]] std::string unknown_model_message() const;
  [[nodiscard]] const model::ModelCatalog& catalog() const noexcept;

 private:
  model::ModelCatalog catalog_;
};

}  // namespace infer_gateway::routing
