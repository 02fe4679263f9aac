#include "routing/backend_resolver.hpp"

#include <utility>

namespace infer_gateway::routing {
namespace {

bool names(const model::ModelIdentity& identity, const std::string& model_name) {
  return model_name == identity.canonical_id || model_name == identity.alias;
}

}  // namespace

BackendResolver::BackendResolver(model::ModelCatalog catalog) : catalog_(std::move(catalog)) {}

std::optional<std::string> BackendResolver::resolve(const std::string& model_name) const {
  const auto identity = find_model(model_name);
  if (!identity.has_value()) {
    return std::nullopt;
  }
  return identity->backend_endpoint;
}

std::optional<model::ModelIdentity> BackendResolver::find_model(const std::string& model_name) const {
  if (names(catalog_.reasoning, model_name)) {
    return catalog_.reasoning;
  }
  if (names(catalog_.multimodal, model_name)) {
    return catalog_.multimodal;
  }
  return std::nullopt;
}

std::vector<std::string> BackendResolver::accepted_names() const {
  return {catalog_.reasoning.canonical_id, catalog_.reasoning.alias, catalog_.multimodal.canonical_id,
          catalog_.multimodal.alias};
}

std::string BackendResolver::unknown_model_message() const {
  std::string message = "Unknown model. Use one of: ";
  const auto accepted = accepted_names();
  for (std::size_t i = 0; i < accepted.size(); ++i) {
    if (i != 0) {
      message += ", ";
    }
    message += accepted[i];
  }
  return message;
}

const model::ModelCatalog& BackendResolver::catalog() const noexcept { return catalog_; }

}  // namespace infer_gateway::routing
