#pragma once

#include <string>
#include <utility>
#include <vector>

#include "model/model_identity.hpp"

namespace infer_gateway::model {

enum class decision_source {
  SHORTCUT,
  MLP_COMPAT,
};

inline const char* to_string(const decision_source source) noexcept {
  return source == decision_source::SHORTCUT ? "shortcut" : "mlp_compat";
}

struct RouteDecision {
  ModelIdentity target_model;
  double confidence{0.0};
  decision_source source{decision_source::MLP_COMPAT};
  // Canonical model id -> probability. Always both known models.
  std::vector<std::pair<std::string, double>> probability_distribution;
  // Canonical model ids, best first.
  std::vector<std::string> ranked_candidates;
};

}  // namespace infer_gateway::model
