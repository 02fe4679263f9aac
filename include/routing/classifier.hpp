#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "model/model_identity.hpp"
#include "model/route_decision.hpp"

namespace infer_gateway::routing {

struct ClassifierInput {
  // Lowercased request text.
  std::string_view text;
  bool has_image{false};
};

struct RouteRule {
  std::string name;
  std::function<bool(const ClassifierInput&)> matches;
  model::model_kind target{model::model_kind::REASONING};
  double confidence{0.0};
  model::decision_source source{model::decision_source::SHORTCUT};
  double reasoning_probability{0.0};
  double multimodal_probability{0.0};
};

// Heuristic keyword router. Rules are evaluated in table order and the first
// match wins; the last rule always matches.
class Classifier {
 public:
  explicit Classifier(model::ModelCatalog catalog);

  [[nodiscard]] model::RouteDecision classify(std::string_view text, bool has_image) const;
  [[nodiscard]] const std::vector<RouteRule>& rules() const noexcept;

 private:
  [[nodiscard]] model::RouteDecision decide(const RouteRule& rule) const;

  model::ModelCatalog catalog_;
  std::vector<RouteRule> rules_;
};

// Keywords are matched as substrings, so "analy" also hits "analytics".
const std::vector<std::string_view>& multimodal_keywords() noexcept;
const std::vector<std::string_view>& reasoning_keywords() noexcept;

}  // namespace infer_gateway::routing
