#include "routing/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace infer_gateway::routing {
namespace {

using model::decision_source;
using model::model_kind;

std::string to_lower(const std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool contains_any(const std::string_view text, const std::vector<std::string_view>& keywords) {
  return std::any_of(keywords.begin(), keywords.end(),
                     [text](const std::string_view keyword) { return text.find(keyword) != std::string_view::npos; });
}

std::vector<RouteRule> build_rules() {
  std::vector<RouteRule> rules;
  rules.push_back(RouteRule{.name = "image_present",
                            .matches = [](const ClassifierInput& input) { return input.has_image; },
                            .target = model_kind::MULTIMODAL,
                            .confidence = 0.99,
                            .source = decision_source::SHORTCUT,
                            .reasoning_probability = 0.01,
                            .multimodal_probability = 0.99});
  rules.push_back(RouteRule{.name = "multimodal_keyword",
                            .matches = [](const ClassifierInput& input) {
                              return contains_any(input.text, multimodal_keywords());
                            },
                            .target = model_kind::MULTIMODAL,
                            .confidence = 0.85,
                            .source = decision_source::SHORTCUT,
                            .reasoning_probability = 0.15,
                            .multimodal_probability = 0.85});
  rules.push_back(RouteRule{.name = "reasoning_keyword",
                            .matches = [](const ClassifierInput& input) {
                              return contains_any(input.text, reasoning_keywords());
                            },
                            .target = model_kind::REASONING,
                            .confidence = 0.88,
                            .source = decision_source::SHORTCUT,
                            .reasoning_probability = 0.88,
                            .multimodal_probability = 0.12});
  rules.push_back(RouteRule{.name = "fallback",
                            .matches = [](const ClassifierInput&) { return true; },
                            .target = model_kind::REASONING,
                            .confidence = 0.65,
                            .source = decision_source::MLP_COMPAT,
                            .reasoning_probability = 0.65,
                            .multimodal_probability = 0.35});
  return rules;
}

}  // namespace

const std::vector<std::string_view>& multimodal_keywords() noexcept {
  static const std::vector<std::string_view> kKeywords = {"image", "photo", "picture", "vision", "audio", "video"};
  return kKeywords;
}

const std::vector<std::string_view>& reasoning_keywords() noexcept {
  static const std::vector<std::string_view> kKeywords = {"reason", "analy", "proof", "derive",
                                                          "step",   "logic", "math",  "explain why"};
  return kKeywords;
}

Classifier::Classifier(model::ModelCatalog catalog) : catalog_(std::move(catalog)), rules_(build_rules()) {}

model::RouteDecision Classifier::classify(const std::string_view text, const bool has_image) const {
  const std::string lowered = to_lower(text);
  const ClassifierInput input{.text = lowered, .has_image = has_image};

  for (const auto& rule : rules_) {
    if (rule.matches(input)) {
      return decide(rule);
    }
  }

  return decide(rules_.back());
}

const std::vector<RouteRule>& Classifier::rules() const noexcept { return rules_; }

model::RouteDecision Classifier::decide(const RouteRule& rule) const {
  const auto& target = catalog_.get(rule.target);
  const auto& other =
      catalog_.get(rule.target == model_kind::MULTIMODAL ? model_kind::REASONING : model_kind::MULTIMODAL);

  model::RouteDecision decision;
  decision.target_model = target;
  decision.confidence = rule.confidence;
  decision.source = rule.source;
  decision.probability_distribution = {{catalog_.reasoning.canonical_id, rule.reasoning_probability},
                                       {catalog_.multimodal.canonical_id, rule.multimodal_probability}};
  decision.ranked_candidates = {target.canonical_id, other.canonical_id};
  return decision;
}

}  // namespace infer_gateway::routing
