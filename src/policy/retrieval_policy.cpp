#include "strata/policy/retrieval_policy.hpp"

#include "strata/observability/global.hpp"

#include <limits>

namespace strata::policy {

std::string retrieval_mode_to_string(const RetrievalMode mode) {
  switch (mode) {
  case RetrievalMode::Full:
    return "full";
  case RetrievalMode::CategoryOnly:
    return "category_only";
  }
  return "full";
}

RetrievalPolicyEngine::RetrievalPolicyEngine(config::PolicyConfig config,
                                             const bool vector_available)
    : config_(std::move(config)), vector_available_(vector_available) {}

common::Result<PolicyDecision>
RetrievalPolicyEngine::fall_back(PolicyDecision decision, const std::string &reason,
                                 const std::string &selector) const {
  if (config_.fallback == "reject") {
    observability::record_policy_decision(selector, "reject", decision.combinations, reason);
    return common::Result<PolicyDecision>::failure(common::ErrorKind::PolicyViolation,
                                                   "cross-scope retrieve rejected: " + reason);
  }
  decision.mode = RetrievalMode::CategoryOnly;
  decision.allow_vector = false;
  decision.reason = reason;
  observability::record_policy_decision(selector, "category_only", decision.combinations, reason);
  return common::Result<PolicyDecision>::success(std::move(decision));
}

common::Result<PolicyDecision>
RetrievalPolicyEngine::evaluate(const scope::ScopeSelector &selector) const {
  if (selector.is_single_exact()) {
    return common::Result<PolicyDecision>::success(PolicyDecision{
        .cross_scope = false,
        .mode = RetrievalMode::Full,
        .allow_vector = vector_available_,
        .combinations = 1,
        .max_vector_candidates = std::numeric_limits<std::size_t>::max(),
        .max_rerank_candidates = std::numeric_limits<std::size_t>::max(),
        .reason = vector_available_ ? "single scope" : "vector index absent",
    });
  }

  const std::string label = selector.to_string();
  if (selector.all_wildcard()) {
    observability::record_policy_decision(label, "reject", 0, "every scope field is a wildcard");
    return common::Result<PolicyDecision>::failure(
        common::ErrorKind::PolicyViolation,
        "selector wildcards every scope field; narrow at least one field");
  }

  PolicyDecision decision;
  decision.cross_scope = true;
  decision.combinations = selector.combination_count();
  decision.max_vector_candidates = config_.max_vector_candidates;
  decision.max_rerank_candidates = config_.max_rerank_candidates;

  if (decision.combinations > config_.max_scope_combinations) {
    const std::string reason = "selector expands to " + std::to_string(decision.combinations) +
                               " scope combinations (limit " +
                               std::to_string(config_.max_scope_combinations) + ")";
    observability::record_policy_decision(label, "reject", decision.combinations, reason);
    return common::Result<PolicyDecision>::failure(common::ErrorKind::PolicyViolation, reason);
  }

  if (!vector_available_) {
    return fall_back(std::move(decision), "vector index absent", label);
  }
  if (selector.has_wildcard() && !config_.vector_on_wildcard) {
    return fall_back(std::move(decision), "vector search disabled for wildcard selectors", label);
  }
  if (decision.combinations > config_.max_vector_scope_combinations) {
    return fall_back(std::move(decision),
                     "vector search bounded to " +
                         std::to_string(config_.max_vector_scope_combinations) +
                         " scope combinations",
                     label);
  }

  decision.mode = RetrievalMode::Full;
  decision.allow_vector = true;
  decision.reason = "within bounds";
  observability::record_policy_decision(label, "full", decision.combinations, decision.reason);
  return common::Result<PolicyDecision>::success(std::move(decision));
}

} // namespace strata::policy
