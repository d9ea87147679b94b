#pragma once

#include "strata/common/result.hpp"
#include "strata/config/schema.hpp"
#include "strata/scope/scope.hpp"

#include <cstddef>
#include <string>

namespace strata::policy {

enum class RetrievalMode {
  // Category routing, lexical and vector item recall.
  Full,
  // No vector search; items are recalled only through routed categories.
  CategoryOnly,
};

[[nodiscard]] std::string retrieval_mode_to_string(RetrievalMode mode);

struct PolicyDecision {
  bool cross_scope = false;
  RetrievalMode mode = RetrievalMode::Full;
  bool allow_vector = true;
  // Concrete tenant combinations over the non-wildcard fields.
  std::size_t combinations = 1;
  std::size_t max_vector_candidates = 0;
  std::size_t max_rerank_candidates = 0;
  std::string reason;
};

/// Bounds cross-scope retrieve requests before any store access. Single exact-scope
/// selectors bypass every check.
class RetrievalPolicyEngine {
public:
  RetrievalPolicyEngine(config::PolicyConfig config, bool vector_available);

  [[nodiscard]] common::Result<PolicyDecision> evaluate(const scope::ScopeSelector &selector) const;

  [[nodiscard]] const config::PolicyConfig &config() const { return config_; }

private:
  [[nodiscard]] common::Result<PolicyDecision> fall_back(PolicyDecision decision,
                                                         const std::string &reason,
                                                         const std::string &selector) const;

  config::PolicyConfig config_;
  bool vector_available_;
};

} // namespace strata::policy
