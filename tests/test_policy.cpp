#include "test_framework.hpp"

#include "strata/observability/observer.hpp"
#include "strata/policy/retrieval_policy.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

using strata::scope::FieldMatch;
using strata::scope::ScopeSelector;

ScopeSelector selector(FieldMatch project, FieldMatch agent) {
  return ScopeSelector({{"project_id", std::move(project)}, {"agent_id", std::move(agent)}});
}

std::vector<std::string> ids(const std::string &prefix, const std::size_t count) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(prefix + std::to_string(i));
  }
  return out;
}

} // namespace

void register_policy_tests(std::vector<strata::tests::TestCase> &tests) {
  using strata::tests::require;
  using strata::common::ErrorKind;
  using strata::policy::RetrievalMode;
  using strata::policy::RetrievalPolicyEngine;

  tests.push_back({"policy_single_exact_scope_is_always_full", [] {
                     strata::config::PolicyConfig config;
                     config.max_scope_combinations = 0;
                     config.fallback = "reject";
                     RetrievalPolicyEngine engine(config, false);
                     const auto decision = engine.evaluate(
                         selector(FieldMatch::exact("p1"), FieldMatch::exact("a1")));
                     require(decision.ok(), decision.error());
                     require(!decision.value().cross_scope, "single scope is not cross-scope");
                     require(decision.value().mode == RetrievalMode::Full, "mode should be full");
                     require(!decision.value().allow_vector, "no index means no vector search");
                   }});

  tests.push_back({"policy_all_wildcard_is_rejected", [] {
                     strata::testing::ObserverGuard guard;
                     RetrievalPolicyEngine engine(strata::config::PolicyConfig{}, true);
                     const auto decision = engine.evaluate(
                         selector(FieldMatch::wildcard(), FieldMatch::wildcard()));
                     require(!decision.ok(), "all-wildcard accepted");
                     require(decision.kind() == ErrorKind::PolicyViolation, "kind");
                     require(guard.telemetry()
                                     .count_events<strata::observability::PolicyDecisionEvent>() == 1,
                             "rejection should be observed");
                   }});

  tests.push_back({"policy_combination_cap_is_hard", [] {
                     strata::config::PolicyConfig config;
                     config.max_scope_combinations = 4;
                     RetrievalPolicyEngine engine(config, true);
                     const auto within = engine.evaluate(
                         selector(FieldMatch::exact("p1"), FieldMatch::any_of(ids("a", 4))));
                     require(within.ok(), within.error());
                     require(within.value().combinations == 4, "four combinations");

                     const auto over = engine.evaluate(
                         selector(FieldMatch::any_of(ids("p", 2)), FieldMatch::any_of(ids("a", 3))));
                     require(!over.ok() && over.kind() == ErrorKind::PolicyViolation,
                             "six combinations exceed the cap");
                   }});

  tests.push_back({"policy_within_bounds_allows_vector_search", [] {
                     RetrievalPolicyEngine engine(strata::config::PolicyConfig{}, true);
                     const auto decision = engine.evaluate(
                         selector(FieldMatch::exact("p1"), FieldMatch::any_of({"a1", "a2"})));
                     require(decision.ok(), decision.error());
                     require(decision.value().cross_scope, "cross-scope expected");
                     require(decision.value().mode == RetrievalMode::Full, "full expected");
                     require(decision.value().allow_vector, "vector allowed");
                     require(decision.value().max_vector_candidates == 200, "vector candidate cap");
                     require(decision.value().max_rerank_candidates == 50, "rerank cap");
                   }});

  tests.push_back({"policy_falls_back_without_vector_index", [] {
                     RetrievalPolicyEngine engine(strata::config::PolicyConfig{}, false);
                     const auto decision = engine.evaluate(
                         selector(FieldMatch::exact("p1"), FieldMatch::any_of({"a1", "a2"})));
                     require(decision.ok(), decision.error());
                     require(decision.value().mode == RetrievalMode::CategoryOnly,
                             "category-only fallback expected");
                     require(!decision.value().allow_vector, "vector must be off");
                   }});

  tests.push_back({"policy_wildcard_disables_vector_unless_enabled", [] {
                     const auto wildcard_agents =
                         selector(FieldMatch::exact("p1"), FieldMatch::wildcard());
                     RetrievalPolicyEngine strict(strata::config::PolicyConfig{}, true);
                     const auto fallback = strict.evaluate(wildcard_agents);
                     require(fallback.ok(), fallback.error());
                     require(fallback.value().mode == RetrievalMode::CategoryOnly, "fallback");

                     strata::config::PolicyConfig relaxed;
                     relaxed.vector_on_wildcard = true;
                     RetrievalPolicyEngine open(relaxed, true);
                     const auto full = open.evaluate(wildcard_agents);
                     require(full.ok() && full.value().mode == RetrievalMode::Full,
                             "wildcard vector search enabled");
                   }});

  tests.push_back({"policy_vector_scope_bound_and_reject_mode", [] {
                     strata::config::PolicyConfig config;
                     config.max_vector_scope_combinations = 2;
                     const auto three =
                         selector(FieldMatch::exact("p1"), FieldMatch::any_of(ids("a", 3)));

                     RetrievalPolicyEngine lenient(config, true);
                     const auto degraded = lenient.evaluate(three);
                     require(degraded.ok(), degraded.error());
                     require(degraded.value().mode == RetrievalMode::CategoryOnly,
                             "soft bound should fall back");

                     config.fallback = "reject";
                     RetrievalPolicyEngine rejecting(config, true);
                     const auto rejected = rejecting.evaluate(three);
                     require(!rejected.ok() && rejected.kind() == ErrorKind::PolicyViolation,
                             "reject mode should fail");
                   }});

  tests.push_back({"policy_mode_names", [] {
                     require(strata::policy::retrieval_mode_to_string(RetrievalMode::Full) == "full",
                             "full");
                     require(strata::policy::retrieval_mode_to_string(RetrievalMode::CategoryOnly) ==
                                 "category_only",
                             "category_only");
                   }});
}
