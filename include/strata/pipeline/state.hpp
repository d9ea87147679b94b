#pragma once

#include "strata/capability/extractor.hpp"
#include "strata/policy/retrieval_policy.hpp"
#include "strata/scope/scope.hpp"
#include "strata/store/records.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata::pipeline {

struct MemorizeRequest {
  // Caller reference resolved through the blob store when `content` is empty.
  std::string uri;
  std::string content;
  store::Modality modality = store::Modality::Conversation;
  // Overrides the configured memory types when non-empty.
  std::vector<std::string> memory_types;
};

struct RetrieveRequest {
  std::string query;
  std::optional<std::size_t> category_top_k;
  std::optional<std::size_t> item_top_k;
  std::optional<std::size_t> resource_top_k;
  std::optional<bool> include_resources;
  std::optional<bool> sufficiency_check;
  bool rerank = true;
};

struct EvolveRequest {
  // Treat every active item and category as a target.
  bool force = false;
  std::optional<double> stale_after_days;
  std::optional<std::size_t> max_targets;
};

struct ScoredCategory {
  store::MemoryCategory category;
  double score = 0.0;
};

struct ScoredItem {
  store::MemoryItem item;
  double score = 0.0;
  double vector_score = 0.0;
  double keyword_score = 0.0;
  double recency = 0.0;
  std::vector<std::string> category_ids;
};

struct ScoredResource {
  store::Resource resource;
  double score = 0.0;
};

/// Outcome of merging extracted candidates against the scope's active items.
struct MergePlan {
  std::vector<store::MemoryItem> created;
  // Reinforced items and superseded predecessors.
  std::vector<store::MemoryItem> updated;
  // Items reported back to the caller: created, reinforced and unchanged.
  std::vector<std::string> reported_ids;
  // Category hints of created items, keyed by item id.
  std::map<std::string, std::vector<std::string>> category_hints;
  std::size_t reinforced = 0;
  std::size_t superseded = 0;
  std::size_t rejected = 0;
  std::size_t unchanged = 0;
};

struct CategoryPlan {
  std::vector<store::MemoryCategory> upserts;
  std::vector<store::CategoryItem> links;
  std::vector<store::CategoryItem> unlinks;
  // Categories the run created or changed, for result reporting.
  std::vector<std::string> touched_ids;
  bool taxonomy_changed = false;
  std::vector<store::DiffChange> changes;
};

struct EvolveTargets {
  std::vector<store::MemoryItem> items;
  std::vector<store::MemoryCategory> categories;
  std::vector<std::string> unlinked_item_ids;
};

/// Item rewrites produced by evolve: new versions plus retired predecessors.
struct RevisionPlan {
  std::vector<store::MemoryItem> created;
  std::vector<store::MemoryItem> updated;
  std::vector<store::DiffChange> changes;
};

struct MemorizeResult {
  std::string run_id;
  store::Resource resource;
  bool resource_reused = false;
  std::vector<store::MemoryItem> items;
  std::vector<store::MemoryCategory> categories;
  std::size_t reinforced = 0;
  std::size_t superseded = 0;
  std::size_t rejected = 0;
};

struct RetrieveResult {
  std::string run_id;
  std::vector<store::Intention> intentions;
  std::vector<ScoredCategory> categories;
  std::vector<ScoredItem> items;
  std::vector<ScoredResource> resources;
  std::optional<std::string> next_step_query;
  bool degraded = false;
  std::string mode;
};

struct EvolveResult {
  std::string run_id;
  std::string diff_summary;
  store::DiffRecord diff;
};

/// Typed state threaded through a pipeline. Steps exchange data through named fields;
/// the runner copies only a step's declared outputs back after it succeeds.
struct WorkflowState {
  // Inputs.
  scope::ScopeKey scope;
  scope::ScopeSelector selector;
  std::string run_id;
  MemorizeRequest memorize_request;
  RetrieveRequest retrieve_request;
  EvolveRequest evolve_request;
  policy::PolicyDecision policy;

  // memorize
  store::Resource resource;
  bool resource_reused = false;
  std::string text;
  std::vector<capability::CandidateFact> candidates;
  MergePlan merge;
  CategoryPlan category_plan;
  std::optional<store::Intention> intention;
  bool committed = false;

  // retrieve
  bool needs_retrieval = true;
  std::string active_query;
  std::string next_step_query;
  bool proceed_to_categories = true;
  bool proceed_to_items = true;
  bool proceed_to_resources = false;
  std::vector<float> query_vector;
  std::vector<store::Intention> intention_hits;
  std::vector<ScoredCategory> category_hits;
  std::vector<ScoredItem> item_hits;
  std::vector<ScoredResource> resource_hits;
  RetrieveResult retrieve_result;

  // evolve
  EvolveTargets targets;
  RevisionPlan revisions;
  store::DiffRecord diff;

  // Fields of user-supplied steps, addressed as "extra.<key>".
  std::map<std::string, std::string> extras;

  std::set<std::string> produced;

  [[nodiscard]] bool has(const std::string &field) const { return produced.contains(field); }
  void mark(const std::string &field) { produced.insert(field); }

  /// Moves the named fields of `from` into this state and marks them produced.
  void adopt(WorkflowState &&from, const std::vector<std::string> &fields);
};

/// True for built-in field names and for "extra.<key>".
[[nodiscard]] bool is_known_field(const std::string &field);

[[nodiscard]] std::vector<std::string> memorize_inputs();
[[nodiscard]] std::vector<std::string> retrieve_inputs();
[[nodiscard]] std::vector<std::string> evolve_inputs();

} // namespace strata::pipeline
