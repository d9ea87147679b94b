#pragma once

#include "strata/pipeline/step.hpp"

#include <vector>

namespace strata::pipeline {

inline constexpr const char *kMemorizeWorkflow = "memorize";
inline constexpr const char *kRetrieveWorkflow = "retrieve";
inline constexpr const char *kEvolveWorkflow = "evolve";

/// ingest_resource, preprocess, extract_items, dedupe_items, assign_categories,
/// update_intention, persist_index
[[nodiscard]] std::vector<StepSpec> memorize_steps();

/// route_intention, route_categories, recall_items, recall_resources, verify_candidates,
/// build_context
[[nodiscard]] std::vector<StepSpec> retrieve_steps();

/// select_targets, refresh_items, recluster_categories, adjust_intention,
/// persist_evolution
[[nodiscard]] std::vector<StepSpec> evolve_steps();

} // namespace strata::pipeline
