#include "strata/pipeline/state.hpp"

#include "strata/common/fs.hpp"

#include <functional>
#include <unordered_map>

namespace strata::pipeline {

namespace {

constexpr std::string_view kExtraPrefix = "extra.";

using Mover = std::function<void(WorkflowState &, WorkflowState &)>;

template <typename T> Mover move_member(T WorkflowState::*member) {
  return [member](WorkflowState &to, WorkflowState &from) { to.*member = std::move(from.*member); };
}

const std::unordered_map<std::string, Mover> &field_table() {
  static const std::unordered_map<std::string, Mover> table = {
      {"scope", move_member(&WorkflowState::scope)},
      {"selector", move_member(&WorkflowState::selector)},
      {"run_id", move_member(&WorkflowState::run_id)},
      {"memorize_request", move_member(&WorkflowState::memorize_request)},
      {"retrieve_request", move_member(&WorkflowState::retrieve_request)},
      {"evolve_request", move_member(&WorkflowState::evolve_request)},
      {"policy", move_member(&WorkflowState::policy)},
      {"resource", move_member(&WorkflowState::resource)},
      {"resource_reused", move_member(&WorkflowState::resource_reused)},
      {"text", move_member(&WorkflowState::text)},
      {"candidates", move_member(&WorkflowState::candidates)},
      {"merge", move_member(&WorkflowState::merge)},
      {"category_plan", move_member(&WorkflowState::category_plan)},
      {"intention", move_member(&WorkflowState::intention)},
      {"committed", move_member(&WorkflowState::committed)},
      {"needs_retrieval", move_member(&WorkflowState::needs_retrieval)},
      {"active_query", move_member(&WorkflowState::active_query)},
      {"next_step_query", move_member(&WorkflowState::next_step_query)},
      {"proceed_to_categories", move_member(&WorkflowState::proceed_to_categories)},
      {"proceed_to_items", move_member(&WorkflowState::proceed_to_items)},
      {"proceed_to_resources", move_member(&WorkflowState::proceed_to_resources)},
      {"query_vector", move_member(&WorkflowState::query_vector)},
      {"intention_hits", move_member(&WorkflowState::intention_hits)},
      {"category_hits", move_member(&WorkflowState::category_hits)},
      {"item_hits", move_member(&WorkflowState::item_hits)},
      {"resource_hits", move_member(&WorkflowState::resource_hits)},
      {"retrieve_result", move_member(&WorkflowState::retrieve_result)},
      {"targets", move_member(&WorkflowState::targets)},
      {"revisions", move_member(&WorkflowState::revisions)},
      {"diff", move_member(&WorkflowState::diff)},
  };
  return table;
}

} // namespace

void WorkflowState::adopt(WorkflowState &&from, const std::vector<std::string> &fields) {
  for (const auto &field : fields) {
    if (common::starts_with(field, std::string(kExtraPrefix))) {
      const std::string key = field.substr(kExtraPrefix.size());
      if (const auto it = from.extras.find(key); it != from.extras.end()) {
        extras[key] = std::move(it->second);
      }
      mark(field);
      continue;
    }
    const auto it = field_table().find(field);
    if (it == field_table().end()) {
      continue;
    }
    it->second(*this, from);
    mark(field);
  }
}

bool is_known_field(const std::string &field) {
  if (common::starts_with(field, std::string(kExtraPrefix))) {
    return field.size() > kExtraPrefix.size();
  }
  return field_table().contains(field);
}

std::vector<std::string> memorize_inputs() {
  return {"scope", "selector", "run_id", "memorize_request"};
}

std::vector<std::string> retrieve_inputs() {
  return {"scope", "selector", "run_id", "retrieve_request", "policy"};
}

std::vector<std::string> evolve_inputs() { return {"scope", "selector", "run_id", "evolve_request"}; }

} // namespace strata::pipeline
