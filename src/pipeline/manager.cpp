#include "strata/pipeline/manager.hpp"

#include "strata/common/text.hpp"
#include "strata/common/time.hpp"

#include <cstddef>
#include <set>

namespace strata::pipeline {

const StepSpec *PipelineRevision::find(const std::string &step_id) const {
  for (const auto &step : steps) {
    if (step.id == step_id) {
      return &step;
    }
  }
  return nullptr;
}

std::vector<std::string> PipelineRevision::step_ids() const {
  std::vector<std::string> ids;
  ids.reserve(steps.size());
  for (const auto &step : steps) {
    ids.push_back(step.id);
  }
  return ids;
}

std::string PipelineRevision::token() const { return workflow + "@" + std::to_string(number); }

common::Status validate_structure(const std::vector<StepSpec> &steps,
                                  const std::vector<std::string> &initial_fields) {
  if (steps.empty()) {
    return common::Status::error(common::ErrorKind::Validation, "pipeline has no steps");
  }

  std::set<std::string> ids;
  std::set<std::string> available(initial_fields.begin(), initial_fields.end());
  for (const auto &step : steps) {
    if (step.id.empty()) {
      return common::Status::error(common::ErrorKind::Validation, "step id must not be empty");
    }
    if (!ids.insert(step.id).second) {
      return common::Status::error(common::ErrorKind::Validation,
                                   "duplicate step id: " + step.id);
    }
    if (!step.handler) {
      return common::Status::error(common::ErrorKind::Validation,
                                   "step " + step.id + " has no handler");
    }
    for (const auto &input : step.inputs) {
      if (!available.contains(input)) {
        return common::Status::error(common::ErrorKind::Validation,
                                     "step " + step.id + " requires '" + input +
                                         "' which no earlier step produces");
      }
    }
    for (const auto &output : step.outputs) {
      if (!is_known_field(output)) {
        return common::Status::error(common::ErrorKind::Validation,
                                     "step " + step.id + " produces unknown field '" + output +
                                         "'");
      }
      available.insert(output);
    }
  }
  return common::Status::success();
}

common::Status validate_capabilities(const std::vector<StepSpec> &steps,
                                     const capability::CapabilitySet &available) {
  for (const auto &step : steps) {
    for (const auto capability : step.required_capabilities()) {
      if (!available.has(capability)) {
        return common::Status::error(common::ErrorKind::CapabilityUnavailable,
                                     "step " + step.id + " requires capability '" +
                                         capability::capability_to_string(capability) +
                                         "' which this deployment does not provide");
      }
    }
  }
  return common::Status::success();
}

PipelineManager::PipelineManager(capability::CapabilitySet available)
    : available_(std::move(available)) {}

common::Status PipelineManager::register_pipeline(const std::string &workflow,
                                                  std::vector<StepSpec> steps,
                                                  std::vector<std::string> initial_fields) {
  auto status = validate_structure(steps, initial_fields);
  if (!status.ok()) {
    return status;
  }

  auto revision = std::make_shared<PipelineRevision>();
  revision->workflow = workflow;
  revision->number = 1;
  revision->steps = std::move(steps);
  revision->initial_fields = std::move(initial_fields);
  revision->change = "register";
  revision->created_at = common::now_rfc3339();

  std::lock_guard<std::mutex> lock(mutex_);
  if (revisions_.contains(workflow)) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "workflow already registered: " + workflow);
  }
  revisions_[workflow].push_back(std::move(revision));
  return common::Status::success();
}

common::Result<RevisionPtr> PipelineManager::current(const std::string &workflow) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = revisions_.find(workflow);
  if (it == revisions_.end() || it->second.empty()) {
    return common::Result<RevisionPtr>::failure(common::ErrorKind::NotFound,
                                                "unknown workflow: " + workflow);
  }
  return common::Result<RevisionPtr>::success(it->second.back());
}

common::Result<RevisionPtr> PipelineManager::build(const std::string &workflow) const {
  auto revision = current(workflow);
  if (!revision.ok()) {
    return revision;
  }
  auto status = validate_capabilities(revision.value()->steps, available_);
  if (!status.ok()) {
    return common::Result<RevisionPtr>::failure(status.error_info());
  }
  return revision;
}

common::Result<std::size_t> PipelineManager::locate(const std::vector<StepSpec> &steps,
                                                    const std::string &step_id) {
  for (std::size_t i = 0; i < steps.size(); ++i) {
    if (steps[i].id == step_id) {
      return common::Result<std::size_t>::success(i);
    }
  }
  return common::Result<std::size_t>::failure(common::ErrorKind::Validation,
                                              "unknown step: " + step_id);
}

common::Result<RevisionPtr> PipelineManager::apply(const std::string &workflow,
                                                   const std::string &change, const Edit &edit) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = revisions_.find(workflow);
  if (it == revisions_.end() || it->second.empty()) {
    return common::Result<RevisionPtr>::failure(common::ErrorKind::Validation,
                                                "unknown workflow: " + workflow);
  }
  const RevisionPtr &active = it->second.back();

  std::vector<StepSpec> steps = active->steps;
  auto edited = edit(steps);
  if (!edited.ok()) {
    return common::Result<RevisionPtr>::failure(edited.error_info());
  }
  auto status = validate_structure(steps, active->initial_fields);
  if (!status.ok()) {
    return common::Result<RevisionPtr>::failure(status.error_info());
  }
  status = validate_capabilities(steps, available_);
  if (!status.ok()) {
    return common::Result<RevisionPtr>::failure(status.error_info());
  }

  auto revision = std::make_shared<PipelineRevision>();
  revision->workflow = workflow;
  revision->number = active->number + 1;
  revision->steps = std::move(steps);
  revision->initial_fields = active->initial_fields;
  revision->change = change;
  revision->created_at = common::now_rfc3339();
  it->second.push_back(revision);
  return common::Result<RevisionPtr>::success(std::move(revision));
}

common::Result<RevisionPtr>
PipelineManager::config_step(const std::string &workflow, const std::string &step_id,
                             const std::map<std::string, std::string> &overrides) {
  return apply(workflow, "config_step:" + step_id, [&](std::vector<StepSpec> &steps) {
    auto index = locate(steps, step_id);
    if (!index.ok()) {
      return common::Status::error(index.error_info());
    }
    auto &step = steps[index.value()];
    for (const auto &[key, value] : overrides) {
      if (!step.config_keys.empty() && !step.config_keys.contains(key)) {
        return common::Status::error(common::ErrorKind::Validation,
                                     "step " + step_id + " has no config key '" + key + "'");
      }
      step.config[key] = value;
    }
    return common::Status::success();
  });
}

common::Result<RevisionPtr> PipelineManager::insert_after(const std::string &workflow,
                                                          const std::string &target_id,
                                                          StepSpec step) {
  return apply(workflow, "insert_after:" + target_id + ":" + step.id,
               [&](std::vector<StepSpec> &steps) {
                 auto index = locate(steps, target_id);
                 if (!index.ok()) {
                   return common::Status::error(index.error_info());
                 }
                 steps.insert(steps.begin() + static_cast<std::ptrdiff_t>(index.value() + 1),
                              std::move(step));
                 return common::Status::success();
               });
}

common::Result<RevisionPtr> PipelineManager::insert_before(const std::string &workflow,
                                                           const std::string &target_id,
                                                           StepSpec step) {
  return apply(workflow, "insert_before:" + target_id + ":" + step.id,
               [&](std::vector<StepSpec> &steps) {
                 auto index = locate(steps, target_id);
                 if (!index.ok()) {
                   return common::Status::error(index.error_info());
                 }
                 steps.insert(steps.begin() + static_cast<std::ptrdiff_t>(index.value()),
                              std::move(step));
                 return common::Status::success();
               });
}

common::Result<RevisionPtr> PipelineManager::replace_step(const std::string &workflow,
                                                          const std::string &target_id,
                                                          StepSpec step) {
  return apply(workflow, "replace_step:" + target_id, [&](std::vector<StepSpec> &steps) {
    auto index = locate(steps, target_id);
    if (!index.ok()) {
      return common::Status::error(index.error_info());
    }
    steps[index.value()] = std::move(step);
    return common::Status::success();
  });
}

common::Result<RevisionPtr> PipelineManager::remove_step(const std::string &workflow,
                                                         const std::string &target_id) {
  return apply(workflow, "remove_step:" + target_id, [&](std::vector<StepSpec> &steps) {
    auto index = locate(steps, target_id);
    if (!index.ok()) {
      return common::Status::error(index.error_info());
    }
    steps.erase(steps.begin() + static_cast<std::ptrdiff_t>(index.value()));
    return common::Status::success();
  });
}

common::Result<RevisionPtr> PipelineManager::rollback(const std::string &workflow,
                                                      const std::uint64_t revision) {
  RevisionPtr target;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = revisions_.find(workflow);
    if (it != revisions_.end()) {
      for (const auto &candidate : it->second) {
        if (candidate->number == revision) {
          target = candidate;
        }
      }
    }
  }
  if (target == nullptr) {
    return common::Result<RevisionPtr>::failure(
        common::ErrorKind::Validation,
        "unknown revision " + std::to_string(revision) + " of workflow " + workflow);
  }
  return apply(workflow, "rollback:" + std::to_string(revision),
               [&](std::vector<StepSpec> &steps) {
                 steps = target->steps;
                 return common::Status::success();
               });
}

common::Result<std::vector<RevisionPtr>>
PipelineManager::history(const std::string &workflow) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = revisions_.find(workflow);
  if (it == revisions_.end()) {
    return common::Result<std::vector<RevisionPtr>>::failure(common::ErrorKind::NotFound,
                                                             "unknown workflow: " + workflow);
  }
  return common::Result<std::vector<RevisionPtr>>::success(it->second);
}

std::string PipelineManager::revision_token() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> parts;
  for (const auto &[workflow, revisions] : revisions_) {
    if (!revisions.empty()) {
      parts.push_back(revisions.back()->token());
    }
  }
  return common::join(parts, ";");
}

} // namespace strata::pipeline
