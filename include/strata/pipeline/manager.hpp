#pragma once

#include "strata/capability/capability.hpp"
#include "strata/common/result.hpp"
#include "strata/pipeline/step.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace strata::pipeline {

/// Immutable snapshot of one workflow's step sequence.
struct PipelineRevision {
  std::string workflow;
  std::uint64_t number = 0;
  std::vector<StepSpec> steps;
  std::vector<std::string> initial_fields;
  std::string change;
  std::string created_at;

  [[nodiscard]] const StepSpec *find(const std::string &step_id) const;
  [[nodiscard]] std::vector<std::string> step_ids() const;
  /// "<workflow>@<number>"
  [[nodiscard]] std::string token() const;
};

using RevisionPtr = std::shared_ptr<const PipelineRevision>;

/// Static checks: unique ids, handlers present, every input produced by the initial fields
/// or an earlier step, outputs naming known fields. Capability gaps are reported separately.
[[nodiscard]] common::Status validate_structure(const std::vector<StepSpec> &steps,
                                               const std::vector<std::string> &initial_fields);
[[nodiscard]] common::Status validate_capabilities(const std::vector<StepSpec> &steps,
                                                   const capability::CapabilitySet &available);

/// Revision log per workflow. Every accepted edit appends a new revision; published
/// revisions are never mutated, so runs pin the pointer they started with.
class PipelineManager {
public:
  explicit PipelineManager(capability::CapabilitySet available);

  [[nodiscard]] common::Status register_pipeline(const std::string &workflow,
                                                 std::vector<StepSpec> steps,
                                                 std::vector<std::string> initial_fields);

  /// Current revision, checked against the deployment's capabilities.
  [[nodiscard]] common::Result<RevisionPtr> build(const std::string &workflow) const;
  [[nodiscard]] common::Result<RevisionPtr> current(const std::string &workflow) const;

  [[nodiscard]] common::Result<RevisionPtr>
  config_step(const std::string &workflow, const std::string &step_id,
              const std::map<std::string, std::string> &overrides);
  [[nodiscard]] common::Result<RevisionPtr> insert_after(const std::string &workflow,
                                                         const std::string &target_id,
                                                         StepSpec step);
  [[nodiscard]] common::Result<RevisionPtr> insert_before(const std::string &workflow,
                                                          const std::string &target_id,
                                                          StepSpec step);
  [[nodiscard]] common::Result<RevisionPtr> replace_step(const std::string &workflow,
                                                         const std::string &target_id,
                                                         StepSpec step);
  [[nodiscard]] common::Result<RevisionPtr> remove_step(const std::string &workflow,
                                                        const std::string &target_id);
  /// Republishes the steps of an earlier revision as a new revision.
  [[nodiscard]] common::Result<RevisionPtr> rollback(const std::string &workflow,
                                                     std::uint64_t revision);

  [[nodiscard]] common::Result<std::vector<RevisionPtr>>
  history(const std::string &workflow) const;
  /// "memorize@3;retrieve@1;..." across every registered workflow.
  [[nodiscard]] std::string revision_token() const;

  [[nodiscard]] const capability::CapabilitySet &available() const { return available_; }

private:
  using Edit = std::function<common::Status(std::vector<StepSpec> &)>;

  [[nodiscard]] common::Result<RevisionPtr> apply(const std::string &workflow,
                                                  const std::string &change, const Edit &edit);
  [[nodiscard]] static common::Result<std::size_t> locate(const std::vector<StepSpec> &steps,
                                                          const std::string &step_id);

  capability::CapabilitySet available_;
  std::map<std::string, std::vector<RevisionPtr>> revisions_;
  mutable std::mutex mutex_;
};

} // namespace strata::pipeline
