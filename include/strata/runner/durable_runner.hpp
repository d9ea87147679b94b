#pragma once

#include "strata/runner/runner.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace strata::runner {

/// Retries transient failures with exponential backoff, bounds each attempt by a timeout,
/// runs independent steps concurrently and checkpoints progress for resume_pending.
class DurableRunner final : public IWorkflowRunner {
public:
  DurableRunner(config::RunnerConfig config, std::shared_ptr<store::IMetadataStore> store);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] RunOutcome run(const pipeline::RevisionPtr &revision,
                               pipeline::WorkflowState state,
                               const pipeline::StepServices &services,
                               const RunContext &context) override;

  /// Groups step indexes into waves: a step joins the wave after the latest earlier step it
  /// shares a field or a store write with; persistence and finalizer steps are barriers.
  /// Waves are capped at `max_concurrency` steps.
  [[nodiscard]] static std::vector<std::vector<std::size_t>>
  plan_waves(const std::vector<pipeline::StepSpec> &steps, std::size_t max_concurrency);

private:
  struct StepRun {
    StepAttempt attempt;
    std::uint32_t attempts = 0;
    bool timed_out = false;
  };

  [[nodiscard]] StepRun run_with_retry(const pipeline::StepSpec &step,
                                       const pipeline::WorkflowState &state,
                                       const pipeline::StepServices &services,
                                       const RunContext &context) const;
  [[nodiscard]] StepAttempt run_with_timeout(const pipeline::StepSpec &step,
                                             const pipeline::WorkflowState &state,
                                             const pipeline::StepServices &services,
                                             const std::atomic<bool> *cancel,
                                             bool &timed_out) const;
  void checkpoint(const pipeline::PipelineRevision &revision, const RunContext &context,
                  const std::vector<std::string> &completed, const std::string &status) const;

  config::RunnerConfig config_;
  std::shared_ptr<store::IMetadataStore> store_;
};

} // namespace strata::runner
