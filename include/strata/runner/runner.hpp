#pragma once

#include "strata/common/result.hpp"
#include "strata/config/schema.hpp"
#include "strata/pipeline/manager.hpp"
#include "strata/pipeline/state.hpp"
#include "strata/pipeline/step.hpp"
#include "strata/store/metadata_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::runner {

struct RunContext {
  std::string run_id;
  std::string workflow;
  // Exact scope, or the selector label for cross-scope reads.
  scope::ScopeKey scope;
  std::string input_summary;
  // Opaque request encoding stored with checkpoints so a run can be replayed.
  std::string payload;
  const std::atomic<bool> *cancel = nullptr;
};

struct RunOutcome {
  store::RunStatus status = store::RunStatus::Running;
  pipeline::WorkflowState state;
  store::RunLog log;
  std::optional<common::Error> error;

  [[nodiscard]] bool ok() const {
    return status == store::RunStatus::Succeeded || status == store::RunStatus::Degraded;
  }
};

/// Executes one pinned pipeline revision. Implementations differ in retry, timeout and
/// scheduling behavior only; inputs, outputs and error kinds are identical.
class IWorkflowRunner {
public:
  virtual ~IWorkflowRunner() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual RunOutcome run(const pipeline::RevisionPtr &revision,
                                       pipeline::WorkflowState state,
                                       const pipeline::StepServices &services,
                                       const RunContext &context) = 0;
};

/// Result of one attempt of one step, executed on a private copy of the state.
struct StepAttempt {
  common::Status status = common::Status::success();
  pipeline::WorkflowState state;
  std::chrono::milliseconds duration{0};
};

[[nodiscard]] StepAttempt execute_step(const pipeline::StepSpec &step,
                                       const pipeline::WorkflowState &state,
                                       const pipeline::StepServices &services,
                                       const std::atomic<bool> *cancel,
                                       std::shared_ptr<const std::atomic<bool>> abandoned);

/// Stamps an error with the run, step and scope it belongs to.
[[nodiscard]] common::Error annotate(common::Error error, const std::string &step_id,
                                     const RunContext &context);

/// Run log bookkeeping shared by the runners: the log row is written when the run starts
/// and rewritten when it ends, so every run is retained regardless of outcome.
class RunJournal {
public:
  RunJournal(std::shared_ptr<store::IMetadataStore> store, const pipeline::PipelineRevision &revision,
             const RunContext &context);

  void start();
  void step(store::StepRecord record);
  [[nodiscard]] RunOutcome finish(store::RunStatus status, pipeline::WorkflowState state,
                                  std::optional<common::Error> error);

  [[nodiscard]] const store::RunLog &log() const { return log_; }

private:
  void persist();

  std::shared_ptr<store::IMetadataStore> store_;
  store::RunLog log_;
  std::chrono::steady_clock::time_point started_;
};

[[nodiscard]] std::unique_ptr<IWorkflowRunner>
create_runner(const config::RunnerConfig &config, std::shared_ptr<store::IMetadataStore> store);

} // namespace strata::runner
