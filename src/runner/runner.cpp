#include "strata/runner/runner.hpp"

#include "strata/common/time.hpp"
#include "strata/observability/global.hpp"
#include "strata/runner/durable_runner.hpp"
#include "strata/runner/inline_runner.hpp"

#include <exception>

namespace strata::runner {

StepAttempt execute_step(const pipeline::StepSpec &step, const pipeline::WorkflowState &state,
                         const pipeline::StepServices &services, const std::atomic<bool> *cancel,
                         std::shared_ptr<const std::atomic<bool>> abandoned) {
  StepAttempt attempt;
  attempt.state = state;
  const auto started = std::chrono::steady_clock::now();
  if (!step.handler) {
    attempt.status = common::Status::error(common::ErrorKind::Validation,
                                           "step has no handler: " + step.id);
  } else {
    const pipeline::StepContext context(services, step, cancel, std::move(abandoned));
    try {
      attempt.status = step.handler(attempt.state, context);
    } catch (const std::exception &e) {
      attempt.status = common::Status::error(common::ErrorKind::Internal,
                                             "step " + step.id + " threw: " + e.what());
    }
  }
  attempt.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return attempt;
}

common::Error annotate(common::Error error, const std::string &step_id,
                       const RunContext &context) {
  if (error.step_id.empty()) {
    error.step_id = step_id;
  }
  if (error.run_id.empty()) {
    error.run_id = context.run_id;
  }
  if (error.scope.empty()) {
    error.scope = context.scope.to_string();
  }
  return error;
}

RunJournal::RunJournal(std::shared_ptr<store::IMetadataStore> store,
                       const pipeline::PipelineRevision &revision, const RunContext &context)
    : store_(std::move(store)), started_(std::chrono::steady_clock::now()) {
  log_.run_id = context.run_id;
  log_.workflow = context.workflow;
  log_.revision = revision.number;
  log_.scope = context.scope;
  log_.status = store::RunStatus::Running;
  log_.input_summary = context.input_summary;
}

void RunJournal::start() {
  log_.started_at = common::now_rfc3339();
  persist();
  observability::record_run_start(log_.workflow, log_.run_id, log_.revision,
                                  log_.scope.to_string());
}

void RunJournal::step(store::StepRecord record) { log_.steps.push_back(std::move(record)); }

RunOutcome RunJournal::finish(const store::RunStatus status, pipeline::WorkflowState state,
                              std::optional<common::Error> error) {
  log_.status = status;
  log_.error = error;
  log_.finished_at = common::now_rfc3339();
  persist();

  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_);
  observability::record_run_end(log_.workflow, log_.run_id, store::run_status_to_string(status),
                                duration);
  observability::record_metric(
      observability::RunLatencyMetric{.workflow = log_.workflow, .latency = duration});
  if (error.has_value()) {
    observability::record_error(log_.workflow, error->to_string());
  }

  RunOutcome outcome;
  outcome.status = status;
  outcome.state = std::move(state);
  outcome.log = log_;
  outcome.error = std::move(error);
  return outcome;
}

void RunJournal::persist() {
  if (!store_) {
    return;
  }
  const auto status = store_->put_run_log(log_);
  if (!status.ok()) {
    observability::record_error("run_log", status.error());
  }
}

std::unique_ptr<IWorkflowRunner> create_runner(const config::RunnerConfig &config,
                                               std::shared_ptr<store::IMetadataStore> store) {
  if (config.kind == "durable") {
    return std::make_unique<DurableRunner>(config, std::move(store));
  }
  return std::make_unique<InlineRunner>(std::move(store));
}

} // namespace strata::runner
