#include "strata/runner/inline_runner.hpp"

#include "strata/observability/global.hpp"

namespace strata::runner {

InlineRunner::InlineRunner(std::shared_ptr<store::IMetadataStore> store)
    : store_(std::move(store)) {}

std::string_view InlineRunner::name() const { return "inline"; }

RunOutcome InlineRunner::run(const pipeline::RevisionPtr &revision, pipeline::WorkflowState state,
                             const pipeline::StepServices &services, const RunContext &context) {
  RunJournal journal(store_, *revision, context);
  journal.start();

  bool degraded = false;
  bool cancelled = false;
  for (const auto &step : revision->steps) {
    if (!cancelled && context.cancel != nullptr && context.cancel->load()) {
      cancelled = true;
    }
    if (cancelled && !step.finalizer) {
      journal.step(store::StepRecord{.step_id = step.id, .status = "skipped"});
      continue;
    }

    auto attempt = execute_step(step, state, services, context.cancel, nullptr);
    observability::record_step(context.run_id, step.id, 1, attempt.duration, attempt.status.ok(),
                               attempt.status.error());
    store::StepRecord record{.step_id = step.id,
                             .attempts = 1,
                             .duration_ms = static_cast<std::uint64_t>(attempt.duration.count())};

    if (attempt.status.ok()) {
      record.status = "ok";
      journal.step(std::move(record));
      state.adopt(std::move(attempt.state), step.outputs);
      continue;
    }

    record.error = attempt.status.error();
    if (step.degradable && attempt.status.kind() != common::ErrorKind::Cancelled) {
      record.status = "degraded";
      journal.step(std::move(record));
      degraded = true;
      continue;
    }
    record.status = "failed";
    journal.step(std::move(record));
    auto error = annotate(attempt.status.error_info(), step.id, context);
    const auto status = error.kind == common::ErrorKind::Cancelled ? store::RunStatus::Cancelled
                                                                   : store::RunStatus::Failed;
    return journal.finish(status, std::move(state), std::move(error));
  }

  if (cancelled) {
    return journal.finish(store::RunStatus::Cancelled, std::move(state),
                          annotate(common::Error{.kind = common::ErrorKind::Cancelled,
                                                 .message = "run cancelled"},
                                   "", context));
  }
  return journal.finish(degraded ? store::RunStatus::Degraded : store::RunStatus::Succeeded,
                        std::move(state), std::nullopt);
}

} // namespace strata::runner
