#include "strata/runner/durable_runner.hpp"

#include "strata/common/time.hpp"
#include "strata/observability/global.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>

namespace strata::runner {

namespace {

constexpr std::chrono::milliseconds kCancelPollInterval{5};

bool writes_store(const pipeline::StepSpec &step) {
  const auto caps = step.required_capabilities();
  return std::find(caps.begin(), caps.end(), capability::Capability::StoreWrite) != caps.end();
}

bool is_barrier(const pipeline::StepSpec &step) {
  return step.finalizer || step.role == pipeline::Role::Persistence;
}

bool overlaps(const std::vector<std::string> &lhs, const std::vector<std::string> &rhs) {
  return std::any_of(lhs.begin(), lhs.end(), [&](const std::string &field) {
    return std::find(rhs.begin(), rhs.end(), field) != rhs.end();
  });
}

bool depends_on(const pipeline::StepSpec &later, const pipeline::StepSpec &earlier) {
  return is_barrier(later) || is_barrier(earlier) || overlaps(earlier.outputs, later.inputs) ||
         overlaps(earlier.outputs, later.outputs) || overlaps(earlier.inputs, later.outputs) ||
         (writes_store(earlier) && writes_store(later));
}

} // namespace

DurableRunner::DurableRunner(config::RunnerConfig config,
                             std::shared_ptr<store::IMetadataStore> store)
    : config_(std::move(config)), store_(std::move(store)) {}

std::string_view DurableRunner::name() const { return "durable"; }

std::vector<std::vector<std::size_t>>
DurableRunner::plan_waves(const std::vector<pipeline::StepSpec> &steps,
                          const std::size_t max_concurrency) {
  const std::size_t width = std::max<std::size_t>(1, max_concurrency);
  std::vector<std::size_t> level(steps.size(), 0);
  std::size_t deepest = 0;
  for (std::size_t i = 0; i < steps.size(); ++i) {
    for (std::size_t j = 0; j < i; ++j) {
      if (depends_on(steps[i], steps[j])) {
        level[i] = std::max(level[i], level[j] + 1);
      }
    }
    deepest = std::max(deepest, level[i]);
  }

  std::vector<std::vector<std::size_t>> waves;
  for (std::size_t l = 0; l <= deepest && !steps.empty(); ++l) {
    std::vector<std::size_t> current;
    for (std::size_t i = 0; i < steps.size(); ++i) {
      if (level[i] != l) {
        continue;
      }
      current.push_back(i);
      if (current.size() == width) {
        waves.push_back(std::move(current));
        current.clear();
      }
    }
    if (!current.empty()) {
      waves.push_back(std::move(current));
    }
  }
  return waves;
}

StepAttempt DurableRunner::run_with_timeout(const pipeline::StepSpec &step,
                                            const pipeline::WorkflowState &state,
                                            const pipeline::StepServices &services,
                                            const std::atomic<bool> *cancel,
                                            bool &timed_out) const {
  timed_out = false;
  // Steps that write the store are never abandoned: a late commit would land after the
  // run reported failure and released the scope lock.
  if (config_.step_timeout_ms == 0 || is_barrier(step) || writes_store(step)) {
    return execute_step(step, state, services, cancel, nullptr);
  }

  // The worker owns copies of everything it touches; an abandoned attempt may outlive
  // this call and sees the flag through StepContext::cancelled(). The caller's cancel
  // flag is relayed through the same flag since it may not outlive the worker.
  auto abandoned = std::make_shared<std::atomic<bool>>(false);
  auto promise = std::make_shared<std::promise<StepAttempt>>();
  auto future = promise->get_future();
  std::thread worker([step, state, services, abandoned, promise]() {
    promise->set_value(execute_step(step, state, services, nullptr, abandoned));
  });
  worker.detach();

  const auto timeout = std::chrono::milliseconds(config_.step_timeout_ms);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (future.wait_for(kCancelPollInterval) == std::future_status::timeout) {
    if (cancel != nullptr && cancel->load()) {
      abandoned->store(true);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      abandoned->store(true);
      timed_out = true;
      StepAttempt attempt;
      attempt.status = common::Status::error(common::ErrorKind::TransientCapability,
                                             "step " + step.id + " timed out after " +
                                                 std::to_string(config_.step_timeout_ms) + " ms");
      attempt.duration = timeout;
      return attempt;
    }
  }
  return future.get();
}

DurableRunner::StepRun DurableRunner::run_with_retry(const pipeline::StepSpec &step,
                                                     const pipeline::WorkflowState &state,
                                                     const pipeline::StepServices &services,
                                                     const RunContext &context) const {
  StepRun run;
  for (std::uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
    bool timed_out = false;
    run.attempt = run_with_timeout(step, state, services, context.cancel, timed_out);
    run.attempts = attempt + 1;
    run.timed_out = timed_out;
    observability::record_step(context.run_id, step.id, run.attempts, run.attempt.duration,
                               run.attempt.status.ok(), run.attempt.status.error());
    if (run.attempt.status.ok() || !common::is_retryable(run.attempt.status.kind())) {
      break;
    }
    if (context.cancel != nullptr && context.cancel->load()) {
      break;
    }
    if (attempt < config_.max_retries) {
      const std::uint64_t delay = config_.backoff_ms * (1ULL << attempt);
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
  }
  if (run.attempts > 1) {
    observability::record_metric(
        observability::StepRetryMetric{.step_id = step.id, .retries = run.attempts - 1});
  }
  return run;
}

void DurableRunner::checkpoint(const pipeline::PipelineRevision &revision,
                               const RunContext &context,
                               const std::vector<std::string> &completed,
                               const std::string &status) const {
  if (!config_.checkpoint || !store_) {
    return;
  }
  store::Checkpoint row;
  row.run_id = context.run_id;
  row.workflow = context.workflow;
  row.revision = revision.number;
  row.scope = context.scope;
  row.completed_steps = completed;
  row.status = status;
  row.payload = context.payload;
  row.updated_at = common::now_rfc3339();
  const auto saved = store_->put_checkpoint(row);
  if (!saved.ok()) {
    observability::record_error("checkpoint", saved.error());
  }
}

RunOutcome DurableRunner::run(const pipeline::RevisionPtr &revision, pipeline::WorkflowState state,
                              const pipeline::StepServices &services, const RunContext &context) {
  RunJournal journal(store_, *revision, context);
  journal.start();

  std::vector<std::string> completed;
  checkpoint(*revision, context, completed, "running");

  bool degraded = false;
  bool cancelled = false;
  for (const auto &wave : plan_waves(revision->steps, config_.max_concurrency)) {
    if (!cancelled && context.cancel != nullptr && context.cancel->load()) {
      cancelled = true;
    }

    std::vector<std::size_t> runnable;
    for (const auto index : wave) {
      const auto &step = revision->steps[index];
      if (cancelled && !step.finalizer) {
        journal.step(store::StepRecord{.step_id = step.id, .status = "skipped"});
        continue;
      }
      runnable.push_back(index);
    }

    std::vector<StepRun> runs(runnable.size());
    if (runnable.size() == 1) {
      runs[0] = run_with_retry(revision->steps[runnable[0]], state, services, context);
    } else if (!runnable.empty()) {
      std::vector<std::future<StepRun>> pending;
      pending.reserve(runnable.size());
      for (const auto index : runnable) {
        pending.push_back(std::async(std::launch::async, [&, index]() {
          return run_with_retry(revision->steps[index], state, services, context);
        }));
      }
      for (std::size_t i = 0; i < pending.size(); ++i) {
        runs[i] = pending[i].get();
      }
    }

    std::optional<common::Error> failure;
    for (std::size_t i = 0; i < runnable.size(); ++i) {
      const auto &step = revision->steps[runnable[i]];
      auto &run = runs[i];
      store::StepRecord record{
          .step_id = step.id,
          .attempts = run.attempts,
          .duration_ms = static_cast<std::uint64_t>(run.attempt.duration.count())};

      if (run.attempt.status.ok()) {
        record.status = "ok";
        journal.step(std::move(record));
        state.adopt(std::move(run.attempt.state), step.outputs);
        completed.push_back(step.id);
        continue;
      }
      record.error = run.attempt.status.error();
      if (step.degradable && run.attempt.status.kind() != common::ErrorKind::Cancelled) {
        record.status = "degraded";
        journal.step(std::move(record));
        degraded = true;
        continue;
      }
      record.status = run.timed_out ? "timeout" : "failed";
      journal.step(std::move(record));
      if (!failure.has_value()) {
        failure = annotate(run.attempt.status.error_info(), step.id, context);
      }
    }

    if (failure.has_value()) {
      checkpoint(*revision, context, completed, "failed");
      const auto status = failure->kind == common::ErrorKind::Cancelled
                              ? store::RunStatus::Cancelled
                              : store::RunStatus::Failed;
      return journal.finish(status, std::move(state), std::move(failure));
    }
    checkpoint(*revision, context, completed, "running");
  }

  checkpoint(*revision, context, completed, cancelled ? "failed" : "done");
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
