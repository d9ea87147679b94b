#include "strata/observability/global.hpp"

#include <mutex>

namespace strata::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_run_start(const std::string &workflow, const std::string &run_id,
                      const std::uint64_t revision, const std::string &scope) {
  record_event(RunStartEvent{
      .workflow = workflow, .run_id = run_id, .revision = revision, .scope = scope});
}

void record_run_end(const std::string &workflow, const std::string &run_id,
                    const std::string &status, const std::chrono::milliseconds duration) {
  record_event(
      RunEndEvent{.workflow = workflow, .run_id = run_id, .status = status, .duration = duration});
  record_metric(RunLatencyMetric{.workflow = workflow, .latency = duration});
}

void record_step(const std::string &run_id, const std::string &step_id,
                 const std::uint32_t attempt, const std::chrono::milliseconds duration,
                 const bool success, const std::string &error) {
  record_event(StepEvent{.run_id = run_id,
                         .step_id = step_id,
                         .attempt = attempt,
                         .duration = duration,
                         .success = success,
                         .error = error});
  if (attempt > 1) {
    record_metric(StepRetryMetric{.step_id = step_id, .retries = attempt - 1});
  }
}

void record_policy_decision(const std::string &selector, const std::string &decision,
                            const std::size_t combinations, const std::string &reason) {
  record_event(PolicyDecisionEvent{
      .selector = selector, .decision = decision, .combinations = combinations, .reason = reason});
}

void record_candidates(const std::string &layer, const std::size_t count) {
  record_metric(CandidateCountMetric{.layer = layer, .count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace strata::observability
