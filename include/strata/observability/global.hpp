#pragma once

#include "strata/observability/observer.hpp"

#include <memory>

namespace strata::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_run_start(const std::string &workflow, const std::string &run_id,
                      std::uint64_t revision, const std::string &scope);
void record_run_end(const std::string &workflow, const std::string &run_id,
                    const std::string &status, std::chrono::milliseconds duration);
void record_step(const std::string &run_id, const std::string &step_id, std::uint32_t attempt,
                 std::chrono::milliseconds duration, bool success, const std::string &error = "");
void record_policy_decision(const std::string &selector, const std::string &decision,
                            std::size_t combinations, const std::string &reason);
void record_candidates(const std::string &layer, std::size_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace strata::observability
