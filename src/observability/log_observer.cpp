#include "strata/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace strata::observability {

namespace {

std::string_view level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

LogLevel log_level_from_string(const std::string_view value) {
  if (value == "debug") {
    return LogLevel::Debug;
  }
  if (value == "warn") {
    return LogLevel::Warn;
  }
  if (value == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

void LogObserver::log_line(const LogLevel level, const std::string &message) const {
  if (level < min_level_) {
    return;
  }
  std::cerr << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RunStartEvent>) {
          log_line(LogLevel::Info, "run.start workflow=" + evt.workflow + " run=" + evt.run_id +
                               " revision=" + std::to_string(evt.revision) + " scope=" + evt.scope);
        } else if constexpr (std::is_same_v<T, RunEndEvent>) {
          log_line(LogLevel::Info, "run.end workflow=" + evt.workflow + " run=" + evt.run_id +
                               " status=" + evt.status +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, StepEvent>) {
          if (evt.success) {
            log_line(LogLevel::Debug, "step run=" + evt.run_id + " id=" + evt.step_id +
                                  " attempt=" + std::to_string(evt.attempt) +
                                  " duration_ms=" + std::to_string(evt.duration.count()));
          } else {
            log_line(LogLevel::Warn, "step.failed run=" + evt.run_id + " id=" + evt.step_id +
                                 " attempt=" + std::to_string(evt.attempt) + " error=" + evt.error);
          }
        } else if constexpr (std::is_same_v<T, PolicyDecisionEvent>) {
          log_line(LogLevel::Info, "policy selector=" + evt.selector + " decision=" + evt.decision +
                               " combinations=" + std::to_string(evt.combinations) +
                               (evt.reason.empty() ? std::string() : " reason=" + evt.reason));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RunLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.run_latency_ms workflow=" + m.workflow + " value=" +
                                std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, StepRetryMetric>) {
          log_line(LogLevel::Debug, "metric.step_retries step=" + m.step_id +
                                " value=" + std::to_string(m.retries));
        } else if constexpr (std::is_same_v<T, CandidateCountMetric>) {
          log_line(LogLevel::Debug,
                   "metric.candidates layer=" + m.layer + " value=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace strata::observability
