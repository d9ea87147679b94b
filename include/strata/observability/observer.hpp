#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace strata::observability {

struct RunStartEvent {
  std::string workflow;
  std::string run_id;
  std::uint64_t revision = 0;
  std::string scope;
};

struct RunEndEvent {
  std::string workflow;
  std::string run_id;
  std::string status;
  std::chrono::milliseconds duration{0};
};

struct StepEvent {
  std::string run_id;
  std::string step_id;
  std::uint32_t attempt = 0;
  std::chrono::milliseconds duration{0};
  bool success = false;
  std::string error;
};

struct PolicyDecisionEvent {
  std::string selector;
  std::string decision;
  std::size_t combinations = 0;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<RunStartEvent, RunEndEvent, StepEvent, PolicyDecisionEvent, ErrorEvent>;

struct RunLatencyMetric {
  std::string workflow;
  std::chrono::milliseconds latency{0};
};

struct StepRetryMetric {
  std::string step_id;
  std::uint32_t retries = 0;
};

struct CandidateCountMetric {
  std::string layer;
  std::size_t count = 0;
};

using ObserverMetric = std::variant<RunLatencyMetric, StepRetryMetric, CandidateCountMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace strata::observability
