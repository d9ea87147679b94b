#pragma once

#include "strata/observability/observer.hpp"

namespace strata::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] LogLevel log_level_from_string(std::string_view value);

class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message) const;

  LogLevel min_level_;
};

} // namespace strata::observability
