#include "strata/observability/factory.hpp"

#include "strata/common/fs.hpp"
#include "strata/observability/log_observer.hpp"
#include "strata/observability/multi_observer.hpp"
#include "strata/observability/noop_observer.hpp"

#include <sstream>

namespace strata::observability {

namespace {

// Accepts "log" or "log:<level>".
std::unique_ptr<IObserver> make_log_observer(const std::string &spec) {
  const auto colon = spec.find(':');
  if (colon == std::string::npos) {
    return std::make_unique<LogObserver>();
  }
  return std::make_unique<LogObserver>(log_level_from_string(spec.substr(colon + 1)));
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (common::starts_with(backend, "log") && backend.find(',') == std::string::npos) {
    return make_log_observer(backend);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::to_lower(common::trim(part));
      if (common::starts_with(p, "log")) {
        multi->add(make_log_observer(p));
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>();
}

} // namespace strata::observability
