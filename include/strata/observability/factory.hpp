#pragma once

#include "strata/config/schema.hpp"
#include "strata/observability/observer.hpp"

#include <memory>

namespace strata::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace strata::observability
