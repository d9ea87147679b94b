#pragma once

#include <string>

namespace strata::common {

/// UTC timestamp with millisecond precision, e.g. 2024-05-01T10:00:00.123Z.
[[nodiscard]] std::string now_rfc3339();

/// Age in days of an RFC3339 timestamp; negative input or parse failure yields 0.
[[nodiscard]] double age_days(const std::string &timestamp);

/// Exponential decay in [0, 1] with the given half-life.
[[nodiscard]] double recency_score(const std::string &updated_at, double half_life_days);

} // namespace strata::common
