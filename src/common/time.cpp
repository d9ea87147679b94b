#include "strata/common/time.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace strata::common {

std::string now_rfc3339() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
      1000;
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

double age_days(const std::string &timestamp) {
  std::tm tm{};
  std::istringstream in(timestamp);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return 0.0;
  }

  const std::time_t updated_time = timegm(&tm);
  const auto updated = std::chrono::system_clock::from_time_t(updated_time);
  const auto age = std::chrono::system_clock::now() - updated;
  const double days =
      std::chrono::duration_cast<std::chrono::duration<double>>(age).count() / 86400.0;
  return days < 0.0 ? 0.0 : days;
}

double recency_score(const std::string &updated_at, const double half_life_days) {
  if (half_life_days <= 0.0) {
    return 0.0;
  }
  std::tm tm{};
  std::istringstream in(updated_at);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return 0.0;
  }
  return std::exp(-age_days(updated_at) / half_life_days);
}

} // namespace strata::common
