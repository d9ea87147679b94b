#pragma once

#include <string>
#include <string_view>

namespace strata::common {

enum class ErrorKind {
  ScopeSchemaMismatch,
  PolicyViolation,
  CapabilityUnavailable,
  TransientStore,
  TransientCapability,
  Validation,
  NotFound,
  Cancelled,
  Internal,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

/// Transient kinds are the only ones the durable runner retries.
[[nodiscard]] bool is_retryable(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::Internal;
  std::string message;
  std::string scope;
  std::string step_id;
  std::string run_id;

  [[nodiscard]] std::string to_string() const;
};

} // namespace strata::common
