#include "strata/common/error.hpp"

namespace strata::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ScopeSchemaMismatch:
    return "scope_schema_mismatch";
  case ErrorKind::PolicyViolation:
    return "policy_violation";
  case ErrorKind::CapabilityUnavailable:
    return "capability_unavailable";
  case ErrorKind::TransientStore:
    return "transient_store";
  case ErrorKind::TransientCapability:
    return "transient_capability";
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

bool is_retryable(const ErrorKind kind) {
  return kind == ErrorKind::TransientStore || kind == ErrorKind::TransientCapability;
}

std::string Error::to_string() const {
  std::string out = "[" + std::string(error_kind_name(kind)) + "] " + message;
  if (!run_id.empty()) {
    out += " run=" + run_id;
  }
  if (!step_id.empty()) {
    out += " step=" + step_id;
  }
  if (!scope.empty()) {
    out += " scope=" + scope;
  }
  return out;
}

} // namespace strata::common
