#include "strata/pipeline/step.hpp"

#include "strata/common/fs.hpp"

#include <cstdlib>

namespace strata::pipeline {

std::string role_to_string(const Role role) {
  switch (role) {
  case Role::Ingestion:
    return "ingestion";
  case Role::Preprocessing:
    return "preprocessing";
  case Role::Extraction:
    return "extraction";
  case Role::Deduplication:
    return "deduplication";
  case Role::Clustering:
    return "clustering";
  case Role::Routing:
    return "routing";
  case Role::Verification:
    return "verification";
  case Role::Persistence:
    return "persistence";
  case Role::Custom:
    return "custom";
  }
  return "custom";
}

common::Result<Role> role_from_string(const std::string_view value) {
  for (const Role role :
       {Role::Ingestion, Role::Preprocessing, Role::Extraction, Role::Deduplication,
        Role::Clustering, Role::Routing, Role::Verification, Role::Persistence, Role::Custom}) {
    if (role_to_string(role) == value) {
      return common::Result<Role>::success(role);
    }
  }
  return common::Result<Role>::failure(common::ErrorKind::Validation,
                                       "unknown step role: " + std::string(value));
}

std::vector<capability::Capability> default_capabilities(const Role role) {
  using capability::Capability;
  switch (role) {
  case Role::Extraction:
  case Role::Verification:
    return {Capability::Llm};
  case Role::Persistence:
    return {Capability::StoreWrite};
  case Role::Ingestion:
  case Role::Preprocessing:
  case Role::Deduplication:
  case Role::Clustering:
  case Role::Routing:
  case Role::Custom:
    return {};
  }
  return {};
}

std::vector<capability::Capability> StepSpec::required_capabilities() const {
  return capabilities.has_value() ? *capabilities : default_capabilities(role);
}

StepContext::StepContext(const StepServices &services, const StepSpec &step,
                         const std::atomic<bool> *cancel,
                         std::shared_ptr<const std::atomic<bool>> abandoned)
    : services_(services), step_(step), cancel_(cancel), abandoned_(std::move(abandoned)) {}

std::string StepContext::config_string(const std::string &key, const std::string &fallback) const {
  const auto it = step_.config.find(key);
  return it == step_.config.end() ? fallback : it->second;
}

std::size_t StepContext::config_size(const std::string &key, const std::size_t fallback) const {
  const auto it = step_.config.find(key);
  if (it == step_.config.end()) {
    return fallback;
  }
  char *end = nullptr;
  const auto value = std::strtoull(it->second.c_str(), &end, 10);
  return end == it->second.c_str() ? fallback : static_cast<std::size_t>(value);
}

double StepContext::config_double(const std::string &key, const double fallback) const {
  const auto it = step_.config.find(key);
  if (it == step_.config.end()) {
    return fallback;
  }
  char *end = nullptr;
  const double value = std::strtod(it->second.c_str(), &end);
  return end == it->second.c_str() ? fallback : value;
}

bool StepContext::config_bool(const std::string &key, const bool fallback) const {
  const auto it = step_.config.find(key);
  if (it == step_.config.end()) {
    return fallback;
  }
  const std::string value = common::to_lower(common::trim(it->second));
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "off") {
    return false;
  }
  return fallback;
}

bool StepContext::cancelled() const {
  if (cancel_ != nullptr && cancel_->load()) {
    return true;
  }
  return abandoned_ != nullptr && abandoned_->load();
}

} // namespace strata::pipeline
