#include "strata/scope/tenancy.hpp"

#include "strata/common/time.hpp"

#include <algorithm>
#include <cctype>

namespace strata::scope {

namespace {

bool is_integer_literal(const std::string &value) {
  std::size_t start = 0;
  if (!value.empty() && (value.front() == '-' || value.front() == '+')) {
    start = 1;
  }
  if (start >= value.size()) {
    return false;
  }
  return std::all_of(value.begin() + static_cast<std::ptrdiff_t>(start), value.end(),
                     [](const char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
}

} // namespace

TenancyManager::TenancyManager(std::shared_ptr<store::IMetadataStore> store)
    : store_(std::move(store)) {}

common::Status TenancyManager::provision(const ScopeSchema &schema) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (schema.empty()) {
    return common::Status::error(common::ErrorKind::Validation, "scope schema has no fields");
  }
  if (provisioned_ && schema_.fingerprint() != schema.fingerprint()) {
    return common::Status::error(common::ErrorKind::ScopeSchemaMismatch,
                                 "deployment is provisioned for {" + schema_.describe() +
                                     "}; refusing {" + schema.describe() + "}");
  }

  auto loaded = store_->load_service_meta();
  if (!loaded.ok()) {
    return common::Status::error(loaded.error_info());
  }

  store::ServiceMeta meta;
  if (loaded.value().has_value()) {
    meta = *loaded.value();
    if (meta.fingerprint != schema.fingerprint()) {
      return common::Status::error(common::ErrorKind::ScopeSchemaMismatch,
                                   "deployment is provisioned for {" + meta.fields +
                                       "}; refusing {" + schema.describe() +
                                       "} (operator migration required)");
    }
  } else {
    const std::string now = common::now_rfc3339();
    meta = store::ServiceMeta{.fingerprint = schema.fingerprint(),
                              .schema_version = 1,
                              .fields = schema.describe(),
                              .taxonomy_version = 1,
                              .pipeline_revision = "",
                              .created_at = now,
                              .updated_at = now};
  }

  auto status = store_->provision(schema);
  if (!status.ok()) {
    return status;
  }
  if (!loaded.value().has_value()) {
    status = store_->save_service_meta(meta);
    if (!status.ok()) {
      return status;
    }
  }

  schema_ = schema;
  meta_ = std::move(meta);
  provisioned_ = true;
  return common::Status::success();
}

bool TenancyManager::provisioned() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return provisioned_;
}

store::ServiceMeta TenancyManager::meta() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return meta_;
}

common::Status TenancyManager::check_field_set(const std::vector<std::string> &names) const {
  std::vector<std::string> missing;
  std::vector<std::string> unknown;
  for (const auto &field : schema_.fields()) {
    if (std::find(names.begin(), names.end(), field.name) == names.end()) {
      missing.push_back(field.name);
    }
  }
  for (const auto &name : names) {
    if (schema_.find(name) == nullptr) {
      unknown.push_back(name);
    }
  }
  if (missing.empty() && unknown.empty()) {
    return common::Status::success();
  }

  std::string message = "scope does not match schema {" + schema_.describe() + "}";
  if (!missing.empty()) {
    message += "; missing:";
    for (const auto &name : missing) {
      message += " " + name;
    }
  }
  if (!unknown.empty()) {
    message += "; unknown:";
    for (const auto &name : unknown) {
      message += " " + name;
    }
  }
  return common::Status::error(common::ErrorKind::ScopeSchemaMismatch, message);
}

common::Status TenancyManager::check_value(const ScopeField &field,
                                           const std::string &value) const {
  if (value.empty()) {
    return common::Status::error(common::ErrorKind::ScopeSchemaMismatch,
                                 "scope field " + field.name + " is empty");
  }
  const auto control = std::find_if(value.begin(), value.end(), [](const char c) {
    const auto byte = static_cast<unsigned char>(c);
    return byte < 0x20 || byte == 0x7f;
  });
  if (control != value.end()) {
    return common::Status::error(common::ErrorKind::ScopeSchemaMismatch,
                                 "scope field " + field.name + " contains a control character");
  }
  if (field.type == FieldType::Integer && !is_integer_literal(value)) {
    return common::Status::error(common::ErrorKind::ScopeSchemaMismatch,
                                 "scope field " + field.name + " expects an integer, got '" +
                                     value + "'");
  }
  return common::Status::success();
}

common::Result<ScopeKey> TenancyManager::validate(const ScopeValues &values) const {
  if (!provisioned()) {
    return common::Result<ScopeKey>::failure(common::ErrorKind::Internal,
                                             "tenancy schema is not provisioned");
  }

  std::vector<std::string> names;
  names.reserve(values.size());
  for (const auto &[name, _] : values) {
    names.push_back(name);
  }
  if (auto status = check_field_set(names); !status.ok()) {
    return common::Result<ScopeKey>::failure(status.error_info());
  }

  std::vector<std::pair<std::string, std::string>> entries;
  entries.reserve(schema_.size());
  for (const auto &field : schema_.fields()) {
    const auto &value = values.at(field.name);
    if (auto status = check_value(field, value); !status.ok()) {
      return common::Result<ScopeKey>::failure(status.error_info());
    }
    entries.emplace_back(field.name, value);
  }
  return common::Result<ScopeKey>::success(ScopeKey(std::move(entries)));
}

common::Result<ScopeSelector> TenancyManager::validate_selector(const SelectorSpec &spec) const {
  using Out = common::Result<ScopeSelector>;
  if (!provisioned()) {
    return Out::failure(common::ErrorKind::Internal, "tenancy schema is not provisioned");
  }

  std::vector<std::string> names;
  names.reserve(spec.size());
  for (const auto &[name, _] : spec) {
    names.push_back(name);
  }
  if (auto status = check_field_set(names); !status.ok()) {
    return Out::failure(status.error_info());
  }

  std::vector<std::pair<std::string, FieldMatch>> matches;
  matches.reserve(schema_.size());
  for (const auto &field : schema_.fields()) {
    FieldMatch match = spec.at(field.name);
    if (match.mode == MatchMode::Exact && match.values.size() != 1) {
      return Out::failure(common::ErrorKind::ScopeSchemaMismatch,
                          "exact match on " + field.name + " needs exactly one value");
    }
    if (match.mode == MatchMode::AnyOf && match.values.empty()) {
      return Out::failure(common::ErrorKind::ScopeSchemaMismatch,
                          "value set for " + field.name + " is empty");
    }
    if (match.mode == MatchMode::Wildcard) {
      match.values.clear();
    }

    std::vector<std::string> unique_values;
    for (const auto &value : match.values) {
      if (auto status = check_value(field, value); !status.ok()) {
        return Out::failure(status.error_info());
      }
      if (std::find(unique_values.begin(), unique_values.end(), value) == unique_values.end()) {
        unique_values.push_back(value);
      }
    }
    match.values = std::move(unique_values);
    matches.emplace_back(field.name, std::move(match));
  }
  return Out::success(ScopeSelector(std::move(matches)));
}

common::Status TenancyManager::bump_taxonomy_version() {
  std::lock_guard<std::mutex> lock(mutex_);
  store::ServiceMeta updated = meta_;
  ++updated.taxonomy_version;
  updated.updated_at = common::now_rfc3339();
  auto status = store_->save_service_meta(updated);
  if (!status.ok()) {
    return status;
  }
  meta_ = std::move(updated);
  return common::Status::success();
}

common::Status TenancyManager::record_pipeline_revision(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (meta_.pipeline_revision == token) {
    return common::Status::success();
  }
  store::ServiceMeta updated = meta_;
  updated.pipeline_revision = token;
  updated.updated_at = common::now_rfc3339();
  auto status = store_->save_service_meta(updated);
  if (!status.ok()) {
    return status;
  }
  meta_ = std::move(updated);
  return common::Status::success();
}

std::shared_ptr<std::mutex> ScopeLocks::lock_for(const ScopeKey &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (locks_.size() >= sweep_at_ && locks_.count(key.id()) == 0) {
    sweep_idle();
  }
  auto &slot = locks_[key.id()];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

std::size_t ScopeLocks::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return locks_.size();
}

// A mutex only the table references has no holder and no waiter.
void ScopeLocks::sweep_idle() {
  for (auto it = locks_.begin(); it != locks_.end();) {
    if (it->second.use_count() == 1) {
      it = locks_.erase(it);
    } else {
      ++it;
    }
  }
  sweep_at_ = std::max(kMinSweepSize, locks_.size() * 2);
}

} // namespace strata::scope
