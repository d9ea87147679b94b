#pragma once

#include "strata/common/result.hpp"
#include "strata/scope/scope.hpp"
#include "strata/store/metadata_store.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace strata::scope {

/// Owns the deployment's tenant identity schema. Provisioning locks the schema into the
/// service metadata record; later validation runs against the cached copy only.
class TenancyManager {
public:
  explicit TenancyManager(std::shared_ptr<store::IMetadataStore> store);

  /// First call persists the schema; later calls must present the same fingerprint.
  [[nodiscard]] common::Status provision(const ScopeSchema &schema);

  [[nodiscard]] bool provisioned() const;
  [[nodiscard]] const ScopeSchema &schema() const { return schema_; }
  [[nodiscard]] store::ServiceMeta meta() const;

  /// Orders caller values by the schema. Missing or unknown fields and malformed integers
  /// are rejected with ScopeSchemaMismatch.
  [[nodiscard]] common::Result<ScopeKey> validate(const ScopeValues &values) const;
  [[nodiscard]] common::Result<ScopeSelector> validate_selector(const SelectorSpec &spec) const;

  [[nodiscard]] common::Status bump_taxonomy_version();
  [[nodiscard]] common::Status record_pipeline_revision(const std::string &token);

private:
  [[nodiscard]] common::Status check_field_set(const std::vector<std::string> &names) const;
  [[nodiscard]] common::Status check_value(const ScopeField &field, const std::string &value) const;

  std::shared_ptr<store::IMetadataStore> store_;
  ScopeSchema schema_;
  store::ServiceMeta meta_;
  bool provisioned_ = false;
  mutable std::mutex mutex_;
};

/// Per-scope mutexes serializing the dedupe-and-commit section of concurrent writers.
/// Entries nobody holds are swept once the table doubles past its last live size.
class ScopeLocks {
public:
  static constexpr std::size_t kMinSweepSize = 64;

  [[nodiscard]] std::shared_ptr<std::mutex> lock_for(const ScopeKey &key);
  [[nodiscard]] std::size_t size() const;

private:
  void sweep_idle();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
  std::size_t sweep_at_ = kMinSweepSize;
};

} // namespace strata::scope
