#pragma once

#include "strata/store/metadata_store.hpp"

#include <deque>
#include <map>
#include <shared_mutex>
#include <utility>

namespace strata::store {

/// Volatile backend. Each scope owns a separate partition; readers share the lock.
class InMemoryStore final : public IMetadataStore {
public:
  /// Run logs kept before the oldest are dropped.
  static constexpr std::size_t kDefaultMaxRunLogs = 1024;

  InMemoryStore() = default;
  explicit InMemoryStore(std::size_t max_run_logs);

  [[nodiscard]] std::string_view name() const override;

  [[nodiscard]] common::Result<std::optional<ServiceMeta>> load_service_meta() override;
  [[nodiscard]] common::Status save_service_meta(const ServiceMeta &meta) override;
  [[nodiscard]] common::Status provision(const scope::ScopeSchema &schema) override;

  [[nodiscard]] common::Result<std::optional<Resource>>
  get_resource(const scope::ScopeKey &scope, const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<Resource>>
  list_resources(const scope::ScopeSelector &selector, const ResourceFilter &filter) override;
  [[nodiscard]] common::Result<std::optional<MemoryItem>>
  get_item(const scope::ScopeKey &scope, const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<MemoryItem>>
  list_items(const scope::ScopeSelector &selector, const ItemFilter &filter) override;
  [[nodiscard]] common::Result<std::optional<MemoryCategory>>
  get_category(const scope::ScopeKey &scope, const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<MemoryCategory>>
  list_categories(const scope::ScopeSelector &selector, const CategoryFilter &filter) override;
  [[nodiscard]] common::Result<std::vector<CategoryItem>>
  list_links(const scope::ScopeSelector &selector, const LinkFilter &filter) override;
  [[nodiscard]] common::Result<std::optional<Intention>>
  get_intention(const scope::ScopeKey &scope) override;
  [[nodiscard]] common::Result<std::vector<Intention>>
  list_intentions(const scope::ScopeSelector &selector) override;

  [[nodiscard]] common::Status commit(const WriteBatch &batch) override;
  [[nodiscard]] common::Result<PurgeStats> purge_scope(const scope::ScopeKey &scope) override;

  [[nodiscard]] common::Status put_run_log(const RunLog &log) override;
  [[nodiscard]] common::Result<std::optional<RunLog>>
  get_run_log(const std::string &run_id) override;
  [[nodiscard]] common::Result<std::vector<RunLog>> list_run_logs(std::size_t limit) override;
  [[nodiscard]] common::Result<std::vector<DiffRecord>>
  list_diffs(const scope::ScopeKey &scope, std::size_t limit) override;

  [[nodiscard]] common::Status put_checkpoint(const Checkpoint &checkpoint) override;
  [[nodiscard]] common::Result<std::optional<Checkpoint>>
  get_checkpoint(const std::string &run_id) override;
  [[nodiscard]] common::Result<std::vector<Checkpoint>>
  list_checkpoints(const std::string &status) override;
  [[nodiscard]] common::Status delete_checkpoint(const std::string &run_id) override;

  [[nodiscard]] bool health_check() override;

private:
  struct Partition {
    scope::ScopeKey key;
    std::map<std::string, Resource> resources;
    std::map<std::string, MemoryItem> items;
    std::map<std::string, MemoryCategory> categories;
    std::map<std::pair<std::string, std::string>, CategoryItem> links;
    std::optional<Intention> intention;
    std::vector<DiffRecord> diffs;
  };

  /// Partitions the selector covers; a single exact selector is a direct lookup.
  [[nodiscard]] std::vector<const Partition *>
  matching_partitions(const scope::ScopeSelector &selector) const;
  [[nodiscard]] const Partition *find_partition(const scope::ScopeKey &scope) const;

  std::map<std::string, Partition> partitions_;
  std::optional<ServiceMeta> meta_;
  std::optional<scope::ScopeSchema> schema_;
  std::map<std::string, RunLog> run_logs_;
  std::deque<std::string> run_order_;
  std::size_t max_run_logs_ = kDefaultMaxRunLogs;
  std::map<std::string, Checkpoint> checkpoints_;
  mutable std::shared_mutex mutex_;
};

} // namespace strata::store
