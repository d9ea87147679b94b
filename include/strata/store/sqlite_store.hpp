#pragma once

#include "strata/store/metadata_store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace strata::store {

/// Embedded file-backed backend. Every table leads with the scope columns (`s_<field>`),
/// which prefix the primary keys, secondary indexes and composite foreign keys.
class SqliteStore final : public IMetadataStore {
public:
  SqliteStore(std::filesystem::path db_path, std::uint32_t busy_timeout_ms);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore &) = delete;
  SqliteStore &operator=(const SqliteStore &) = delete;

  /// Opens the database file and creates the deployment metadata table.
  [[nodiscard]] common::Status open();

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
  [[nodiscard]] common::Status ensure_ready() const;
  [[nodiscard]] std::string scope_column_list() const;
  [[nodiscard]] std::string scope_where(const scope::ScopeSelector &selector,
                                        std::vector<std::string> &params) const;
  [[nodiscard]] scope::ScopeKey read_scope(sqlite3_stmt *stmt) const;

  [[nodiscard]] common::Result<std::vector<Resource>>
  query_resources(const std::string &where, const std::vector<std::string> &params,
                  const std::string &tail);
  [[nodiscard]] common::Result<std::vector<MemoryItem>>
  query_items(const std::string &where, const std::vector<std::string> &params,
              const std::string &tail);
  [[nodiscard]] common::Result<std::vector<MemoryCategory>>
  query_categories(const std::string &where, const std::vector<std::string> &params,
                   const std::string &tail);
  [[nodiscard]] common::Result<std::vector<Intention>>
  query_intentions(const std::string &where, const std::vector<std::string> &params);
  [[nodiscard]] common::Result<std::vector<RunLog>>
  query_run_logs(const std::string &where, const std::vector<std::string> &params,
                 const std::string &tail);
  [[nodiscard]] common::Result<std::vector<Checkpoint>>
  query_checkpoints(const std::string &where, const std::vector<std::string> &params);

  [[nodiscard]] common::Status write_batch(const WriteBatch &batch);

  std::filesystem::path db_path_;
  std::uint32_t busy_timeout_ms_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  std::vector<std::string> scope_fields_;
};

} // namespace strata::store
