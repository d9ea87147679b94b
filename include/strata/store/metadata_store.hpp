#pragma once

#include "strata/common/result.hpp"
#include "strata/scope/scope.hpp"
#include "strata/store/records.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::store {

struct ResourceFilter {
  std::vector<std::string> ids;
  std::optional<std::string> content_hash;
  std::optional<std::string> uri;
  std::size_t limit = 0;
};

struct ItemFilter {
  std::optional<std::string> resource_id;
  std::vector<std::string> ids;
  bool active_only = true;
  std::optional<std::string> content_hash;
  std::optional<std::string> subject;
  std::optional<std::string> memory_type;
  std::optional<std::string> lineage_id;
  // Case-insensitive substring terms; an item matches when any term occurs in its text.
  std::vector<std::string> terms;
  std::size_t limit = 0;
};

struct CategoryFilter {
  std::vector<std::string> ids;
  std::optional<std::string> name;
  std::size_t limit = 0;
};

struct LinkFilter {
  std::vector<std::string> category_ids;
  std::vector<std::string> item_ids;
};

/// Ordered set of writes applied atomically by IMetadataStore::commit. All writes in a
/// batch must belong to the same scope.
class WriteBatch {
public:
  void put_resource(Resource resource) { resources_.push_back(std::move(resource)); }
  void put_item(MemoryItem item) { items_.push_back(std::move(item)); }
  void put_category(MemoryCategory category) { categories_.push_back(std::move(category)); }
  void put_link(CategoryItem link) { links_.push_back(std::move(link)); }
  void delete_link(const scope::ScopeKey &scope, std::string category_id, std::string item_id) {
    unlinks_.push_back(CategoryItem{.scope = scope,
                                    .category_id = std::move(category_id),
                                    .item_id = std::move(item_id),
                                    .created_at = ""});
  }
  void put_intention(Intention intention) { intention_ = std::move(intention); }
  void put_diff(DiffRecord diff) { diffs_.push_back(std::move(diff)); }

  [[nodiscard]] const std::vector<Resource> &resources() const { return resources_; }
  [[nodiscard]] const std::vector<MemoryItem> &items() const { return items_; }
  [[nodiscard]] const std::vector<MemoryCategory> &categories() const { return categories_; }
  [[nodiscard]] const std::vector<CategoryItem> &links() const { return links_; }
  [[nodiscard]] const std::vector<CategoryItem> &unlinks() const { return unlinks_; }
  [[nodiscard]] const std::optional<Intention> &intention() const { return intention_; }
  [[nodiscard]] const std::vector<DiffRecord> &diffs() const { return diffs_; }

  [[nodiscard]] bool empty() const;
  [[nodiscard]] std::size_t size() const;

  /// The single scope every write targets; fails when the batch mixes scopes.
  [[nodiscard]] common::Result<std::optional<scope::ScopeKey>> common_scope() const;

private:
  std::vector<Resource> resources_;
  std::vector<MemoryItem> items_;
  std::vector<MemoryCategory> categories_;
  std::vector<CategoryItem> links_;
  std::vector<CategoryItem> unlinks_;
  std::optional<Intention> intention_;
  std::vector<DiffRecord> diffs_;
};

struct PurgeStats {
  std::size_t resources = 0;
  std::size_t items = 0;
  std::size_t categories = 0;
  std::size_t links = 0;
};

/// Scope-filtered persistence for the memory hierarchy, run logs and deployment metadata.
class IMetadataStore {
public:
  virtual ~IMetadataStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  [[nodiscard]] virtual common::Result<std::optional<ServiceMeta>> load_service_meta() = 0;
  [[nodiscard]] virtual common::Status save_service_meta(const ServiceMeta &meta) = 0;
  /// Prepares scope-partitioned storage for the schema. Idempotent for the same schema.
  [[nodiscard]] virtual common::Status provision(const scope::ScopeSchema &schema) = 0;

  [[nodiscard]] virtual common::Result<std::optional<Resource>>
  get_resource(const scope::ScopeKey &scope, const std::string &id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<Resource>>
  list_resources(const scope::ScopeSelector &selector, const ResourceFilter &filter) = 0;

  [[nodiscard]] virtual common::Result<std::optional<MemoryItem>>
  get_item(const scope::ScopeKey &scope, const std::string &id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<MemoryItem>>
  list_items(const scope::ScopeSelector &selector, const ItemFilter &filter) = 0;

  [[nodiscard]] virtual common::Result<std::optional<MemoryCategory>>
  get_category(const scope::ScopeKey &scope, const std::string &id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<MemoryCategory>>
  list_categories(const scope::ScopeSelector &selector, const CategoryFilter &filter) = 0;

  [[nodiscard]] virtual common::Result<std::vector<CategoryItem>>
  list_links(const scope::ScopeSelector &selector, const LinkFilter &filter) = 0;

  [[nodiscard]] virtual common::Result<std::optional<Intention>>
  get_intention(const scope::ScopeKey &scope) = 0;
  [[nodiscard]] virtual common::Result<std::vector<Intention>>
  list_intentions(const scope::ScopeSelector &selector) = 0;

  /// Applies every write or none. Cross-scope references abort the whole batch.
  [[nodiscard]] virtual common::Status commit(const WriteBatch &batch) = 0;
  /// Hard-deletes every row of one tenant; the only path that removes items.
  [[nodiscard]] virtual common::Result<PurgeStats> purge_scope(const scope::ScopeKey &scope) = 0;

  [[nodiscard]] virtual common::Status put_run_log(const RunLog &log) = 0;
  [[nodiscard]] virtual common::Result<std::optional<RunLog>>
  get_run_log(const std::string &run_id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<RunLog>> list_run_logs(std::size_t limit) = 0;

  [[nodiscard]] virtual common::Result<std::vector<DiffRecord>>
  list_diffs(const scope::ScopeKey &scope, std::size_t limit) = 0;

  [[nodiscard]] virtual common::Status put_checkpoint(const Checkpoint &checkpoint) = 0;
  [[nodiscard]] virtual common::Result<std::optional<Checkpoint>>
  get_checkpoint(const std::string &run_id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<Checkpoint>>
  list_checkpoints(const std::string &status) = 0;
  [[nodiscard]] virtual common::Status delete_checkpoint(const std::string &run_id) = 0;

  [[nodiscard]] virtual bool health_check() = 0;
};

/// Matches `text` against lowercase filter terms.
[[nodiscard]] bool matches_terms(const std::string &text, const std::vector<std::string> &terms);

} // namespace strata::store
