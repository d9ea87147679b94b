#include "strata/store/memory_store.hpp"

#include <algorithm>
#include <mutex>
#include <set>

namespace strata::store {

namespace {

bool id_allowed(const std::vector<std::string> &ids, const std::string &id) {
  return ids.empty() || std::find(ids.begin(), ids.end(), id) != ids.end();
}

template <typename T> void apply_limit(std::vector<T> &values, const std::size_t limit) {
  if (limit > 0 && values.size() > limit) {
    values.resize(limit);
  }
}

} // namespace

InMemoryStore::InMemoryStore(const std::size_t max_run_logs)
    : max_run_logs_(std::max<std::size_t>(max_run_logs, 1)) {}

std::string_view InMemoryStore::name() const { return "memory"; }

common::Result<std::optional<ServiceMeta>> InMemoryStore::load_service_meta() {
  std::shared_lock lock(mutex_);
  return common::Result<std::optional<ServiceMeta>>::success(meta_);
}

common::Status InMemoryStore::save_service_meta(const ServiceMeta &meta) {
  std::unique_lock lock(mutex_);
  meta_ = meta;
  return common::Status::success();
}

common::Status InMemoryStore::provision(const scope::ScopeSchema &schema) {
  std::unique_lock lock(mutex_);
  if (schema_.has_value() && schema_->fingerprint() != schema.fingerprint()) {
    return common::Status::error(common::ErrorKind::ScopeSchemaMismatch,
                                 "store already provisioned for schema " + schema_->describe());
  }
  schema_ = schema;
  return common::Status::success();
}

const InMemoryStore::Partition *InMemoryStore::find_partition(const scope::ScopeKey &scope) const {
  const auto it = partitions_.find(scope.id());
  return it == partitions_.end() ? nullptr : &it->second;
}

std::vector<const InMemoryStore::Partition *>
InMemoryStore::matching_partitions(const scope::ScopeSelector &selector) const {
  std::vector<const Partition *> out;
  if (selector.is_single_exact()) {
    const auto keys = selector.expand();
    if (!keys.empty()) {
      if (const auto *partition = find_partition(keys.front()); partition != nullptr) {
        out.push_back(partition);
      }
    }
    return out;
  }
  for (const auto &[_, partition] : partitions_) {
    if (selector.matches(partition.key)) {
      out.push_back(&partition);
    }
  }
  return out;
}

common::Result<std::optional<Resource>> InMemoryStore::get_resource(const scope::ScopeKey &scope,
                                                                    const std::string &id) {
  std::shared_lock lock(mutex_);
  std::optional<Resource> out;
  if (const auto *partition = find_partition(scope); partition != nullptr) {
    if (const auto it = partition->resources.find(id); it != partition->resources.end()) {
      out = it->second;
    }
  }
  return common::Result<std::optional<Resource>>::success(std::move(out));
}

common::Result<std::vector<Resource>>
InMemoryStore::list_resources(const scope::ScopeSelector &selector, const ResourceFilter &filter) {
  std::shared_lock lock(mutex_);
  std::vector<Resource> out;
  for (const auto *partition : matching_partitions(selector)) {
    for (const auto &[id, resource] : partition->resources) {
      if (!id_allowed(filter.ids, id)) {
        continue;
      }
      if (filter.content_hash.has_value() && resource.content_hash != *filter.content_hash) {
        continue;
      }
      if (filter.uri.has_value() && resource.uri != *filter.uri) {
        continue;
      }
      out.push_back(resource);
    }
  }
  std::sort(out.begin(), out.end(), [](const Resource &a, const Resource &b) {
    if (a.created_at != b.created_at) {
      return a.created_at > b.created_at;
    }
    return a.id < b.id;
  });
  apply_limit(out, filter.limit);
  return common::Result<std::vector<Resource>>::success(std::move(out));
}

common::Result<std::optional<MemoryItem>> InMemoryStore::get_item(const scope::ScopeKey &scope,
                                                                  const std::string &id) {
  std::shared_lock lock(mutex_);
  std::optional<MemoryItem> out;
  if (const auto *partition = find_partition(scope); partition != nullptr) {
    if (const auto it = partition->items.find(id); it != partition->items.end()) {
      out = it->second;
    }
  }
  return common::Result<std::optional<MemoryItem>>::success(std::move(out));
}

common::Result<std::vector<MemoryItem>>
InMemoryStore::list_items(const scope::ScopeSelector &selector, const ItemFilter &filter) {
  std::shared_lock lock(mutex_);
  std::vector<MemoryItem> out;
  for (const auto *partition : matching_partitions(selector)) {
    for (const auto &[id, item] : partition->items) {
      if (!id_allowed(filter.ids, id)) {
        continue;
      }
      if (filter.active_only && !item.active) {
        continue;
      }
      if (filter.resource_id.has_value() && item.resource_id != *filter.resource_id) {
        continue;
      }
      if (filter.content_hash.has_value() && item.content_hash != *filter.content_hash) {
        continue;
      }
      if (filter.subject.has_value() && item.subject != *filter.subject) {
        continue;
      }
      if (filter.memory_type.has_value() && item.memory_type != *filter.memory_type) {
        continue;
      }
      if (filter.lineage_id.has_value() && item.lineage_id != *filter.lineage_id) {
        continue;
      }
      if (!matches_terms(item.text, filter.terms)) {
        continue;
      }
      out.push_back(item);
    }
  }
  std::sort(out.begin(), out.end(), [](const MemoryItem &a, const MemoryItem &b) {
    if (a.updated_at != b.updated_at) {
      return a.updated_at > b.updated_at;
    }
    return a.id < b.id;
  });
  apply_limit(out, filter.limit);
  return common::Result<std::vector<MemoryItem>>::success(std::move(out));
}

common::Result<std::optional<MemoryCategory>>
InMemoryStore::get_category(const scope::ScopeKey &scope, const std::string &id) {
  std::shared_lock lock(mutex_);
  std::optional<MemoryCategory> out;
  if (const auto *partition = find_partition(scope); partition != nullptr) {
    if (const auto it = partition->categories.find(id); it != partition->categories.end()) {
      out = it->second;
    }
  }
  return common::Result<std::optional<MemoryCategory>>::success(std::move(out));
}

common::Result<std::vector<MemoryCategory>>
InMemoryStore::list_categories(const scope::ScopeSelector &selector, const CategoryFilter &filter) {
  std::shared_lock lock(mutex_);
  std::vector<MemoryCategory> out;
  for (const auto *partition : matching_partitions(selector)) {
    for (const auto &[id, category] : partition->categories) {
      if (!id_allowed(filter.ids, id)) {
        continue;
      }
      if (filter.name.has_value() && category.name != *filter.name) {
        continue;
      }
      out.push_back(category);
    }
  }
  std::sort(out.begin(), out.end(), [](const MemoryCategory &a, const MemoryCategory &b) {
    if (a.name != b.name) {
      return a.name < b.name;
    }
    return a.scope < b.scope;
  });
  apply_limit(out, filter.limit);
  return common::Result<std::vector<MemoryCategory>>::success(std::move(out));
}

common::Result<std::vector<CategoryItem>>
InMemoryStore::list_links(const scope::ScopeSelector &selector, const LinkFilter &filter) {
  std::shared_lock lock(mutex_);
  std::vector<CategoryItem> out;
  for (const auto *partition : matching_partitions(selector)) {
    for (const auto &[_, link] : partition->links) {
      if (!id_allowed(filter.category_ids, link.category_id) ||
          !id_allowed(filter.item_ids, link.item_id)) {
        continue;
      }
      out.push_back(link);
    }
  }
  return common::Result<std::vector<CategoryItem>>::success(std::move(out));
}

common::Result<std::optional<Intention>> InMemoryStore::get_intention(const scope::ScopeKey &scope) {
  std::shared_lock lock(mutex_);
  std::optional<Intention> out;
  if (const auto *partition = find_partition(scope); partition != nullptr) {
    out = partition->intention;
  }
  return common::Result<std::optional<Intention>>::success(std::move(out));
}

common::Result<std::vector<Intention>>
InMemoryStore::list_intentions(const scope::ScopeSelector &selector) {
  std::shared_lock lock(mutex_);
  std::vector<Intention> out;
  for (const auto *partition : matching_partitions(selector)) {
    if (partition->intention.has_value()) {
      out.push_back(*partition->intention);
    }
  }
  return common::Result<std::vector<Intention>>::success(std::move(out));
}

common::Status InMemoryStore::commit(const WriteBatch &batch) {
  if (batch.empty()) {
    return common::Status::success();
  }
  auto scope_result = batch.common_scope();
  if (!scope_result.ok()) {
    return common::Status::error(scope_result.error_info());
  }
  const scope::ScopeKey key = *scope_result.value();

  std::unique_lock lock(mutex_);
  const Partition *existing = find_partition(key);

  // Validate every reference before touching the partition.
  std::set<std::string> resource_ids;
  std::set<std::string> item_ids;
  std::set<std::string> category_ids;
  for (const auto &resource : batch.resources()) {
    resource_ids.insert(resource.id);
  }
  for (const auto &item : batch.items()) {
    item_ids.insert(item.id);
  }
  for (const auto &category : batch.categories()) {
    category_ids.insert(category.id);
  }

  const auto has_resource = [&](const std::string &id) {
    return resource_ids.count(id) > 0 ||
           (existing != nullptr && existing->resources.count(id) > 0);
  };
  const auto has_item = [&](const std::string &id) {
    return item_ids.count(id) > 0 || (existing != nullptr && existing->items.count(id) > 0);
  };
  const auto has_category = [&](const std::string &id) {
    return category_ids.count(id) > 0 ||
           (existing != nullptr && existing->categories.count(id) > 0);
  };

  for (const auto &item : batch.items()) {
    if (!has_resource(item.resource_id)) {
      return common::Status::error(common::ErrorKind::Validation,
                                   "item " + item.id + " references unknown resource " +
                                       item.resource_id);
    }
  }
  for (const auto &link : batch.links()) {
    if (!has_category(link.category_id) || !has_item(link.item_id)) {
      return common::Status::error(common::ErrorKind::Validation,
                                   "category link " + link.category_id + "/" + link.item_id +
                                       " references an entity outside the scope");
    }
  }
  for (const auto &category : batch.categories()) {
    if (existing == nullptr) {
      break;
    }
    for (const auto &[id, stored] : existing->categories) {
      if (stored.name == category.name && id != category.id) {
        return common::Status::error(common::ErrorKind::Validation,
                                     "category name already exists in scope: " + category.name);
      }
    }
  }

  auto &partition = partitions_[key.id()];
  partition.key = key;
  for (const auto &resource : batch.resources()) {
    partition.resources[resource.id] = resource;
  }
  for (const auto &item : batch.items()) {
    partition.items[item.id] = item;
  }
  for (const auto &category : batch.categories()) {
    partition.categories[category.id] = category;
  }
  for (const auto &link : batch.links()) {
    partition.links[{link.category_id, link.item_id}] = link;
  }
  for (const auto &link : batch.unlinks()) {
    partition.links.erase({link.category_id, link.item_id});
  }
  if (batch.intention().has_value()) {
    partition.intention = *batch.intention();
  }
  for (const auto &diff : batch.diffs()) {
    partition.diffs.push_back(diff);
  }
  return common::Status::success();
}

common::Result<PurgeStats> InMemoryStore::purge_scope(const scope::ScopeKey &scope) {
  std::unique_lock lock(mutex_);
  PurgeStats stats;
  const auto it = partitions_.find(scope.id());
  if (it != partitions_.end()) {
    stats.resources = it->second.resources.size();
    stats.items = it->second.items.size();
    stats.categories = it->second.categories.size();
    stats.links = it->second.links.size();
    partitions_.erase(it);
  }
  return common::Result<PurgeStats>::success(stats);
}

common::Status InMemoryStore::put_run_log(const RunLog &log) {
  std::unique_lock lock(mutex_);
  if (run_logs_.count(log.run_id) == 0) {
    run_order_.push_back(log.run_id);
  }
  run_logs_[log.run_id] = log;
  while (run_order_.size() > max_run_logs_) {
    run_logs_.erase(run_order_.front());
    run_order_.pop_front();
  }
  return common::Status::success();
}

common::Result<std::optional<RunLog>> InMemoryStore::get_run_log(const std::string &run_id) {
  std::shared_lock lock(mutex_);
  std::optional<RunLog> out;
  if (const auto it = run_logs_.find(run_id); it != run_logs_.end()) {
    out = it->second;
  }
  return common::Result<std::optional<RunLog>>::success(std::move(out));
}

common::Result<std::vector<RunLog>> InMemoryStore::list_run_logs(const std::size_t limit) {
  std::shared_lock lock(mutex_);
  std::vector<RunLog> out;
  for (auto it = run_order_.rbegin(); it != run_order_.rend(); ++it) {
    if (limit > 0 && out.size() >= limit) {
      break;
    }
    out.push_back(run_logs_.at(*it));
  }
  return common::Result<std::vector<RunLog>>::success(std::move(out));
}

common::Result<std::vector<DiffRecord>> InMemoryStore::list_diffs(const scope::ScopeKey &scope,
                                                                  const std::size_t limit) {
  std::shared_lock lock(mutex_);
  std::vector<DiffRecord> out;
  if (const auto *partition = find_partition(scope); partition != nullptr) {
    for (auto it = partition->diffs.rbegin(); it != partition->diffs.rend(); ++it) {
      if (limit > 0 && out.size() >= limit) {
        break;
      }
      out.push_back(*it);
    }
  }
  return common::Result<std::vector<DiffRecord>>::success(std::move(out));
}

common::Status InMemoryStore::put_checkpoint(const Checkpoint &checkpoint) {
  std::unique_lock lock(mutex_);
  checkpoints_[checkpoint.run_id] = checkpoint;
  return common::Status::success();
}

common::Result<std::optional<Checkpoint>>
InMemoryStore::get_checkpoint(const std::string &run_id) {
  std::shared_lock lock(mutex_);
  std::optional<Checkpoint> out;
  if (const auto it = checkpoints_.find(run_id); it != checkpoints_.end()) {
    out = it->second;
  }
  return common::Result<std::optional<Checkpoint>>::success(std::move(out));
}

common::Result<std::vector<Checkpoint>>
InMemoryStore::list_checkpoints(const std::string &status) {
  std::shared_lock lock(mutex_);
  std::vector<Checkpoint> out;
  for (const auto &[_, checkpoint] : checkpoints_) {
    if (status.empty() || checkpoint.status == status) {
      out.push_back(checkpoint);
    }
  }
  return common::Result<std::vector<Checkpoint>>::success(std::move(out));
}

common::Status InMemoryStore::delete_checkpoint(const std::string &run_id) {
  std::unique_lock lock(mutex_);
  checkpoints_.erase(run_id);
  return common::Status::success();
}

bool InMemoryStore::health_check() { return true; }

} // namespace strata::store
