#include "strata/pipeline/builtin_steps.hpp"

#include "strata/common/hash.hpp"
#include "strata/common/time.hpp"
#include "strata/observability/global.hpp"
#include "strata/pipeline/taxonomy.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <sstream>
#include <unordered_map>

namespace strata::pipeline {

namespace {

using capability::Capability;
using common::ErrorKind;
using common::Status;

constexpr std::size_t kMaxCategoriesPerItem = 2;

std::string format_confidence(const double value) {
  std::ostringstream out;
  out.precision(3);
  out << value;
  return out.str();
}

/// Keeper first: highest confidence, then most reinforced, then oldest.
bool keeper_before(const store::MemoryItem &lhs, const store::MemoryItem &rhs) {
  if (lhs.confidence != rhs.confidence) {
    return lhs.confidence > rhs.confidence;
  }
  if (lhs.reinforcement_count != rhs.reinforcement_count) {
    return lhs.reinforcement_count > rhs.reinforcement_count;
  }
  return lhs.created_at != rhs.created_at ? lhs.created_at < rhs.created_at : lhs.id < rhs.id;
}

// ── select_targets ───────────────────────────────────────────────

Status select_targets(WorkflowState &state, const StepContext &ctx) {
  const auto &services = ctx.services();
  const auto &evolve = ctx.config().evolve;
  const auto selector = scope::ScopeSelector::for_key(state.scope);
  const double stale_after = state.evolve_request.stale_after_days.value_or(
      ctx.config_double("stale_after_days", evolve.stale_after_days));
  const std::size_t max_targets = state.evolve_request.max_targets.value_or(
      ctx.config_size("max_targets", evolve.max_targets));

  auto items = services.store->list_items(selector, store::ItemFilter{.active_only = true});
  if (!items.ok()) {
    return Status::error(items.error_info());
  }
  auto links = services.store->list_links(selector, store::LinkFilter{});
  if (!links.ok()) {
    return Status::error(links.error_info());
  }
  std::set<std::string> linked;
  for (const auto &link : links.value()) {
    linked.insert(link.item_id);
  }
  std::map<std::string, std::size_t> hash_counts;
  for (const auto &item : items.value()) {
    ++hash_counts[item.content_hash];
  }

  EvolveTargets targets;
  std::vector<store::MemoryItem> duplicates;
  std::vector<store::MemoryItem> candidates;
  for (const auto &item : items.value()) {
    if (hash_counts[item.content_hash] > 1) {
      duplicates.push_back(item);
      continue;
    }
    const bool stale = common::age_days(item.updated_at) >= stale_after;
    if (state.evolve_request.force || stale || !linked.contains(item.id)) {
      candidates.push_back(item);
    }
  }
  std::sort(candidates.begin(), candidates.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.updated_at != rhs.updated_at ? lhs.updated_at < rhs.updated_at : lhs.id < rhs.id;
  });

  // Duplicate groups are resolved together, so they are never cut by the cap.
  targets.items = std::move(duplicates);
  for (auto &item : candidates) {
    if (max_targets > 0 && targets.items.size() >= max_targets) {
      break;
    }
    targets.items.push_back(std::move(item));
  }

  std::set<std::string> target_ids;
  for (const auto &item : targets.items) {
    target_ids.insert(item.id);
    if (!linked.contains(item.id)) {
      targets.unlinked_item_ids.push_back(item.id);
    }
  }
  std::set<std::string> category_ids;
  for (const auto &link : links.value()) {
    if (target_ids.contains(link.item_id)) {
      category_ids.insert(link.category_id);
    }
  }

  auto categories = services.store->list_categories(selector, store::CategoryFilter{});
  if (!categories.ok()) {
    return Status::error(categories.error_info());
  }
  for (auto &category : categories.value()) {
    if (state.evolve_request.force || category_ids.contains(category.id)) {
      targets.categories.push_back(std::move(category));
    }
  }

  observability::record_candidates("evolve_targets", targets.items.size());
  state.targets = std::move(targets);
  return Status::success();
}

// ── refresh_items ────────────────────────────────────────────────

Status refresh_items(WorkflowState &state, const StepContext &ctx) {
  const auto &evolve = ctx.config().evolve;
  const double half_life = ctx.config_double("confidence_half_life_days",
                                             evolve.confidence_half_life_days);
  const double min_delta =
      ctx.config_double("min_confidence_delta", evolve.min_confidence_delta);
  const std::string now = common::now_rfc3339();

  RevisionPlan plan;
  std::map<std::string, std::vector<store::MemoryItem>> by_hash;
  for (const auto &item : state.targets.items) {
    by_hash[item.content_hash].push_back(item);
  }

  for (auto &[hash, group] : by_hash) {
    std::sort(group.begin(), group.end(), keeper_before);
    store::MemoryItem keeper = group.front();
    bool keeper_changed = false;

    for (std::size_t i = 1; i < group.size(); ++i) {
      store::MemoryItem duplicate = group[i];
      duplicate.active = false;
      duplicate.superseded_by = keeper.id;
      duplicate.updated_at = now;
      keeper.reinforcement_count += duplicate.reinforcement_count + 1;
      keeper_changed = true;
      plan.changes.push_back(store::DiffChange{.kind = "item_deactivated",
                                               .target_id = duplicate.id,
                                               .detail = "duplicate of " + keeper.id});
      plan.updated.push_back(std::move(duplicate));
    }

    if (!keeper.stable && half_life > 0.0) {
      const double age = common::age_days(keeper.updated_at);
      const double decayed = keeper.confidence * std::pow(0.5, age / half_life);
      if (keeper.confidence - decayed >= min_delta) {
        store::MemoryItem revised = keeper;
        revised.id = common::random_id("mem_");
        revised.version = keeper.version + 1;
        revised.confidence = decayed;
        revised.created_at = now;
        revised.updated_at = now;
        revised.superseded_by.reset();

        plan.changes.push_back(store::DiffChange{
            .kind = "item_revised",
            .target_id = revised.id,
            .detail = "confidence " + format_confidence(keeper.confidence) + " -> " +
                      format_confidence(decayed) + " (was " + keeper.id + ")"});
        // Anything pointing at the keeper now points at its successor.
        for (auto &retired : plan.updated) {
          if (retired.superseded_by == keeper.id) {
            retired.superseded_by = revised.id;
          }
        }
        keeper.active = false;
        keeper.superseded_by = revised.id;
        keeper.updated_at = now;
        plan.updated.push_back(std::move(keeper));
        plan.created.push_back(std::move(revised));
        continue;
      }
    }
    if (keeper_changed) {
      keeper.updated_at = now;
      plan.updated.push_back(std::move(keeper));
    }
  }

  const auto &embedder = ctx.services().embedder;
  for (auto &item : plan.created) {
    if (item.embedding.empty() && embedder) {
      auto embedded = embedder->embed(item.text);
      if (!embedded.ok()) {
        return Status::error(embedded.error_info());
      }
      item.embedding = std::move(embedded.value());
    }
  }

  state.revisions = std::move(plan);
  return Status::success();
}

// ── recluster_categories ─────────────────────────────────────────

Status recluster_categories(WorkflowState &state, const StepContext &ctx) {
  const auto &services = ctx.services();
  const auto &memorize = ctx.config().memorize;
  const auto selector = scope::ScopeSelector::for_key(state.scope);
  const std::string now = common::now_rfc3339();
  const std::size_t anchors_limit = ctx.config_size("anchors", memorize.anchors_per_category);
  const std::size_t summary_length =
      ctx.config_size("summary_target_length", memorize.category_summary_target_length);

  CategoryAssigner assigner(services, state.scope,
                            ctx.config_double("threshold", memorize.category_assign_threshold),
                            kMaxCategoriesPerItem, memorize.fallback_category);
  const auto loaded = assigner.load();
  if (!loaded.ok()) {
    return loaded;
  }

  CategoryPlan plan;
  std::set<std::string> affected;
  for (const auto &category : state.targets.categories) {
    affected.insert(category.id);
  }

  std::map<std::string, std::string> successors;
  std::set<std::string> retired;
  for (const auto &item : state.revisions.updated) {
    if (!item.active) {
      retired.insert(item.id);
      if (item.superseded_by.has_value()) {
        successors[item.id] = *item.superseded_by;
      }
    }
  }
  std::unordered_map<std::string, const store::MemoryItem *> created_by_id;
  for (const auto &item : state.revisions.created) {
    created_by_id[item.id] = &item;
  }

  const auto add_link = [&](const std::string &category_id, const std::string &item_id) {
    const bool duplicate =
        std::any_of(plan.links.begin(), plan.links.end(), [&](const store::CategoryItem &l) {
          return l.category_id == category_id && l.item_id == item_id;
        });
    if (duplicate) {
      return;
    }
    plan.links.push_back(store::CategoryItem{
        .scope = state.scope, .category_id = category_id, .item_id = item_id, .created_at = now});
    plan.changes.push_back(
        store::DiffChange{.kind = "item_linked", .target_id = item_id, .detail = category_id});
    affected.insert(category_id);
  };

  // Links follow an item to the active end of its supersession chain.
  std::vector<std::string> retired_ids(retired.begin(), retired.end());
  if (!retired_ids.empty()) {
    auto links = services.store->list_links(selector, store::LinkFilter{.item_ids = retired_ids});
    if (!links.ok()) {
      return Status::error(links.error_info());
    }
    for (const auto &link : links.value()) {
      std::string target = link.item_id;
      std::set<std::string> visited;
      while (successors.contains(target) && visited.insert(target).second) {
        target = successors[target];
      }
      if (target != link.item_id && !retired.contains(target)) {
        add_link(link.category_id, target);
      }
    }
  }

  for (const auto &item : state.targets.items) {
    const bool unlinked = std::find(state.targets.unlinked_item_ids.begin(),
                                    state.targets.unlinked_item_ids.end(),
                                    item.id) != state.targets.unlinked_item_ids.end();
    if (!unlinked || retired.contains(item.id)) {
      continue;
    }
    auto assigned = assigner.assign(item, {});
    if (!assigned.ok()) {
      return Status::error(assigned.error_info());
    }
    for (const auto &category_id : assigned.value()) {
      add_link(category_id, item.id);
    }
  }

  for (const auto &category_id : affected) {
    store::MemoryCategory *category = assigner.find(category_id);
    if (category == nullptr) {
      continue;
    }
    auto links = services.store->list_links(selector,
                                            store::LinkFilter{.category_ids = {category_id}});
    if (!links.ok()) {
      return Status::error(links.error_info());
    }
    std::set<std::string> member_ids;
    for (const auto &link : links.value()) {
      member_ids.insert(link.item_id);
    }
    for (const auto &link : plan.links) {
      if (link.category_id == category_id) {
        member_ids.insert(link.item_id);
      }
    }

    std::vector<store::MemoryItem> members;
    std::vector<std::string> stored_ids;
    for (const auto &id : member_ids) {
      if (retired.contains(id)) {
        continue;
      }
      if (const auto it = created_by_id.find(id); it != created_by_id.end()) {
        members.push_back(*it->second);
      } else {
        stored_ids.push_back(id);
      }
    }
    if (!stored_ids.empty()) {
      auto stored = services.store->list_items(
          selector, store::ItemFilter{.ids = stored_ids, .active_only = true});
      if (!stored.ok()) {
        return Status::error(stored.error_info());
      }
      members.insert(members.end(), stored.value().begin(), stored.value().end());
    }
    std::sort(members.begin(), members.end(), keeper_before);

    std::vector<std::string> texts;
    std::vector<std::string> anchors;
    for (const auto &member : members) {
      texts.push_back(member.text);
      if (anchors.size() < anchors_limit) {
        anchors.push_back(member.id);
      }
    }
    std::string summary;
    if (!texts.empty()) {
      auto summarized = summarize_texts(services, category->name, texts, summary_length);
      if (!summarized.ok()) {
        return Status::error(summarized.error_info());
      }
      summary = std::move(summarized.value());
    }

    if (summary == category->summary && anchors == category->anchors &&
        !assigner.is_new(category_id)) {
      continue;
    }
    category->summary = std::move(summary);
    category->anchors = std::move(anchors);
    category->updated_at = now;
    plan.upserts.push_back(*category);
    plan.touched_ids.push_back(category_id);
    plan.changes.push_back(store::DiffChange{.kind = "category_refreshed",
                                             .target_id = category_id,
                                             .detail = category->name});
    if (assigner.is_new(category_id)) {
      plan.taxonomy_changed = true;
    }
  }

  state.category_plan = std::move(plan);
  return Status::success();
}

// ── adjust_intention ─────────────────────────────────────────────

Status adjust_intention(WorkflowState &state, const StepContext &ctx) {
  const auto &services = ctx.services();
  auto existing = services.store->get_intention(state.scope);
  if (!existing.ok()) {
    return Status::error(existing.error_info());
  }
  auto items = services.store->list_items(scope::ScopeSelector::for_key(state.scope),
                                          store::ItemFilter{.active_only = true});
  if (!items.ok()) {
    return Status::error(items.error_info());
  }
  std::set<std::string> retired;
  for (const auto &item : state.revisions.updated) {
    if (!item.active) {
      retired.insert(item.id);
    }
  }
  std::vector<store::MemoryItem> active;
  for (auto &item : items.value()) {
    if (!retired.contains(item.id)) {
      active.push_back(std::move(item));
    }
  }
  active.insert(active.end(), state.revisions.created.begin(), state.revisions.created.end());

  const std::size_t limit =
      ctx.config_size("max_entries", ctx.config().memorize.max_intention_goals);
  state.intention = rebuild_intention(existing.value(), state.scope, active, limit);
  return Status::success();
}

// ── persist_evolution ────────────────────────────────────────────

std::string diff_summary(const std::vector<store::DiffChange> &changes) {
  std::map<std::string, std::size_t> counts;
  for (const auto &change : changes) {
    ++counts[change.kind];
  }
  if (counts.empty()) {
    return "no changes";
  }
  std::string summary;
  for (const auto &[kind, count] : counts) {
    if (!summary.empty()) {
      summary += ", ";
    }
    summary += std::to_string(count) + " " + kind;
  }
  return summary;
}

Status persist_evolution(WorkflowState &state, const StepContext &ctx) {
  if (ctx.cancelled()) {
    return Status::error(ErrorKind::Cancelled, "run cancelled before commit");
  }
  const auto &services = ctx.services();
  const std::string now = common::now_rfc3339();

  store::DiffRecord diff;
  diff.id = common::random_id("diff_");
  diff.run_id = state.run_id;
  diff.scope = state.scope;
  diff.created_at = now;
  diff.changes = state.revisions.changes;
  diff.changes.insert(diff.changes.end(), state.category_plan.changes.begin(),
                      state.category_plan.changes.end());
  if (state.intention.has_value()) {
    diff.changes.push_back(store::DiffChange{
        .kind = "intention_updated",
        .target_id = state.scope.to_string(),
        .detail = "version " + std::to_string(state.intention->version)});
  }
  diff.summary = diff_summary(diff.changes);

  store::WriteBatch batch;
  for (const auto &item : state.revisions.created) {
    batch.put_item(item);
  }
  for (const auto &item : state.revisions.updated) {
    batch.put_item(item);
  }
  for (const auto &category : state.category_plan.upserts) {
    batch.put_category(category);
  }
  for (const auto &link : state.category_plan.links) {
    batch.put_link(link);
  }
  for (const auto &unlink : state.category_plan.unlinks) {
    batch.delete_link(unlink.scope, unlink.category_id, unlink.item_id);
  }
  if (state.intention.has_value()) {
    batch.put_intention(*state.intention);
  }
  batch.put_diff(diff);

  const auto committed = services.store->commit(batch);
  if (!committed.ok()) {
    return committed;
  }
  state.committed = true;
  state.diff = std::move(diff);

  if (state.category_plan.taxonomy_changed && services.tenancy) {
    const auto bumped = services.tenancy->bump_taxonomy_version();
    if (!bumped.ok()) {
      observability::record_error("persist_evolution", bumped.error());
    }
  }

  if (!services.vector) {
    return Status::success();
  }
  const auto index = [&](const Status &status) {
    if (!status.ok()) {
      observability::record_error("persist_evolution", status.error());
    }
  };
  for (const auto &item : state.revisions.created) {
    if (!item.embedding.empty()) {
      index(services.vector->upsert(state.scope, vector::EntityKind::Item, item.id,
                                    item.embedding));
    }
  }
  for (const auto &item : state.revisions.updated) {
    if (!item.active) {
      index(services.vector->remove(state.scope, vector::EntityKind::Item, item.id));
    }
  }
  for (const auto &category : state.category_plan.upserts) {
    if (!category.embedding.empty()) {
      index(services.vector->upsert(state.scope, vector::EntityKind::Category, category.id,
                                    category.embedding));
    }
  }
  return Status::success();
}

} // namespace

std::vector<StepSpec> evolve_steps() {
  std::vector<StepSpec> steps;
  steps.push_back(StepSpec{.id = "select_targets",
                           .role = Role::Routing,
                           .inputs = {"scope", "evolve_request"},
                           .outputs = {"targets"},
                           .config_keys = {"stale_after_days", "max_targets"},
                           .handler = select_targets});
  steps.push_back(StepSpec{.id = "refresh_items",
                           .role = Role::Deduplication,
                           .inputs = {"scope", "targets"},
                           .outputs = {"revisions"},
                           .optional_capabilities = {Capability::Embedding},
                           .config_keys = {"confidence_half_life_days", "min_confidence_delta"},
                           .handler = refresh_items});
  steps.push_back(StepSpec{.id = "recluster_categories",
                           .role = Role::Clustering,
                           .inputs = {"scope", "targets", "revisions"},
                           .outputs = {"category_plan"},
                           .optional_capabilities = {Capability::Embedding, Capability::Llm},
                           .config_keys = {"threshold", "anchors", "summary_target_length"},
                           .handler = recluster_categories});
  steps.push_back(StepSpec{.id = "adjust_intention",
                           .role = Role::Routing,
                           .inputs = {"scope", "revisions"},
                           .outputs = {"intention"},
                           .config_keys = {"max_entries"},
                           .handler = adjust_intention});
  steps.push_back(StepSpec{.id = "persist_evolution",
                           .role = Role::Persistence,
                           .inputs = {"scope", "run_id", "revisions", "category_plan"},
                           .outputs = {"diff", "committed"},
                           .optional_capabilities = {Capability::VectorQuery},
                           .handler = persist_evolution});
  return steps;
}

} // namespace strata::pipeline
