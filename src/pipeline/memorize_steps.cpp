#include "strata/pipeline/builtin_steps.hpp"

#include "strata/capability/extractor_rule.hpp"
#include "strata/common/fs.hpp"
#include "strata/common/hash.hpp"
#include "strata/common/text.hpp"
#include "strata/common/time.hpp"
#include "strata/observability/global.hpp"
#include "strata/pipeline/taxonomy.hpp"

#include <algorithm>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>

namespace strata::pipeline {

namespace {

using capability::Capability;
using common::ErrorKind;
using common::Status;

constexpr std::size_t kInlineUriHashLength = 16;
constexpr std::size_t kMaxCategoriesPerItem = 2;
constexpr std::size_t kResourceEmbeddingChars = 2'000;

// ── ingest_resource ──────────────────────────────────────────────

Status ingest_resource(WorkflowState &state, const StepContext &ctx) {
  const auto &request = state.memorize_request;
  const auto &services = ctx.services();

  std::string content = request.content;
  if (content.empty()) {
    if (request.uri.empty()) {
      return Status::error(ErrorKind::Validation, "memorize requires content or a uri");
    }
    if (!services.blob) {
      return Status::error(ErrorKind::CapabilityUnavailable,
                           "no blob store configured to resolve " + request.uri);
    }
    auto fetched = services.blob->fetch(request.uri);
    if (!fetched.ok()) {
      return Status::error(fetched.error_info());
    }
    content = std::move(fetched.value());
  }
  if (content.empty()) {
    return Status::error(ErrorKind::Validation, "resource content is empty");
  }

  const auto selector = scope::ScopeSelector::for_key(state.scope);
  const std::string hash = common::sha256_hex(content);

  auto same_bytes =
      services.store->list_resources(selector, store::ResourceFilter{.content_hash = hash});
  if (!same_bytes.ok()) {
    return Status::error(same_bytes.error_info());
  }
  if (!same_bytes.value().empty()) {
    state.resource = same_bytes.value().front();
    state.resource_reused = true;
    return Status::success();
  }

  store::Resource resource;
  resource.id = common::random_id("res_");
  resource.scope = state.scope;
  resource.uri = request.uri.empty() ? "inline:" + hash.substr(0, kInlineUriHashLength)
                                     : request.uri;
  resource.content = std::move(content);
  resource.modality = request.modality;
  resource.content_hash = hash;
  resource.created_at = common::now_rfc3339();

  if (!request.uri.empty()) {
    auto same_uri =
        services.store->list_resources(selector, store::ResourceFilter{.uri = request.uri});
    if (!same_uri.ok()) {
      return Status::error(same_uri.error_info());
    }
    const auto &previous = same_uri.value();
    const auto latest = std::max_element(
        previous.begin(), previous.end(),
        [](const auto &lhs, const auto &rhs) { return lhs.created_at < rhs.created_at; });
    if (latest != previous.end()) {
      resource.supersedes = latest->id;
    }
  }

  state.resource = std::move(resource);
  state.resource_reused = false;
  return Status::success();
}

// ── preprocess ───────────────────────────────────────────────────

std::vector<store::Segment> conversation_segments(const std::string &content) {
  static const std::regex speaker_re(
      R"(^\s*(?:\[([^\]]{1,40})\]\s*)?([A-Za-z][A-Za-z0-9 _.\-]{0,30}):\s)");
  std::vector<store::Segment> segments;
  std::size_t offset = 0;
  while (offset < content.size()) {
    std::size_t end = content.find('\n', offset);
    if (end == std::string::npos) {
      end = content.size();
    }
    const std::string line = content.substr(offset, end - offset);
    if (line.find_first_not_of(" \t\r") != std::string::npos) {
      store::Segment segment{.offset = offset, .length = line.size()};
      std::smatch match;
      if (std::regex_search(line, match, speaker_re)) {
        segment.timestamp = match[1].str();
        segment.speaker = common::to_lower(common::trim(match[2].str()));
      }
      segments.push_back(std::move(segment));
    }
    offset = end + 1;
  }
  return segments;
}

std::vector<store::Segment> document_segments(const std::string &content) {
  std::vector<store::Segment> segments;
  int page = 1;
  std::size_t start = 0;
  const auto flush = [&](const std::size_t end) {
    if (end > start &&
        content.substr(start, end - start).find_first_not_of(" \t\r\n") != std::string::npos) {
      segments.push_back(store::Segment{.offset = start, .length = end - start, .page = page});
    }
  };
  for (std::size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\f') {
      flush(i);
      ++page;
      start = i + 1;
    } else if (content[i] == '\n' && i + 1 < content.size() && content[i + 1] == '\n') {
      flush(i);
      while (i + 1 < content.size() && content[i + 1] == '\n') {
        ++i;
      }
      start = i + 1;
    }
  }
  flush(content.size());
  return segments;
}

Status preprocess(WorkflowState &state, const StepContext &ctx) {
  auto &resource = state.resource;
  if (!store::is_media(resource.modality)) {
    resource.segments = resource.modality == store::Modality::Conversation
                            ? conversation_segments(resource.content)
                            : document_segments(resource.content);
    state.text = resource.content;
    return Status::success();
  }

  if (resource.caption.empty() && resource.transcription.empty()) {
    auto describe = [&]() -> common::Result<capability::MediaDescription> {
      if (ctx.services().extractor) {
        return ctx.services().extractor->describe_media(resource, resource.content);
      }
      capability::RuleExtractor fallback;
      return fallback.describe_media(resource, resource.content);
    };
    auto description = describe();
    if (!description.ok()) {
      return Status::error(description.error_info());
    }
    resource.caption = std::move(description.value().caption);
    resource.transcription = std::move(description.value().transcription);
  }

  std::string text = resource.transcription;
  if (!resource.caption.empty()) {
    text = text.empty() ? resource.caption : text + "\n" + resource.caption;
  }
  state.text = std::move(text);
  return Status::success();
}

// ── extract_items ────────────────────────────────────────────────

std::vector<std::string> parse_list(const std::string &value) {
  std::vector<std::string> out;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, ',')) {
    part = common::to_lower(common::trim(part));
    if (!part.empty()) {
      out.push_back(part);
    }
  }
  return out;
}

Status extract_items(WorkflowState &state, const StepContext &ctx) {
  const auto &services = ctx.services();
  if (!services.extractor) {
    return Status::error(ErrorKind::CapabilityUnavailable, "no extraction capability");
  }

  std::vector<std::string> types = state.memorize_request.memory_types;
  if (types.empty()) {
    types = parse_list(ctx.config_string("memory_types", ""));
  }
  if (types.empty()) {
    types = ctx.config().extraction.memory_types;
  }

  capability::ExtractionRequest request;
  request.text = state.text;
  request.modality = state.resource.modality;
  request.memory_types = types;
  if (!store::is_media(state.resource.modality)) {
    request.segments = state.resource.segments;
  }
  auto categories = services.store->list_categories(scope::ScopeSelector::for_key(state.scope),
                                                    store::CategoryFilter{});
  if (!categories.ok()) {
    return Status::error(categories.error_info());
  }
  for (const auto &category : categories.value()) {
    request.categories.push_back(category.name);
  }
  for (const auto &definition : parse_category_definitions(ctx.config().memorize.categories)) {
    if (std::find(request.categories.begin(), request.categories.end(), definition.name) ==
        request.categories.end()) {
      request.categories.push_back(definition.name);
    }
  }

  auto extracted = services.extractor->extract(request);
  if (!extracted.ok()) {
    return Status::error(extracted.error_info());
  }

  state.candidates.clear();
  for (auto &fact : extracted.value()) {
    if (common::trim(fact.text).empty()) {
      continue;
    }
    if (std::find(types.begin(), types.end(), fact.memory_type) == types.end()) {
      continue;
    }
    fact.confidence = std::clamp(fact.confidence, 0.0, 1.0);
    state.candidates.push_back(std::move(fact));
  }
  observability::record_candidates("extract", state.candidates.size());
  return Status::success();
}

// ── dedupe_items ─────────────────────────────────────────────────

store::MemoryItem item_from_candidate(const capability::CandidateFact &fact,
                                      const WorkflowState &state, const std::string &now) {
  store::MemoryItem item;
  item.id = common::random_id("mem_");
  item.scope = state.scope;
  item.resource_id = state.resource.id;
  item.lineage_id = item.id;
  item.memory_type = fact.memory_type;
  item.text = common::trim(fact.text);
  item.subject = fact.subject;
  item.content_hash = store::item_content_hash(fact.memory_type, item.text);
  item.evidence = fact.evidence;
  item.confidence = fact.confidence;
  item.stable = fact.stable;
  item.created_at = now;
  item.updated_at = now;
  return item;
}

Status dedupe_items(WorkflowState &state, const StepContext &ctx) {
  const auto &services = ctx.services();
  const auto selector = scope::ScopeSelector::for_key(state.scope);
  const double bonus = ctx.config_double("reinforcement_bonus",
                                         ctx.config().evolve.reinforcement_bonus);
  const std::string now = common::now_rfc3339();

  MergePlan plan;
  // Updated rows by id so one run touches each stored item once.
  std::map<std::string, store::MemoryItem> updated;
  std::unordered_map<std::string, std::size_t> created_by_hash;
  std::unordered_map<std::string, std::size_t> created_by_subject;
  std::set<std::string> reported;

  const auto report = [&](const std::string &id) {
    if (reported.insert(id).second) {
      plan.reported_ids.push_back(id);
    }
  };
  const auto current = [&](store::MemoryItem item) {
    const auto it = updated.find(item.id);
    return it == updated.end() ? item : it->second;
  };

  for (const auto &fact : state.candidates) {
    store::MemoryItem candidate = item_from_candidate(fact, state, now);

    if (const auto it = created_by_hash.find(candidate.content_hash);
        it != created_by_hash.end()) {
      report(plan.created[it->second].id);
      ++plan.unchanged;
      continue;
    }

    auto same_hash = services.store->list_items(
        selector, store::ItemFilter{.active_only = true, .content_hash = candidate.content_hash,
                                    .limit = 1});
    if (!same_hash.ok()) {
      return Status::error(same_hash.error_info());
    }
    if (!same_hash.value().empty()) {
      store::MemoryItem existing = current(same_hash.value().front());
      if (state.resource_reused && existing.resource_id == state.resource.id) {
        ++plan.unchanged;
      } else {
        existing.reinforcement_count += 1;
        existing.confidence = std::min(1.0, existing.confidence + bonus);
        existing.updated_at = now;
        updated[existing.id] = existing;
        ++plan.reinforced;
      }
      report(existing.id);
      continue;
    }

    if (!candidate.subject.empty()) {
      if (const auto it = created_by_subject.find(candidate.subject);
          it != created_by_subject.end()) {
        store::MemoryItem &sibling = plan.created[it->second];
        if (candidate.confidence >= sibling.confidence) {
          candidate.id = sibling.id;
          candidate.lineage_id = sibling.lineage_id;
          candidate.version = sibling.version;
          created_by_hash.erase(sibling.content_hash);
          sibling = candidate;
          created_by_hash[candidate.content_hash] = it->second;
          plan.category_hints[candidate.id] = fact.category_hints;
        } else {
          ++plan.rejected;
        }
        continue;
      }

      auto same_subject = services.store->list_items(
          selector, store::ItemFilter{.active_only = true, .subject = candidate.subject});
      if (!same_subject.ok()) {
        return Status::error(same_subject.error_info());
      }
      if (!same_subject.value().empty()) {
        std::vector<store::MemoryItem> predecessors;
        for (const auto &row : same_subject.value()) {
          predecessors.push_back(current(row));
        }
        const auto newest = std::max_element(
            predecessors.begin(), predecessors.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.version < rhs.version; });
        if (candidate.confidence < newest->confidence) {
          ++plan.rejected;
          continue;
        }
        candidate.lineage_id = newest->lineage_id;
        candidate.version = newest->version + 1;
        for (auto &predecessor : predecessors) {
          predecessor.active = false;
          predecessor.superseded_by = candidate.id;
          predecessor.updated_at = now;
          updated[predecessor.id] = predecessor;
        }
        ++plan.superseded;
      }
    }

    created_by_hash[candidate.content_hash] = plan.created.size();
    if (!candidate.subject.empty()) {
      created_by_subject[candidate.subject] = plan.created.size();
    }
    plan.category_hints[candidate.id] = fact.category_hints;
    plan.created.push_back(std::move(candidate));
  }

  for (const auto &item : plan.created) {
    report(item.id);
  }
  for (auto &[id, item] : updated) {
    plan.updated.push_back(std::move(item));
  }

  if (services.embedder && !plan.created.empty()) {
    std::vector<std::string> texts;
    texts.reserve(plan.created.size());
    for (const auto &item : plan.created) {
      texts.push_back(item.text);
    }
    auto embedded = services.embedder->embed_batch(texts);
    if (!embedded.ok()) {
      return Status::error(embedded.error_info());
    }
    for (std::size_t i = 0; i < plan.created.size() && i < embedded.value().size(); ++i) {
      plan.created[i].embedding = std::move(embedded.value()[i]);
    }
  }

  observability::record_candidates("dedupe", plan.created.size());
  state.merge = std::move(plan);
  return Status::success();
}

// ── assign_categories ────────────────────────────────────────────

Status assign_categories(WorkflowState &state, const StepContext &ctx) {
  const auto &services = ctx.services();
  const auto &memorize = ctx.config().memorize;
  const auto selector = scope::ScopeSelector::for_key(state.scope);
  const std::size_t anchors_limit = ctx.config_size("anchors", memorize.anchors_per_category);
  const std::size_t summary_length =
      ctx.config_size("summary_target_length", memorize.category_summary_target_length);

  CategoryAssigner assigner(services, state.scope,
                            ctx.config_double("threshold", memorize.category_assign_threshold),
                            ctx.config_size("max_categories_per_item", kMaxCategoriesPerItem),
                            ctx.config_string("fallback", memorize.fallback_category));
  const auto loaded = assigner.load();
  if (!loaded.ok()) {
    return loaded;
  }

  CategoryPlan plan;
  const std::string now = common::now_rfc3339();
  // category id -> texts of newly linked items, in link order
  std::map<std::string, std::vector<std::string>> fresh_texts;
  // superseded item id -> successor id
  std::map<std::string, std::string> successors;
  for (const auto &item : state.merge.updated) {
    if (!item.active && item.superseded_by.has_value()) {
      successors[item.id] = *item.superseded_by;
    }
  }

  const auto link = [&](const std::string &category_id, const store::MemoryItem &item) {
    const bool duplicate =
        std::any_of(plan.links.begin(), plan.links.end(), [&](const store::CategoryItem &l) {
          return l.category_id == category_id && l.item_id == item.id;
        });
    if (duplicate) {
      return;
    }
    plan.links.push_back(store::CategoryItem{
        .scope = state.scope, .category_id = category_id, .item_id = item.id, .created_at = now});
    fresh_texts[category_id].push_back(item.text);
  };

  for (const auto &item : state.merge.created) {
    std::vector<std::string> inherited;
    for (const auto &[old_id, new_id] : successors) {
      if (new_id != item.id) {
        continue;
      }
      auto links = services.store->list_links(selector, store::LinkFilter{.item_ids = {old_id}});
      if (!links.ok()) {
        return Status::error(links.error_info());
      }
      for (const auto &old_link : links.value()) {
        inherited.push_back(old_link.category_id);
      }
    }
    if (!inherited.empty()) {
      for (const auto &category_id : inherited) {
        if (assigner.find(category_id) != nullptr) {
          link(category_id, item);
        }
      }
      continue;
    }

    const auto hint_it = state.merge.category_hints.find(item.id);
    const std::vector<std::string> hints =
        hint_it == state.merge.category_hints.end() ? std::vector<std::string>{} : hint_it->second;
    auto assigned = assigner.assign(item, hints);
    if (!assigned.ok()) {
      return Status::error(assigned.error_info());
    }
    for (const auto &category_id : assigned.value()) {
      link(category_id, item);
    }
  }

  for (const auto &[category_id, texts] : fresh_texts) {
    store::MemoryCategory *category = assigner.find(category_id);
    if (category == nullptr) {
      continue;
    }
    std::vector<std::string> inputs;
    if (!category->summary.empty()) {
      inputs.push_back(category->summary);
    }
    inputs.insert(inputs.end(), texts.begin(), texts.end());
    auto summary = summarize_texts(services, category->name, inputs, summary_length);
    if (!summary.ok()) {
      return Status::error(summary.error_info());
    }
    category->summary = std::move(summary.value());

    for (auto &anchor : category->anchors) {
      if (const auto it = successors.find(anchor); it != successors.end()) {
        anchor = it->second;
      }
    }
    for (const auto &l : plan.links) {
      if (l.category_id == category_id && category->anchors.size() < anchors_limit &&
          std::find(category->anchors.begin(), category->anchors.end(), l.item_id) ==
              category->anchors.end()) {
        category->anchors.push_back(l.item_id);
      }
    }
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

// ── update_intention ─────────────────────────────────────────────

Status update_intention(WorkflowState &state, const StepContext &ctx) {
  auto existing = ctx.services().store->get_intention(state.scope);
  if (!existing.ok()) {
    return Status::error(existing.error_info());
  }
  const std::size_t limit =
      ctx.config_size("max_entries", ctx.config().memorize.max_intention_goals);
  state.intention = fold_intention(existing.value(), state.scope, state.merge.created, limit);
  return Status::success();
}

// ── persist_index ────────────────────────────────────────────────

Status persist_index(WorkflowState &state, const StepContext &ctx) {
  if (ctx.cancelled()) {
    return Status::error(ErrorKind::Cancelled, "run cancelled before commit");
  }
  const auto &services = ctx.services();

  store::WriteBatch batch;
  if (!state.resource_reused) {
    batch.put_resource(state.resource);
  }
  for (const auto &item : state.merge.created) {
    batch.put_item(item);
  }
  for (const auto &item : state.merge.updated) {
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

  if (!batch.empty()) {
    const auto committed = services.store->commit(batch);
    if (!committed.ok()) {
      return committed;
    }
  }
  state.committed = true;

  if (state.category_plan.taxonomy_changed && services.tenancy) {
    const auto bumped = services.tenancy->bump_taxonomy_version();
    if (!bumped.ok()) {
      observability::record_error("persist_index", bumped.error());
    }
  }

  if (!services.vector) {
    return Status::success();
  }
  // The store is authoritative; index gaps are repaired by reindex.
  const auto index = [&](const Status &status) {
    if (!status.ok()) {
      observability::record_error("persist_index", status.error());
    }
  };
  for (const auto &item : state.merge.created) {
    if (!item.embedding.empty()) {
      index(services.vector->upsert(state.scope, vector::EntityKind::Item, item.id,
                                    item.embedding));
    }
  }
  for (const auto &item : state.merge.updated) {
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
  if (!state.resource_reused && services.embedder && !state.text.empty()) {
    auto embedded = services.embedder->embed(state.text.substr(0, kResourceEmbeddingChars));
    if (embedded.ok()) {
      index(services.vector->upsert(state.scope, vector::EntityKind::Resource,
                                    state.resource.id, embedded.value()));
    } else {
      observability::record_error("persist_index", embedded.error());
    }
  }
  return Status::success();
}

} // namespace

std::vector<StepSpec> memorize_steps() {
  std::vector<StepSpec> steps;
  steps.push_back(StepSpec{.id = "ingest_resource",
                           .role = Role::Ingestion,
                           .inputs = {"scope", "memorize_request"},
                           .outputs = {"resource", "resource_reused"},
                           .optional_capabilities = {Capability::Blob},
                           .handler = ingest_resource});
  steps.push_back(StepSpec{.id = "preprocess",
                           .role = Role::Preprocessing,
                           .inputs = {"resource"},
                           .outputs = {"resource", "text"},
                           .optional_capabilities = {Capability::Llm},
                           .handler = preprocess});
  steps.push_back(StepSpec{.id = "extract_items",
                           .role = Role::Extraction,
                           .inputs = {"scope", "resource", "text"},
                           .outputs = {"candidates"},
                           .config_keys = {"memory_types"},
                           .handler = extract_items});
  steps.push_back(StepSpec{.id = "dedupe_items",
                           .role = Role::Deduplication,
                           .inputs = {"scope", "resource", "resource_reused", "candidates"},
                           .outputs = {"merge"},
                           .optional_capabilities = {Capability::Embedding},
                           .config_keys = {"reinforcement_bonus"},
                           .handler = dedupe_items});
  steps.push_back(StepSpec{.id = "assign_categories",
                           .role = Role::Clustering,
                           .inputs = {"scope", "merge"},
                           .outputs = {"category_plan"},
                           .optional_capabilities = {Capability::Embedding, Capability::Llm},
                           .config_keys = {"threshold", "max_categories_per_item", "fallback",
                                           "anchors", "summary_target_length"},
                           .handler = assign_categories});
  steps.push_back(StepSpec{.id = "update_intention",
                           .role = Role::Routing,
                           .inputs = {"scope", "merge"},
                           .outputs = {"intention"},
                           .config_keys = {"max_entries"},
                           .handler = update_intention});
  steps.push_back(StepSpec{.id = "persist_index",
                           .role = Role::Persistence,
                           .inputs = {"scope", "resource", "resource_reused", "text", "merge",
                                      "category_plan"},
                           .outputs = {"committed"},
                           .optional_capabilities = {Capability::Embedding,
                                                     Capability::VectorQuery},
                           .handler = persist_index});
  return steps;
}

} // namespace strata::pipeline
