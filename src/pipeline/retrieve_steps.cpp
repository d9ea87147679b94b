#include "strata/pipeline/builtin_steps.hpp"

#include "strata/common/fs.hpp"
#include "strata/common/text.hpp"
#include "strata/observability/global.hpp"
#include "strata/pipeline/hybrid_ranker.hpp"
#include "strata/pipeline/lexical.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>

namespace strata::pipeline {

namespace {

using capability::Capability;
using common::ErrorKind;
using common::Status;

constexpr std::size_t kMinVectorCandidates = 20;
constexpr std::size_t kVectorOverfetch = 4;
constexpr double kDefaultRerankWeight = 0.6;

std::string query_of(const WorkflowState &state) {
  return state.active_query.empty() ? state.retrieve_request.query : state.active_query;
}

bool vector_enabled(const WorkflowState &state, const StepContext &ctx) {
  return state.policy.allow_vector && state.policy.mode == policy::RetrievalMode::Full &&
         ctx.services().vector != nullptr && !state.query_vector.empty();
}

std::size_t vector_limit(const WorkflowState &state, const std::size_t top_k) {
  const std::size_t wanted = std::max(top_k * kVectorOverfetch, kMinVectorCandidates);
  return std::min(state.policy.max_vector_candidates, wanted);
}

/// Verdict of the configured sufficiency check, or nullopt when the check is off or there
/// is nothing to judge.
common::Result<std::optional<capability::SufficiencyVerdict>>
judge(const WorkflowState &state, const StepContext &ctx, const std::vector<std::string> &context) {
  using Verdict = std::optional<capability::SufficiencyVerdict>;
  const std::string mode = ctx.config_string("sufficiency", ctx.config().retrieve.sufficiency);
  const bool enabled =
      state.retrieve_request.sufficiency_check.value_or(mode != "off" && mode != "none");
  if (!enabled || context.empty()) {
    return common::Result<Verdict>::success(std::nullopt);
  }
  const std::string query = query_of(state);
  if (mode == "llm" && ctx.services().extractor) {
    auto verdict = ctx.services().extractor->judge_sufficiency(query, context);
    if (!verdict.ok()) {
      return common::Result<Verdict>::failure(verdict.error_info());
    }
    return common::Result<Verdict>::success(std::move(verdict.value()));
  }
  return common::Result<Verdict>::success(capability::judge_by_coverage(query, context));
}

std::string spaced_name(std::string name) {
  std::replace(name.begin(), name.end(), '_', ' ');
  return name;
}

// ── route_intention ──────────────────────────────────────────────

Status route_intention(WorkflowState &state, const StepContext &ctx) {
  const auto &services = ctx.services();
  state.active_query = common::trim(state.retrieve_request.query);
  if (state.active_query.empty()) {
    return Status::error(ErrorKind::Validation, "retrieve query is empty");
  }

  const auto lexical = parse_lexical_query(state.active_query);
  state.needs_retrieval = !lexical.empty();
  if (!state.needs_retrieval) {
    state.proceed_to_categories = false;
    state.proceed_to_items = false;
    return Status::success();
  }

  if (services.embedder && state.policy.allow_vector) {
    const std::string plain = lexical.plain_text().empty() ? state.active_query
                                                           : lexical.plain_text();
    auto embedded = services.embedder->embed(plain);
    if (embedded.ok()) {
      state.query_vector = std::move(embedded.value());
    } else {
      observability::record_error("route_intention", embedded.error());
    }
  }

  auto intentions = services.store->list_intentions(state.selector);
  if (!intentions.ok()) {
    return Status::error(intentions.error_info());
  }
  std::vector<std::string> context;
  for (auto &intention : intentions.value()) {
    if (intention.goals.empty() && intention.constraints.empty()) {
      continue;
    }
    context.push_back(intention.summary);
    context.insert(context.end(), intention.goals.begin(), intention.goals.end());
    context.insert(context.end(), intention.constraints.begin(), intention.constraints.end());
    state.intention_hits.push_back(std::move(intention));
  }

  auto verdict = judge(state, ctx, context);
  if (!verdict.ok()) {
    return Status::error(verdict.error_info());
  }
  if (verdict.value().has_value()) {
    state.next_step_query = verdict.value()->next_query;
    if (verdict.value()->sufficient) {
      state.proceed_to_categories = false;
      state.proceed_to_items = false;
    }
  }
  return Status::success();
}

// ── route_categories ─────────────────────────────────────────────

Status route_categories(WorkflowState &state, const StepContext &ctx) {
  if (!state.needs_retrieval || !state.proceed_to_categories) {
    return Status::success();
  }
  const auto &services = ctx.services();
  const std::size_t top_k = state.retrieve_request.category_top_k.value_or(
      ctx.config_size("top_k", ctx.config().retrieve.category_top_k));

  auto categories = services.store->list_categories(state.selector, store::CategoryFilter{});
  if (!categories.ok()) {
    return Status::error(categories.error_info());
  }

  const auto parsed = parse_lexical_query(query_of(state));
  const auto wanted_names = parsed.field_values("category", TermSign::Should);
  const auto required_names = parsed.field_values("category", TermSign::Must);
  const auto category_query = parse_lexical_query(parsed.plain_text());

  std::vector<LexicalDoc> docs;
  std::unordered_map<std::string, const store::MemoryCategory *> by_id;
  for (const auto &category : categories.value()) {
    docs.push_back(LexicalDoc{.id = category.id,
                              .text = spaced_name(category.name) + " " + category.description +
                                      " " + category.summary,
                              .fields = {}});
    by_id[category.id] = &category;
  }

  std::unordered_map<std::string, double> lexical;
  double max_lexical = 0.0;
  for (const auto &[id, score] : bm25_rank(category_query, docs, 0)) {
    lexical[id] = score;
    max_lexical = std::max(max_lexical, score);
  }

  std::unordered_map<std::string, double> semantic;
  if (vector_enabled(state, ctx)) {
    auto hits = services.vector->query(state.selector, vector::EntityKind::Category,
                                       state.query_vector, vector_limit(state, top_k));
    if (!hits.ok()) {
      return Status::error(hits.error_info());
    }
    for (const auto &hit : hits.value()) {
      semantic[hit.id] = hit.score;
    }
  }

  const double min_score = ctx.config().retrieve.min_score;
  std::vector<ScoredCategory> scored;
  for (const auto &[id, category] : by_id) {
    const auto named = [&](const std::vector<std::string> &names) {
      return std::find(names.begin(), names.end(), category->name) != names.end();
    };
    if (!required_names.empty() && !named(required_names)) {
      continue;
    }
    const double lex = max_lexical > 0.0 && lexical.contains(id) ? lexical[id] / max_lexical : 0.0;
    const double vec = semantic.contains(id) ? semantic[id] : 0.0;
    double score = semantic.empty() ? lex : 0.5 * lex + 0.5 * vec;
    if (named(wanted_names) || named(required_names)) {
      score = std::max(score, 1.0);
    }
    if (score < min_score) {
      continue;
    }
    scored.push_back(ScoredCategory{.category = *category, .score = score});
  }
  std::sort(scored.begin(), scored.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.score != rhs.score ? lhs.score > rhs.score : lhs.category.id < rhs.category.id;
  });
  if (scored.size() > top_k) {
    scored.resize(top_k);
  }
  observability::record_candidates("categories", scored.size());

  std::vector<std::string> context;
  for (const auto &hit : scored) {
    if (!hit.category.summary.empty()) {
      context.push_back(hit.category.summary);
    }
  }
  state.category_hits = std::move(scored);
  state.proceed_to_items = true;

  auto verdict = judge(state, ctx, context);
  if (!verdict.ok()) {
    return Status::error(verdict.error_info());
  }
  if (verdict.value().has_value()) {
    state.next_step_query = verdict.value()->next_query;
    state.proceed_to_items = !verdict.value()->sufficient;
  }
  return Status::success();
}

// ── recall_items ─────────────────────────────────────────────────

Status recall_items(WorkflowState &state, const StepContext &ctx) {
  state.proceed_to_resources = false;
  if (!state.needs_retrieval || !state.proceed_to_items) {
    return Status::success();
  }
  const auto &services = ctx.services();
  const auto &retrieve = ctx.config().retrieve;
  const std::size_t top_k =
      state.retrieve_request.item_top_k.value_or(ctx.config_size("top_k", retrieve.item_top_k));

  auto categories = services.store->list_categories(state.selector, store::CategoryFilter{});
  if (!categories.ok()) {
    return Status::error(categories.error_info());
  }
  std::unordered_map<std::string, std::string> category_names;
  for (const auto &category : categories.value()) {
    category_names[category.id] = category.name;
  }

  store::ItemFilter filter{.active_only = true};
  if (state.policy.mode == policy::RetrievalMode::CategoryOnly) {
    std::vector<std::string> routed;
    for (const auto &hit : state.category_hits) {
      routed.push_back(hit.category.id);
    }
    if (routed.empty()) {
      return Status::success();
    }
    auto links = services.store->list_links(state.selector,
                                            store::LinkFilter{.category_ids = routed});
    if (!links.ok()) {
      return Status::error(links.error_info());
    }
    for (const auto &link : links.value()) {
      filter.ids.push_back(link.item_id);
    }
    if (filter.ids.empty()) {
      return Status::success();
    }
  }

  auto pool = services.store->list_items(state.selector, filter);
  if (!pool.ok()) {
    return Status::error(pool.error_info());
  }
  if (pool.value().empty()) {
    return Status::success();
  }

  std::vector<std::string> pool_ids;
  for (const auto &item : pool.value()) {
    pool_ids.push_back(item.id);
  }
  auto links = services.store->list_links(state.selector, store::LinkFilter{.item_ids = pool_ids});
  if (!links.ok()) {
    return Status::error(links.error_info());
  }
  std::unordered_map<std::string, std::vector<std::string>> item_categories;
  for (const auto &link : links.value()) {
    item_categories[link.item_id].push_back(link.category_id);
  }

  const auto query = parse_lexical_query(query_of(state));
  std::vector<LexicalDoc> docs;
  std::unordered_map<std::string, store::MemoryItem> entries;
  for (auto &item : pool.value()) {
    LexicalDoc doc{.id = item.id, .text = item.text, .fields = {}};
    doc.fields["type"] = {item.memory_type};
    for (const auto &category_id : item_categories[item.id]) {
      doc.fields["category"].push_back(category_names[category_id]);
    }
    docs.push_back(std::move(doc));
    entries.emplace(item.id, std::move(item));
  }

  auto keyword = bm25_rank(query, docs, 0);
  if (query.positive_terms().empty() && query.phrases.empty() && !query.fields.empty()) {
    keyword.clear();
    for (const auto &doc : docs) {
      if (passes_constraints(query, doc)) {
        keyword.emplace_back(doc.id, 1.0);
      }
    }
  }

  std::vector<vector::VectorHit> semantic;
  if (vector_enabled(state, ctx)) {
    auto hits = services.vector->query(state.selector, vector::EntityKind::Item,
                                       state.query_vector, vector_limit(state, top_k));
    if (!hits.ok()) {
      return Status::error(hits.error_info());
    }
    std::unordered_map<std::string, const LexicalDoc *> doc_by_id;
    for (const auto &doc : docs) {
      doc_by_id[doc.id] = &doc;
    }
    for (auto &hit : hits.value()) {
      const auto it = doc_by_id.find(hit.id);
      if (it != doc_by_id.end() && passes_constraints(query, *it->second)) {
        semantic.push_back(std::move(hit));
      }
    }
  }

  const HybridRanker ranker(ctx.config_double("vector_weight", retrieve.vector_weight),
                            ctx.config_double("keyword_weight", retrieve.keyword_weight),
                            ctx.config_double("recency_weight", retrieve.recency_weight),
                            retrieve.recency_half_life_days);
  auto ranked = ranker.rank(semantic, keyword, entries, top_k);
  std::erase_if(ranked, [&](const ScoredItem &hit) { return hit.score < retrieve.min_score; });
  for (auto &hit : ranked) {
    hit.category_ids = item_categories[hit.item.id];
  }
  observability::record_candidates("items", ranked.size());

  std::vector<std::string> context;
  for (const auto &hit : ranked) {
    context.push_back(hit.item.text);
  }
  state.item_hits = std::move(ranked);
  state.proceed_to_resources = true;

  auto verdict = judge(state, ctx, context);
  if (!verdict.ok()) {
    return Status::error(verdict.error_info());
  }
  if (verdict.value().has_value()) {
    state.next_step_query = verdict.value()->next_query;
    state.proceed_to_resources = !verdict.value()->sufficient;
  }
  return Status::success();
}

// ── recall_resources ─────────────────────────────────────────────

Status recall_resources(WorkflowState &state, const StepContext &ctx) {
  const auto &retrieve = ctx.config().retrieve;
  const bool include =
      state.retrieve_request.include_resources.value_or(retrieve.include_resources);
  if (!include || !state.needs_retrieval || !state.proceed_to_resources) {
    return Status::success();
  }
  const auto &services = ctx.services();
  const std::size_t top_k = state.retrieve_request.resource_top_k.value_or(
      ctx.config_size("top_k", retrieve.resource_top_k));

  std::vector<std::vector<std::pair<std::string, double>>> lists;

  std::map<std::string, double> owners;
  for (const auto &hit : state.item_hits) {
    owners[hit.item.resource_id] = std::max(owners[hit.item.resource_id], hit.score);
  }
  std::vector<std::pair<std::string, double>> by_items(owners.begin(), owners.end());
  std::sort(by_items.begin(), by_items.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.second != rhs.second ? lhs.second > rhs.second : lhs.first < rhs.first;
  });
  lists.push_back(by_items);

  store::ResourceFilter filter;
  if (state.policy.mode == policy::RetrievalMode::CategoryOnly) {
    for (const auto &[id, score] : by_items) {
      filter.ids.push_back(id);
    }
    if (filter.ids.empty()) {
      return Status::success();
    }
  }
  auto resources = services.store->list_resources(state.selector, filter);
  if (!resources.ok()) {
    return Status::error(resources.error_info());
  }

  std::vector<LexicalDoc> docs;
  std::unordered_map<std::string, store::Resource> by_id;
  for (auto &resource : resources.value()) {
    docs.push_back(LexicalDoc{.id = resource.id,
                              .text = resource.content + " " + resource.caption + " " +
                                      resource.transcription,
                              .fields = {}});
    by_id.emplace(resource.id, std::move(resource));
  }
  const auto parsed = parse_lexical_query(query_of(state));
  lists.push_back(bm25_rank(parse_lexical_query(parsed.plain_text()), docs, top_k * 2));

  if (vector_enabled(state, ctx)) {
    auto hits = services.vector->query(state.selector, vector::EntityKind::Resource,
                                       state.query_vector, vector_limit(state, top_k));
    if (!hits.ok()) {
      return Status::error(hits.error_info());
    }
    std::vector<std::pair<std::string, double>> semantic;
    for (const auto &hit : hits.value()) {
      semantic.emplace_back(hit.id, hit.score);
    }
    lists.push_back(std::move(semantic));
  }

  for (const auto &[id, score] : rrf_fuse(lists, top_k)) {
    const auto it = by_id.find(id);
    if (it != by_id.end()) {
      state.resource_hits.push_back(ScoredResource{.resource = it->second, .score = score});
    }
  }
  observability::record_candidates("resources", state.resource_hits.size());
  return Status::success();
}

// ── verify_candidates ────────────────────────────────────────────

Status verify_candidates(WorkflowState &state, const StepContext &ctx) {
  const auto &extractor = ctx.services().extractor;
  if (!state.retrieve_request.rerank || !extractor || state.item_hits.empty()) {
    return Status::success();
  }
  const std::size_t count = std::min(state.item_hits.size(), state.policy.max_rerank_candidates);
  if (count == 0) {
    return Status::success();
  }

  std::vector<std::string> texts;
  texts.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    texts.push_back(state.item_hits[i].item.text);
  }
  auto scores = extractor->rerank(query_of(state), texts);
  if (!scores.ok()) {
    return Status::error(scores.error_info());
  }
  if (scores.value().size() != count) {
    return Status::error(ErrorKind::Internal, "rerank returned " +
                                                  std::to_string(scores.value().size()) +
                                                  " scores for " + std::to_string(count) +
                                                  " candidates");
  }

  const double weight =
      std::clamp(ctx.config_double("rerank_weight", kDefaultRerankWeight), 0.0, 1.0);
  for (std::size_t i = 0; i < count; ++i) {
    auto &hit = state.item_hits[i];
    hit.score = weight * std::clamp(scores.value()[i], 0.0, 1.0) + (1.0 - weight) * hit.score;
  }
  std::stable_sort(state.item_hits.begin(),
                   state.item_hits.begin() + static_cast<std::ptrdiff_t>(count),
                   [](const auto &lhs, const auto &rhs) { return lhs.score > rhs.score; });
  return Status::success();
}

// ── build_context ────────────────────────────────────────────────

Status build_context(WorkflowState &state, const StepContext & /*ctx*/) {
  const auto in_selector = [&](const scope::ScopeKey &key) {
    return state.selector.matches(key);
  };

  RetrieveResult result;
  result.run_id = state.run_id;
  result.mode = policy::retrieval_mode_to_string(state.policy.mode);
  for (auto &intention : state.intention_hits) {
    if (in_selector(intention.scope)) {
      result.intentions.push_back(std::move(intention));
    }
  }
  for (auto &hit : state.category_hits) {
    if (in_selector(hit.category.scope)) {
      result.categories.push_back(std::move(hit));
    }
  }
  for (auto &hit : state.item_hits) {
    if (in_selector(hit.item.scope)) {
      result.items.push_back(std::move(hit));
    }
  }
  for (auto &hit : state.resource_hits) {
    if (in_selector(hit.resource.scope)) {
      result.resources.push_back(std::move(hit));
    }
  }
  if (!state.next_step_query.empty()) {
    result.next_step_query = state.next_step_query;
  }
  state.retrieve_result = std::move(result);
  return Status::success();
}

} // namespace

std::vector<StepSpec> retrieve_steps() {
  const std::set<std::string> ranking_keys = {"top_k", "sufficiency"};
  std::vector<StepSpec> steps;
  steps.push_back(StepSpec{.id = "route_intention",
                           .role = Role::Routing,
                           .inputs = {"selector", "retrieve_request", "policy"},
                           .outputs = {"needs_retrieval", "active_query", "query_vector",
                                       "intention_hits", "proceed_to_categories",
                                       "proceed_to_items", "next_step_query"},
                           .optional_capabilities = {Capability::Embedding, Capability::Llm},
                           .config_keys = {"sufficiency"},
                           .degradable = true,
                           .handler = route_intention});
  steps.push_back(StepSpec{.id = "route_categories",
                           .role = Role::Routing,
                           .inputs = {"selector", "retrieve_request", "policy", "active_query",
                                      "query_vector", "proceed_to_categories"},
                           .outputs = {"category_hits", "proceed_to_items", "next_step_query"},
                           .optional_capabilities = {Capability::VectorQuery, Capability::Llm},
                           .config_keys = ranking_keys,
                           .degradable = true,
                           .handler = route_categories});
  steps.push_back(StepSpec{.id = "recall_items",
                           .role = Role::Routing,
                           .inputs = {"selector", "retrieve_request", "policy", "active_query",
                                      "query_vector", "category_hits", "proceed_to_items"},
                           .outputs = {"item_hits", "proceed_to_resources", "next_step_query"},
                           .optional_capabilities = {Capability::VectorQuery, Capability::Llm},
                           .config_keys = {"top_k", "sufficiency", "vector_weight",
                                           "keyword_weight", "recency_weight"},
                           .degradable = true,
                           .handler = recall_items});
  steps.push_back(StepSpec{.id = "recall_resources",
                           .role = Role::Routing,
                           .inputs = {"selector", "retrieve_request", "policy", "item_hits",
                                      "proceed_to_resources"},
                           .outputs = {"resource_hits"},
                           .optional_capabilities = {Capability::VectorQuery},
                           .config_keys = {"top_k"},
                           .degradable = true,
                           .handler = recall_resources});
  steps.push_back(StepSpec{.id = "verify_candidates",
                           .role = Role::Verification,
                           .inputs = {"retrieve_request", "policy", "item_hits"},
                           .outputs = {"item_hits"},
                           .capabilities = std::vector<Capability>{},
                           .optional_capabilities = {Capability::Llm},
                           .config_keys = {"rerank_weight"},
                           .degradable = true,
                           .handler = verify_candidates});
  steps.push_back(StepSpec{.id = "build_context",
                           .role = Role::Custom,
                           .inputs = {"run_id", "selector", "policy"},
                           .outputs = {"retrieve_result"},
                           .finalizer = true,
                           .handler = build_context});
  return steps;
}

} // namespace strata::pipeline
