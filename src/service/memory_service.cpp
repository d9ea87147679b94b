#include "strata/service/memory_service.hpp"

#include "strata/common/fs.hpp"
#include "strata/common/hash.hpp"
#include "strata/common/json_util.hpp"
#include "strata/common/time.hpp"
#include "strata/observability/factory.hpp"
#include "strata/observability/global.hpp"
#include "strata/pipeline/builtin_steps.hpp"
#include "strata/pipeline/taxonomy.hpp"
#include "strata/store/factory.hpp"
#include "strata/vector/factory.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <sstream>

namespace strata::service {

namespace {

using common::ErrorKind;

constexpr std::size_t kSummaryQueryChars = 80;
constexpr std::size_t kResourceEmbeddingChars = 2'000;

template <typename T> common::Result<T> fail(const common::Error &error) {
  return common::Result<T>::failure(error);
}

std::string encode_scope(const scope::ScopeKey &key) {
  std::string out = "{";
  for (const auto &[field, value] : key.entries()) {
    if (out.size() > 1) {
      out += ",";
    }
    out += common::json_quote(field) + ":" + common::json_quote(value);
  }
  return out + "}";
}

scope::ScopeValues decode_scope(const std::string &payload) {
  scope::ScopeValues values;
  for (const auto &[field, value] : common::json_parse_flat(common::json_get_object(payload, "scope"))) {
    values[field] = value;
  }
  return values;
}

std::string encode_memorize(const scope::ScopeKey &key, const pipeline::MemorizeRequest &request) {
  std::ostringstream out;
  out << "{\"workflow\":\"memorize\",\"scope\":" << encode_scope(key)
      << ",\"uri\":" << common::json_quote(request.uri)
      << ",\"content\":" << common::json_quote(request.content)
      << ",\"modality\":" << common::json_quote(store::modality_to_string(request.modality))
      << ",\"memory_types\":" << common::json_string_array(request.memory_types) << "}";
  return out.str();
}

common::Result<pipeline::MemorizeRequest> decode_memorize(const std::string &payload) {
  pipeline::MemorizeRequest request;
  request.uri = common::json_get_string(payload, "uri");
  request.content = common::json_get_string(payload, "content");
  auto modality = store::modality_from_string(common::json_get_string(payload, "modality"));
  if (!modality.ok()) {
    return common::Result<pipeline::MemorizeRequest>::failure(modality.error_info());
  }
  request.modality = modality.value();
  request.memory_types = common::json_get_string_array(payload, "memory_types");
  return common::Result<pipeline::MemorizeRequest>::success(std::move(request));
}

std::string encode_evolve(const scope::ScopeKey &key, const pipeline::EvolveRequest &request) {
  std::ostringstream out;
  out << "{\"workflow\":\"evolve\",\"scope\":" << encode_scope(key)
      << ",\"force\":" << (request.force ? "true" : "false");
  if (request.stale_after_days.has_value()) {
    out << ",\"stale_after_days\":" << *request.stale_after_days;
  }
  if (request.max_targets.has_value()) {
    out << ",\"max_targets\":" << *request.max_targets;
  }
  out << "}";
  return out.str();
}

pipeline::EvolveRequest decode_evolve(const std::string &payload) {
  pipeline::EvolveRequest request;
  request.force = common::json_get_bool(payload, "force", false);
  if (!common::json_get_number(payload, "stale_after_days").empty()) {
    request.stale_after_days = common::json_get_double(payload, "stale_after_days", 0.0);
  }
  if (!common::json_get_number(payload, "max_targets").empty()) {
    request.max_targets =
        static_cast<std::size_t>(common::json_get_double(payload, "max_targets", 0.0));
  }
  return request;
}

scope::SelectorSpec exact_spec(const scope::ScopeValues &values) {
  scope::SelectorSpec spec;
  for (const auto &[field, value] : values) {
    spec[field] = scope::FieldMatch::exact(value);
  }
  return spec;
}

} // namespace

MemoryService::MemoryService(ConstructionKey, ServiceDependencies dependencies,
                             std::shared_ptr<scope::TenancyManager> tenancy,
                             capability::CapabilitySet capabilities)
    : deps_(std::move(dependencies)), tenancy_(std::move(tenancy)),
      capabilities_(std::move(capabilities)), pipelines_(capabilities_),
      policy_(deps_.config->policy, deps_.vector != nullptr) {
  services_ = pipeline::StepServices{.config = deps_.config,
                                     .store = deps_.store,
                                     .vector = deps_.vector,
                                     .embedder = deps_.embedder,
                                     .extractor = deps_.extractor,
                                     .blob = deps_.blob,
                                     .tenancy = tenancy_};
}

common::Result<std::unique_ptr<MemoryService>> MemoryService::create(const config::Config &config) {
  using ServicePtr = std::unique_ptr<MemoryService>;
  observability::set_global_observer(observability::create_observer(config));

  auto store = store::create_metadata_store(config);
  if (!store.ok()) {
    return fail<ServicePtr>(store.error_info());
  }
  auto schema = scope::ScopeSchema::parse(config.tenancy.fields);
  if (!schema.ok()) {
    return fail<ServicePtr>(schema.error_info());
  }

  ServiceDependencies deps;
  deps.config = std::make_shared<const config::Config>(config);
  deps.store = store.value();
  deps.embedder = capability::create_embedder(config);
  deps.extractor = capability::create_extractor(config);
  deps.blob = capability::create_blob_store(config);

  const std::size_t dimensions =
      deps.embedder ? deps.embedder->dimensions() : config.embedding.dimensions;
  auto index = vector::create_vector_index(config, schema.value(), dimensions);
  if (!index.ok()) {
    return fail<ServicePtr>(index.error_info());
  }
  deps.vector = index.value();
  return create(std::move(deps));
}

common::Result<std::unique_ptr<MemoryService>>
MemoryService::create(ServiceDependencies dependencies) {
  using ServicePtr = std::unique_ptr<MemoryService>;
  if (!dependencies.config || !dependencies.store) {
    return common::Result<ServicePtr>::failure(ErrorKind::Validation,
                                               "memory service requires a config and a store");
  }
  if (dependencies.embedder && dependencies.vector &&
      dependencies.embedder->dimensions() != dependencies.vector->dimensions()) {
    return common::Result<ServicePtr>::failure(
        ErrorKind::Validation,
        "embedding dimension " + std::to_string(dependencies.embedder->dimensions()) +
            " does not match vector index dimension " +
            std::to_string(dependencies.vector->dimensions()));
  }

  auto schema = scope::ScopeSchema::parse(dependencies.config->tenancy.fields);
  if (!schema.ok()) {
    return fail<ServicePtr>(schema.error_info());
  }
  auto tenancy = std::make_shared<scope::TenancyManager>(dependencies.store);
  const auto provisioned = tenancy->provision(schema.value());
  if (!provisioned.ok()) {
    return fail<ServicePtr>(provisioned.error_info());
  }

  capability::CapabilitySet capabilities{capability::Capability::StoreWrite};
  if (dependencies.extractor) {
    capabilities.add(capability::Capability::Llm);
  }
  if (dependencies.embedder) {
    capabilities.add(capability::Capability::Embedding);
  }
  if (dependencies.vector) {
    capabilities.add(capability::Capability::VectorQuery);
  }
  if (dependencies.blob) {
    capabilities.add(capability::Capability::Blob);
  }
  if (!dependencies.runner) {
    dependencies.runner = runner::create_runner(dependencies.config->runner, dependencies.store);
  }

  ServicePtr service = std::make_unique<MemoryService>(ConstructionKey{}, std::move(dependencies),
                                                       tenancy, capabilities);

  struct Registration {
    const char *workflow;
    std::vector<pipeline::StepSpec> steps;
    std::vector<std::string> inputs;
  };
  std::vector<Registration> registrations;
  registrations.push_back(
      {pipeline::kMemorizeWorkflow, pipeline::memorize_steps(), pipeline::memorize_inputs()});
  registrations.push_back(
      {pipeline::kRetrieveWorkflow, pipeline::retrieve_steps(), pipeline::retrieve_inputs()});
  registrations.push_back(
      {pipeline::kEvolveWorkflow, pipeline::evolve_steps(), pipeline::evolve_inputs()});
  for (auto &registration : registrations) {
    const auto status = service->pipelines_.register_pipeline(
        registration.workflow, std::move(registration.steps), std::move(registration.inputs));
    if (!status.ok()) {
      return fail<ServicePtr>(status.error_info());
    }
  }
  const auto recorded = tenancy->record_pipeline_revision(service->pipelines_.revision_token());
  if (!recorded.ok()) {
    return fail<ServicePtr>(recorded.error_info());
  }
  return common::Result<ServicePtr>::success(std::move(service));
}

// ── memorize ─────────────────────────────────────────────────────

common::Result<pipeline::MemorizeResult>
MemoryService::memorize(const scope::ScopeValues &scope, pipeline::MemorizeRequest request,
                        const std::atomic<bool> *cancel) {
  auto key = tenancy_->validate(scope);
  if (!key.ok()) {
    return fail<pipeline::MemorizeResult>(key.error_info());
  }
  return run_memorize(key.value(), std::move(request), common::random_id("run_"), cancel);
}

common::Result<pipeline::MemorizeResult>
MemoryService::run_memorize(const scope::ScopeKey &key, pipeline::MemorizeRequest request,
                            const std::string &run_id, const std::atomic<bool> *cancel) {
  using Out = common::Result<pipeline::MemorizeResult>;
  if (request.content.empty() && request.uri.empty()) {
    return Out::failure(ErrorKind::Validation, "memorize requires content or a uri");
  }
  if (request.content.empty() && !deps_.blob) {
    return Out::failure(ErrorKind::CapabilityUnavailable,
                        "no blob store configured to resolve " + request.uri);
  }
  auto revision = pipelines_.build(pipeline::kMemorizeWorkflow);
  if (!revision.ok()) {
    return Out::failure(revision.error_info());
  }

  pipeline::WorkflowState state;
  state.scope = key;
  state.selector = scope::ScopeSelector::for_key(key);
  state.run_id = run_id;
  state.memorize_request = request;
  for (const auto &field : pipeline::memorize_inputs()) {
    state.mark(field);
  }

  runner::RunContext context;
  context.run_id = run_id;
  context.workflow = pipeline::kMemorizeWorkflow;
  context.scope = key;
  context.input_summary = "modality=" + store::modality_to_string(request.modality) +
                          (request.uri.empty() ? "" : " uri=" + request.uri) +
                          " bytes=" + std::to_string(request.content.size());
  context.payload = encode_memorize(key, request);
  context.cancel = cancel;

  const auto lock = locks_.lock_for(key);
  std::lock_guard<std::mutex> guard(*lock);
  auto outcome = deps_.runner->run(revision.value(), std::move(state), services_, context);
  if (!outcome.ok()) {
    return Out::failure(outcome.error.value_or(
        common::Error{.kind = ErrorKind::Internal, .message = "memorize run failed"}));
  }

  const auto &done = outcome.state;
  pipeline::MemorizeResult result;
  result.run_id = run_id;
  result.resource = done.resource;
  result.resource_reused = done.resource_reused;
  result.reinforced = done.merge.reinforced;
  result.superseded = done.merge.superseded;
  result.rejected = done.merge.rejected;

  const auto selector = scope::ScopeSelector::for_key(key);
  if (!done.merge.reported_ids.empty()) {
    auto items = deps_.store->list_items(
        selector, store::ItemFilter{.ids = done.merge.reported_ids, .active_only = false});
    if (!items.ok()) {
      return Out::failure(items.error_info());
    }
    result.items = std::move(items.value());

    auto links = deps_.store->list_links(selector,
                                         store::LinkFilter{.item_ids = done.merge.reported_ids});
    if (!links.ok()) {
      return Out::failure(links.error_info());
    }
    std::set<std::string> category_ids;
    for (const auto &link : links.value()) {
      category_ids.insert(link.category_id);
    }
    if (!category_ids.empty()) {
      auto categories = deps_.store->list_categories(
          selector,
          store::CategoryFilter{.ids = {category_ids.begin(), category_ids.end()}});
      if (!categories.ok()) {
        return Out::failure(categories.error_info());
      }
      result.categories = std::move(categories.value());
    }
  }
  return Out::success(std::move(result));
}

// ── retrieve ─────────────────────────────────────────────────────

common::Result<pipeline::RetrieveResult>
MemoryService::retrieve(const scope::ScopeValues &scope, pipeline::RetrieveRequest request,
                        const std::atomic<bool> *cancel) {
  auto key = tenancy_->validate(scope);
  if (!key.ok()) {
    return fail<pipeline::RetrieveResult>(key.error_info());
  }
  return retrieve(exact_spec(scope), std::move(request), cancel);
}

common::Result<pipeline::RetrieveResult>
MemoryService::retrieve(const scope::SelectorSpec &selector, pipeline::RetrieveRequest request,
                        const std::atomic<bool> *cancel) {
  using Out = common::Result<pipeline::RetrieveResult>;
  if (common::trim(request.query).empty()) {
    return Out::failure(ErrorKind::Validation, "retrieve query is empty");
  }
  auto validated = tenancy_->validate_selector(selector);
  if (!validated.ok()) {
    return Out::failure(validated.error_info());
  }
  auto decision = policy_.evaluate(validated.value());
  if (!decision.ok()) {
    return Out::failure(decision.error_info());
  }
  auto revision = pipelines_.build(pipeline::kRetrieveWorkflow);
  if (!revision.ok()) {
    return Out::failure(revision.error_info());
  }

  const auto &sel = validated.value();
  const std::string run_id = common::random_id("run_");
  pipeline::WorkflowState state;
  state.selector = sel;
  state.scope = sel.is_single_exact() ? sel.expand().front() : sel.label_key();
  state.run_id = run_id;
  state.retrieve_request = request;
  state.policy = decision.value();
  for (const auto &field : pipeline::retrieve_inputs()) {
    state.mark(field);
  }

  runner::RunContext context;
  context.run_id = run_id;
  context.workflow = pipeline::kRetrieveWorkflow;
  context.scope = state.scope;
  context.input_summary = "query=" + request.query.substr(0, kSummaryQueryChars) +
                          " selector=" + sel.to_string() +
                          " mode=" + policy::retrieval_mode_to_string(decision.value().mode);
  context.cancel = cancel;

  auto outcome = deps_.runner->run(revision.value(), std::move(state), services_, context);
  if (!outcome.ok()) {
    return Out::failure(outcome.error.value_or(
        common::Error{.kind = ErrorKind::Internal, .message = "retrieve run failed"}));
  }
  pipeline::RetrieveResult result = std::move(outcome.state.retrieve_result);
  result.run_id = run_id;
  result.degraded = outcome.status == store::RunStatus::Degraded;
  result.mode = policy::retrieval_mode_to_string(outcome.state.policy.mode);
  return Out::success(std::move(result));
}

// ── evolve ───────────────────────────────────────────────────────

common::Result<pipeline::EvolveResult> MemoryService::evolve(const scope::ScopeValues &scope,
                                                             pipeline::EvolveRequest request,
                                                             const std::atomic<bool> *cancel) {
  auto key = tenancy_->validate(scope);
  if (!key.ok()) {
    return fail<pipeline::EvolveResult>(key.error_info());
  }
  return run_evolve(key.value(), std::move(request), common::random_id("run_"), cancel);
}

common::Result<pipeline::EvolveResult>
MemoryService::run_evolve(const scope::ScopeKey &key, pipeline::EvolveRequest request,
                          const std::string &run_id, const std::atomic<bool> *cancel) {
  using Out = common::Result<pipeline::EvolveResult>;
  auto revision = pipelines_.build(pipeline::kEvolveWorkflow);
  if (!revision.ok()) {
    return Out::failure(revision.error_info());
  }

  pipeline::WorkflowState state;
  state.scope = key;
  state.selector = scope::ScopeSelector::for_key(key);
  state.run_id = run_id;
  state.evolve_request = request;
  for (const auto &field : pipeline::evolve_inputs()) {
    state.mark(field);
  }

  runner::RunContext context;
  context.run_id = run_id;
  context.workflow = pipeline::kEvolveWorkflow;
  context.scope = key;
  context.input_summary = std::string("force=") + (request.force ? "true" : "false");
  context.payload = encode_evolve(key, request);
  context.cancel = cancel;

  const auto lock = locks_.lock_for(key);
  std::lock_guard<std::mutex> guard(*lock);
  auto outcome = deps_.runner->run(revision.value(), std::move(state), services_, context);
  if (!outcome.ok()) {
    return Out::failure(outcome.error.value_or(
        common::Error{.kind = ErrorKind::Internal, .message = "evolve run failed"}));
  }
  pipeline::EvolveResult result;
  result.run_id = run_id;
  result.diff = std::move(outcome.state.diff);
  result.diff_summary = result.diff.summary;
  return Out::success(std::move(result));
}

// ── reads ────────────────────────────────────────────────────────

common::Result<std::vector<store::MemoryCategory>>
MemoryService::list_categories(const scope::ScopeValues &scope, const bool include_summary) {
  using Out = common::Result<std::vector<store::MemoryCategory>>;
  auto key = tenancy_->validate(scope);
  if (!key.ok()) {
    return Out::failure(key.error_info());
  }
  auto categories = deps_.store->list_categories(scope::ScopeSelector::for_key(key.value()),
                                                 store::CategoryFilter{});
  if (!categories.ok()) {
    return categories;
  }
  auto &rows = categories.value();
  std::sort(rows.begin(), rows.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.name < rhs.name; });
  if (!include_summary) {
    for (auto &row : rows) {
      row.summary.clear();
    }
  }
  return categories;
}

common::Result<store::MemoryCategory> MemoryService::get_category(const scope::ScopeValues &scope,
                                                                  const std::string &key) {
  using Out = common::Result<store::MemoryCategory>;
  auto validated = tenancy_->validate(scope);
  if (!validated.ok()) {
    return Out::failure(validated.error_info());
  }
  auto by_id = deps_.store->get_category(validated.value(), key);
  if (!by_id.ok()) {
    return Out::failure(by_id.error_info());
  }
  if (by_id.value().has_value()) {
    return Out::success(std::move(*by_id.value()));
  }
  auto by_name = deps_.store->list_categories(
      scope::ScopeSelector::for_key(validated.value()),
      store::CategoryFilter{.name = common::to_lower(common::trim(key)), .limit = 1});
  if (!by_name.ok()) {
    return Out::failure(by_name.error_info());
  }
  if (by_name.value().empty()) {
    return Out::failure(ErrorKind::NotFound, "category not found: " + key);
  }
  return Out::success(std::move(by_name.value().front()));
}

common::Result<std::vector<store::MemoryItem>>
MemoryService::list_items(const scope::ScopeValues &scope, const store::ItemFilter &filter) {
  auto key = tenancy_->validate(scope);
  if (!key.ok()) {
    return fail<std::vector<store::MemoryItem>>(key.error_info());
  }
  return deps_.store->list_items(scope::ScopeSelector::for_key(key.value()), filter);
}

common::Result<store::RunLog> MemoryService::run_log(const std::string &run_id) {
  auto log = deps_.store->get_run_log(run_id);
  if (!log.ok()) {
    return fail<store::RunLog>(log.error_info());
  }
  if (!log.value().has_value()) {
    return common::Result<store::RunLog>::failure(ErrorKind::NotFound,
                                                  "run not found: " + run_id);
  }
  return common::Result<store::RunLog>::success(std::move(*log.value()));
}

common::Result<std::vector<store::RunLog>> MemoryService::recent_runs(const std::size_t limit) {
  return deps_.store->list_run_logs(limit);
}

common::Result<std::vector<store::DiffRecord>>
MemoryService::list_diffs(const scope::ScopeValues &scope, const std::size_t limit) {
  auto key = tenancy_->validate(scope);
  if (!key.ok()) {
    return fail<std::vector<store::DiffRecord>>(key.error_info());
  }
  return deps_.store->list_diffs(key.value(), limit);
}

// ── item maintenance ─────────────────────────────────────────────

common::Result<store::MemoryItem> MemoryService::patch_item(const scope::ScopeValues &scope,
                                                            const ItemPatch &patch) {
  using Out = common::Result<store::MemoryItem>;
  auto validated = tenancy_->validate(scope);
  if (!validated.ok()) {
    return Out::failure(validated.error_info());
  }
  const auto &key = validated.value();
  const auto selector = scope::ScopeSelector::for_key(key);
  const std::string now = common::now_rfc3339();

  const auto lock = locks_.lock_for(key);
  std::lock_guard<std::mutex> guard(*lock);

  store::WriteBatch batch;
  store::MemoryItem item;
  std::optional<std::string> retired_id;

  if (patch.action == PatchAction::Create) {
    const std::string text = common::trim(patch.text.value_or(""));
    if (text.empty()) {
      return Out::failure(ErrorKind::Validation, "item text is empty");
    }
    const std::string hash = common::sha256_hex(text);
    auto existing = deps_.store->list_resources(
        selector, store::ResourceFilter{.content_hash = hash, .limit = 1});
    if (!existing.ok()) {
      return Out::failure(existing.error_info());
    }
    store::Resource resource;
    if (!existing.value().empty()) {
      resource = existing.value().front();
    } else {
      resource.id = common::random_id("res_");
      resource.scope = key;
      resource.uri = "inline:" + hash.substr(0, 16);
      resource.content = text;
      resource.modality = store::Modality::Text;
      resource.content_hash = hash;
      resource.created_at = now;
      batch.put_resource(resource);
    }
    item.id = common::random_id("mem_");
    item.scope = key;
    item.resource_id = resource.id;
    item.lineage_id = item.id;
    item.memory_type = patch.memory_type.value_or("knowledge");
    item.text = text;
    item.evidence = store::Evidence{.offset = 0, .length = text.size()};
    item.confidence = std::clamp(patch.confidence.value_or(1.0), 0.0, 1.0);
    item.stable = patch.stable.value_or(true);
    item.created_at = now;
    item.updated_at = now;
  } else {
    auto found = deps_.store->get_item(key, patch.item_id);
    if (!found.ok()) {
      return Out::failure(found.error_info());
    }
    if (!found.value().has_value() || !found.value()->active) {
      return Out::failure(ErrorKind::NotFound, "active item not found: " + patch.item_id);
    }
    store::MemoryItem current = *found.value();

    if (patch.action == PatchAction::Delete) {
      current.active = false;
      current.updated_at = now;
      batch.put_item(current);
      const auto committed = deps_.store->commit(batch);
      if (!committed.ok()) {
        return Out::failure(committed.error_info());
      }
      if (deps_.vector) {
        const auto removed = deps_.vector->remove(key, vector::EntityKind::Item, current.id);
        if (!removed.ok()) {
          observability::record_error("patch_item", removed.error());
        }
      }
      return Out::success(std::move(current));
    }

    item = current;
    item.id = common::random_id("mem_");
    item.version = current.version + 1;
    if (patch.text.has_value()) {
      item.text = common::trim(*patch.text);
      if (item.text.empty()) {
        return Out::failure(ErrorKind::Validation, "item text is empty");
      }
      item.embedding.clear();
    }
    if (patch.memory_type.has_value()) {
      item.memory_type = *patch.memory_type;
    }
    if (patch.confidence.has_value()) {
      item.confidence = std::clamp(*patch.confidence, 0.0, 1.0);
    }
    if (patch.stable.has_value()) {
      item.stable = *patch.stable;
    }
    item.created_at = now;
    item.updated_at = now;
    item.superseded_by.reset();

    current.active = false;
    current.superseded_by = item.id;
    current.updated_at = now;
    batch.put_item(current);
    retired_id = current.id;
  }
  item.content_hash = store::item_content_hash(item.memory_type, item.text);

  if (item.embedding.empty() && deps_.embedder) {
    auto embedded = deps_.embedder->embed(item.text);
    if (!embedded.ok()) {
      return Out::failure(embedded.error_info());
    }
    item.embedding = std::move(embedded.value());
  }
  batch.put_item(item);

  std::vector<std::string> category_ids;
  if (retired_id.has_value()) {
    auto links = deps_.store->list_links(selector, store::LinkFilter{.item_ids = {*retired_id}});
    if (!links.ok()) {
      return Out::failure(links.error_info());
    }
    for (const auto &link : links.value()) {
      category_ids.push_back(link.category_id);
    }
  }
  pipeline::CategoryAssigner assigner(services_, key,
                                      deps_.config->memorize.category_assign_threshold, 2,
                                      deps_.config->memorize.fallback_category);
  if (category_ids.empty()) {
    const auto loaded = assigner.load();
    if (!loaded.ok()) {
      return Out::failure(loaded.error_info());
    }
    auto assigned = assigner.assign(item, {});
    if (!assigned.ok()) {
      return Out::failure(assigned.error_info());
    }
    category_ids = std::move(assigned.value());
    for (const auto &category : assigner.created()) {
      batch.put_category(category);
    }
  }
  for (const auto &category_id : category_ids) {
    batch.put_link(store::CategoryItem{
        .scope = key, .category_id = category_id, .item_id = item.id, .created_at = now});
  }

  const auto committed = deps_.store->commit(batch);
  if (!committed.ok()) {
    return Out::failure(committed.error_info());
  }
  if (deps_.vector) {
    const auto index = [](const common::Status &status) {
      if (!status.ok()) {
        observability::record_error("patch_item", status.error());
      }
    };
    if (!item.embedding.empty()) {
      index(deps_.vector->upsert(key, vector::EntityKind::Item, item.id, item.embedding));
    }
    if (retired_id.has_value()) {
      index(deps_.vector->remove(key, vector::EntityKind::Item, *retired_id));
    }
    for (const auto &category : assigner.created()) {
      if (!category.embedding.empty()) {
        index(deps_.vector->upsert(key, vector::EntityKind::Category, category.id,
                                   category.embedding));
      }
    }
  }
  return Out::success(std::move(item));
}

common::Result<store::PurgeStats> MemoryService::purge(const scope::ScopeValues &scope) {
  using Out = common::Result<store::PurgeStats>;
  auto key = tenancy_->validate(scope);
  if (!key.ok()) {
    return Out::failure(key.error_info());
  }
  const auto lock = locks_.lock_for(key.value());
  std::lock_guard<std::mutex> guard(*lock);
  auto stats = deps_.store->purge_scope(key.value());
  if (!stats.ok()) {
    return stats;
  }
  if (deps_.vector) {
    const auto purged = deps_.vector->purge(key.value());
    if (!purged.ok()) {
      return Out::failure(purged.error_info());
    }
  }
  return stats;
}

// ── pipeline edits ───────────────────────────────────────────────

common::Result<pipeline::RevisionPtr>
MemoryService::publish(common::Result<pipeline::RevisionPtr> revision) {
  if (!revision.ok()) {
    return revision;
  }
  const auto recorded = tenancy_->record_pipeline_revision(pipelines_.revision_token());
  if (!recorded.ok()) {
    observability::record_error("pipeline", recorded.error());
  }
  return revision;
}

common::Result<pipeline::RevisionPtr>
MemoryService::config_step(const std::string &workflow, const std::string &step_id,
                           const std::map<std::string, std::string> &overrides) {
  return publish(pipelines_.config_step(workflow, step_id, overrides));
}

common::Result<pipeline::RevisionPtr>
MemoryService::insert_step_after(const std::string &workflow, const std::string &target_id,
                                 pipeline::StepSpec step) {
  return publish(pipelines_.insert_after(workflow, target_id, std::move(step)));
}

common::Result<pipeline::RevisionPtr>
MemoryService::insert_step_before(const std::string &workflow, const std::string &target_id,
                                  pipeline::StepSpec step) {
  return publish(pipelines_.insert_before(workflow, target_id, std::move(step)));
}

common::Result<pipeline::RevisionPtr> MemoryService::replace_step(const std::string &workflow,
                                                                  const std::string &target_id,
                                                                  pipeline::StepSpec step) {
  return publish(pipelines_.replace_step(workflow, target_id, std::move(step)));
}

common::Result<pipeline::RevisionPtr> MemoryService::remove_step(const std::string &workflow,
                                                                 const std::string &target_id) {
  return publish(pipelines_.remove_step(workflow, target_id));
}

common::Result<pipeline::RevisionPtr>
MemoryService::rollback_pipeline(const std::string &workflow, const std::uint64_t revision) {
  return publish(pipelines_.rollback(workflow, revision));
}

common::Result<std::vector<pipeline::RevisionPtr>>
MemoryService::pipeline_history(const std::string &workflow) const {
  return pipelines_.history(workflow);
}

common::Result<pipeline::RevisionPtr>
MemoryService::current_pipeline(const std::string &workflow) const {
  return pipelines_.current(workflow);
}

// ── operations ───────────────────────────────────────────────────

common::Result<ReindexStats> MemoryService::reindex(const scope::ScopeValues &scope) {
  using Out = common::Result<ReindexStats>;
  auto validated = tenancy_->validate(scope);
  if (!validated.ok()) {
    return Out::failure(validated.error_info());
  }
  if (!deps_.vector) {
    return Out::failure(ErrorKind::CapabilityUnavailable, "no vector index configured");
  }
  const auto &key = validated.value();
  const auto selector = scope::ScopeSelector::for_key(key);
  const auto lock = locks_.lock_for(key);
  std::lock_guard<std::mutex> guard(*lock);

  const auto purged = deps_.vector->purge(key);
  if (!purged.ok()) {
    return Out::failure(purged.error_info());
  }

  ReindexStats stats;
  store::WriteBatch repaired;
  auto items = deps_.store->list_items(selector, store::ItemFilter{.active_only = true});
  if (!items.ok()) {
    return Out::failure(items.error_info());
  }
  for (auto &item : items.value()) {
    if (item.embedding.empty() && deps_.embedder) {
      auto embedded = deps_.embedder->embed(item.text);
      if (!embedded.ok()) {
        return Out::failure(embedded.error_info());
      }
      item.embedding = std::move(embedded.value());
      repaired.put_item(item);
    }
    if (item.embedding.empty()) {
      continue;
    }
    const auto status = deps_.vector->upsert(key, vector::EntityKind::Item, item.id, item.embedding);
    if (!status.ok()) {
      return Out::failure(status.error_info());
    }
    ++stats.items;
  }

  auto categories = deps_.store->list_categories(selector, store::CategoryFilter{});
  if (!categories.ok()) {
    return Out::failure(categories.error_info());
  }
  for (auto &category : categories.value()) {
    if (category.embedding.empty() && deps_.embedder) {
      auto embedded = deps_.embedder->embed(pipeline::category_embedding_text(category));
      if (!embedded.ok()) {
        return Out::failure(embedded.error_info());
      }
      category.embedding = std::move(embedded.value());
      repaired.put_category(category);
    }
    if (category.embedding.empty()) {
      continue;
    }
    const auto status =
        deps_.vector->upsert(key, vector::EntityKind::Category, category.id, category.embedding);
    if (!status.ok()) {
      return Out::failure(status.error_info());
    }
    ++stats.categories;
  }

  if (deps_.embedder) {
    auto resources = deps_.store->list_resources(selector, store::ResourceFilter{});
    if (!resources.ok()) {
      return Out::failure(resources.error_info());
    }
    for (const auto &resource : resources.value()) {
      std::string text = store::is_media(resource.modality)
                             ? resource.transcription + "\n" + resource.caption
                             : resource.content;
      auto embedded = deps_.embedder->embed(text.substr(0, kResourceEmbeddingChars));
      if (!embedded.ok()) {
        return Out::failure(embedded.error_info());
      }
      const auto status = deps_.vector->upsert(key, vector::EntityKind::Resource, resource.id,
                                               embedded.value());
      if (!status.ok()) {
        return Out::failure(status.error_info());
      }
      ++stats.resources;
    }
  }

  if (!repaired.empty()) {
    const auto committed = deps_.store->commit(repaired);
    if (!committed.ok()) {
      return Out::failure(committed.error_info());
    }
  }
  return Out::success(stats);
}

common::Result<std::size_t> MemoryService::resume_pending() {
  using Out = common::Result<std::size_t>;
  auto pending = deps_.store->list_checkpoints("running");
  if (!pending.ok()) {
    return Out::failure(pending.error_info());
  }

  std::size_t replayed = 0;
  for (auto checkpoint : pending.value()) {
    bool succeeded = true;
    if (checkpoint.workflow == pipeline::kMemorizeWorkflow ||
        checkpoint.workflow == pipeline::kEvolveWorkflow) {
      auto key = tenancy_->validate(decode_scope(checkpoint.payload));
      if (!key.ok()) {
        observability::record_error("resume_pending", key.error_info().to_string());
        succeeded = false;
      } else if (checkpoint.workflow == pipeline::kMemorizeWorkflow) {
        auto request = decode_memorize(checkpoint.payload);
        if (!request.ok()) {
          observability::record_error("resume_pending", request.error());
          succeeded = false;
        } else {
          auto result = run_memorize(key.value(), std::move(request.value()),
                                     checkpoint.run_id, nullptr);
          succeeded = result.ok();
          if (!result.ok()) {
            observability::record_error("resume_pending", result.error_info().to_string());
          }
        }
      } else {
        auto result = run_evolve(key.value(), decode_evolve(checkpoint.payload),
                                 checkpoint.run_id, nullptr);
        succeeded = result.ok();
        if (!result.ok()) {
          observability::record_error("resume_pending", result.error_info().to_string());
        }
      }
      ++replayed;
    }

    // Runs replayed through a non-checkpointing runner leave the old row behind.
    auto current = deps_.store->get_checkpoint(checkpoint.run_id);
    if (!current.ok()) {
      return Out::failure(current.error_info());
    }
    if (current.value().has_value() && current.value()->status == "running") {
      checkpoint.status = succeeded ? "done" : "failed";
      checkpoint.updated_at = common::now_rfc3339();
      const auto saved = deps_.store->put_checkpoint(checkpoint);
      if (!saved.ok()) {
        return Out::failure(saved.error_info());
      }
    }
  }
  return Out::success(replayed);
}

HealthReport MemoryService::health_check() {
  const auto meta = tenancy_->meta();
  HealthReport report;
  report.store_ok = deps_.store->health_check();
  report.vector_configured = deps_.vector != nullptr;
  report.runner = std::string(deps_.runner->name());
  report.capabilities = capabilities_.describe();
  report.schema = meta.fields;
  report.taxonomy_version = meta.taxonomy_version;
  report.pipeline_revision = meta.pipeline_revision;
  return report;
}

} // namespace strata::service
