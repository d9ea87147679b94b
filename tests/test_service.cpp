#include "test_framework.hpp"

#include "strata/capability/embedder_local.hpp"
#include "strata/capability/extractor_rule.hpp"
#include "strata/observability/observer.hpp"
#include "strata/pipeline/builtin_steps.hpp"
#include "strata/service/memory_service.hpp"
#include "strata/store/memory_store.hpp"
#include "strata/vector/vector_index.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <type_traits>

namespace {

namespace service = strata::service;
namespace pipeline = strata::pipeline;
namespace scope = strata::scope;
namespace store = strata::store;
using strata::common::ErrorKind;
using strata::tests::require;

scope::ScopeValues tenant(const std::string &project, const std::string &agent) {
  return {{"project_id", project}, {"agent_id", agent}};
}

pipeline::MemorizeRequest conversation(const std::string &content) {
  pipeline::MemorizeRequest request;
  request.content = content;
  request.modality = store::Modality::Conversation;
  return request;
}

pipeline::RetrieveRequest query(const std::string &text) {
  pipeline::RetrieveRequest request;
  request.query = text;
  return request;
}

std::unique_ptr<service::MemoryService> make_service() {
  auto created = service::MemoryService::create(strata::testing::mock_config());
  require(created.ok(), created.ok() ? "" : created.error());
  return std::move(created.value());
}

struct CountedService {
  std::shared_ptr<store::InMemoryStore> backing;
  std::shared_ptr<strata::testing::CountingStore> store;
  std::unique_ptr<service::MemoryService> service;
};

service::ServiceDependencies
dependencies_for(const strata::config::Config &config,
                 std::shared_ptr<store::IMetadataStore> metadata) {
  service::ServiceDependencies deps;
  deps.config = std::make_shared<const strata::config::Config>(config);
  deps.store = std::move(metadata);
  deps.vector = std::make_shared<strata::vector::BruteForceVectorIndex>(64);
  deps.embedder = std::make_shared<strata::capability::LocalEmbedder>(64);
  deps.extractor = std::make_shared<strata::capability::RuleExtractor>();
  return deps;
}

CountedService
make_counted_service(const strata::config::Config &config = strata::testing::mock_config()) {
  CountedService out;
  out.backing = std::make_shared<store::InMemoryStore>();
  out.store = std::make_shared<strata::testing::CountingStore>(out.backing);
  auto created = service::MemoryService::create(dependencies_for(config, out.store));
  require(created.ok(), created.ok() ? "" : created.error());
  out.service = std::move(created.value());
  return out;
}

bool mentions(const std::vector<pipeline::ScoredItem> &items, const std::string &word) {
  return std::any_of(items.begin(), items.end(), [&](const auto &scored) {
    return scored.item.text.find(word) != std::string::npos;
  });
}

std::size_t active_count(service::MemoryService &memory, const scope::ScopeValues &scope) {
  auto items = memory.list_items(scope);
  require(items.ok(), "list_items should succeed");
  return items.value().size();
}

} // namespace

void register_service_tests(std::vector<strata::tests::TestCase> &tests) {
  using strata::tests::TestCase;

  tests.push_back({"service_memorize_then_retrieve_is_scope_isolated", [] {
                     auto memory = make_service();
                     auto stored = memory->memorize(tenant("p1", "a1"),
                                                    conversation("My favorite color is blue."));
                     require(stored.ok(), stored.ok() ? "" : stored.error());
                     require(stored.value().items.size() == 1, "one fact extracted");
                     require(stored.value().items.front().subject == "favorite color",
                             "subject key recorded");
                     require(!stored.value().categories.empty(), "item linked to a category");
                     require(!stored.value().resource.id.empty(), "resource persisted");

                     auto found = memory->retrieve(tenant("p1", "a1"),
                                                   query("what color do they like"));
                     require(found.ok(), found.ok() ? "" : found.error());
                     require(mentions(found.value().items, "blue"), "fact recalled in its scope");
                     for (const auto &scored : found.value().items) {
                       require(scored.item.scope.value("project_id") == "p1",
                               "only p1 items returned");
                     }

                     auto other = memory->retrieve(tenant("p2", "a1"),
                                                   query("what color do they like"));
                     require(other.ok(), other.ok() ? "" : other.error());
                     require(other.value().items.empty(), "other tenant sees nothing");
                     require(other.value().categories.empty(), "other tenant has no categories");
                   }});

  tests.push_back({"service_rejects_scope_values_outside_schema", [] {
                     auto memory = make_service();
                     auto missing = memory->memorize({{"project_id", "p1"}},
                                                     conversation("My favorite color is blue."));
                     require(!missing.ok(), "missing field should fail");
                     require(missing.kind() == ErrorKind::ScopeSchemaMismatch, "schema mismatch");

                     auto unknown = memory->retrieve(
                         scope::ScopeValues{{"project_id", "p1"}, {"agent_id", "a1"}, {"user", "u"}},
                         query("color"));
                     require(!unknown.ok(), "unknown field should fail");
                     require(unknown.kind() == ErrorKind::ScopeSchemaMismatch, "schema mismatch");

                     auto categories = memory->list_categories({{"agent_id", "a1"}});
                     require(!categories.ok() &&
                                 categories.kind() == ErrorKind::ScopeSchemaMismatch,
                             "reads validate the scope too");
                   }});

  tests.push_back({"service_control_characters_cannot_alias_scopes", [] {
                     auto memory = make_service();
                     const auto crafted = tenant(std::string("a\x1f" "agent_id\x1e" "b"), "c");
                     const auto aliased = tenant("a", std::string("b\x1f" "agent_id\x1e" "c"));
                     auto stored =
                         memory->memorize(crafted, conversation("My favorite color is blue."));
                     require(!stored.ok() && stored.kind() == ErrorKind::ScopeSchemaMismatch,
                             "separator bytes in a scope value accepted");
                     auto listed = memory->list_items(aliased);
                     require(!listed.ok() && listed.kind() == ErrorKind::ScopeSchemaMismatch,
                             "aliased scope readable");
                     require(active_count(*memory, tenant("a", "b")) == 0, "nothing stored");
                   }});

  tests.push_back({"service_second_deployment_with_other_schema_is_refused", [] {
                     auto shared = std::make_shared<store::InMemoryStore>();
                     auto first = service::MemoryService::create(
                         dependencies_for(strata::testing::mock_config(), shared));
                     require(first.ok(), "first deployment provisions the schema");

                     auto same = service::MemoryService::create(
                         dependencies_for(strata::testing::mock_config(), shared));
                     require(same.ok(), "identical schema is accepted");

                     auto changed = strata::testing::mock_config();
                     changed.tenancy.fields = {"project_id:string", "user_id:string"};
                     auto second = service::MemoryService::create(dependencies_for(changed, shared));
                     require(!second.ok(), "schema change should be refused");
                     require(second.kind() == ErrorKind::ScopeSchemaMismatch,
                             "refusal is a schema mismatch");
                   }});

  tests.push_back({"service_create_validates_dependencies", [] {
                     auto deps = dependencies_for(strata::testing::mock_config(),
                                                  std::make_shared<store::InMemoryStore>());
                     deps.vector = std::make_shared<strata::vector::BruteForceVectorIndex>(32);
                     auto mismatched = service::MemoryService::create(std::move(deps));
                     require(!mismatched.ok(), "dimension mismatch should fail");
                     require(mismatched.kind() == ErrorKind::Validation, "validation error");

                     service::ServiceDependencies empty;
                     auto bare = service::MemoryService::create(std::move(empty));
                     require(!bare.ok() && bare.kind() == ErrorKind::Validation,
                             "config and store are required");
                   }});

  tests.push_back({"service_is_only_built_through_create", [] {
                     static_assert(!std::is_constructible_v<
                                       service::MemoryService, service::ServiceDependencies,
                                       std::shared_ptr<scope::TenancyManager>,
                                       strata::capability::CapabilitySet>,
                                   "construction must go through create()");
                     static_assert(!std::is_copy_constructible_v<service::MemoryService>);
                     auto memory = make_service();
                     require(memory != nullptr, "create returns an owned service");
                     require(memory->tenancy().provisioned(), "tenancy provisioned by create");
                   }});

  tests.push_back({"service_memorize_validates_request", [] {
                     auto memory = make_service();
                     auto empty = memory->memorize(tenant("p1", "a1"), pipeline::MemorizeRequest{});
                     require(!empty.ok() && empty.kind() == ErrorKind::Validation,
                             "content or uri required");

                     pipeline::MemorizeRequest by_uri;
                     by_uri.uri = "notes/today.txt";
                     auto no_blob = memory->memorize(tenant("p1", "a1"), by_uri);
                     require(!no_blob.ok() && no_blob.kind() == ErrorKind::CapabilityUnavailable,
                             "uri without blob store is unavailable");
                   }});

  tests.push_back({"service_failed_step_leaves_no_partial_writes", [] {
                     auto memory = make_service();
                     auto edited = memory->insert_step_before(
                         pipeline::kMemorizeWorkflow, "persist_index",
                         strata::testing::make_step(
                             "explode", {}, {"extra.boom"},
                             [](pipeline::WorkflowState &, const pipeline::StepContext &) {
                               return strata::common::Status::error(ErrorKind::Internal, "boom");
                             }));
                     require(edited.ok(), edited.ok() ? "" : edited.error());

                     auto stored = memory->memorize(tenant("p1", "a1"),
                                                    conversation("My favorite color is blue."));
                     require(!stored.ok(), "run should fail");
                     require(stored.error_info().step_id == "explode", "failing step named");
                     require(active_count(*memory, tenant("p1", "a1")) == 0, "no items stored");
                     auto categories = memory->list_categories(tenant("p1", "a1"));
                     require(categories.ok() && categories.value().empty(),
                             "no categories stored");

                     auto log = memory->run_log(stored.error_info().run_id);
                     require(log.ok(), "failed run is logged");
                     require(log.value().status == store::RunStatus::Failed, "logged as failed");
                   }});

  tests.push_back({"service_store_commit_failure_is_reported", [] {
                     auto counted = make_counted_service();
                     counted.store->fail_commits = 1;
                     auto stored = counted.service->memorize(
                         tenant("p1", "a1"), conversation("My favorite color is blue."));
                     require(!stored.ok(), "commit failure should fail the run");
                     require(stored.kind() == ErrorKind::TransientStore, "transient store error");
                     require(active_count(*counted.service, tenant("p1", "a1")) == 0,
                             "nothing persisted");

                     auto retried = counted.service->memorize(
                         tenant("p1", "a1"), conversation("My favorite color is blue."));
                     require(retried.ok(), "next attempt succeeds");
                     require(active_count(*counted.service, tenant("p1", "a1")) == 1,
                             "item persisted once");
                   }});

  tests.push_back({"service_slow_commit_outlives_step_timeout", [] {
                     auto config = strata::testing::mock_config();
                     config.runner.kind = "durable";
                     config.runner.max_retries = 0;
                     config.runner.step_timeout_ms = 100;
                     auto counted = make_counted_service(config);
                     counted.store->commit_delay_ms = 400;
                     auto stored = counted.service->memorize(
                         tenant("p1", "a1"), conversation("My favorite color is blue."));
                     require(stored.ok(), stored.ok() ? "" : stored.error());
                     require(active_count(*counted.service, tenant("p1", "a1")) == 1,
                             "item visible as soon as memorize returns");

                     counted.store->commit_delay_ms = 0;
                     const auto commits = counted.store->commits.load();
                     std::this_thread::sleep_for(std::chrono::milliseconds(500));
                     require(counted.store->commits.load() == commits, "no commit lands afterwards");
                   }});

  tests.push_back({"service_concurrent_identical_memorize_stores_one_resource", [] {
                     auto config = strata::testing::mock_config();
                     config.runner.kind = "durable";
                     config.runner.max_concurrency = 4;
                     auto counted = make_counted_service(config);
                     const auto scope = tenant("p1", "a1");
                     std::atomic<int> failures{0};
                     std::vector<std::thread> workers;
                     for (int i = 0; i < 8; ++i) {
                       workers.emplace_back([&] {
                         auto stored = counted.service->memorize(
                             scope, conversation("My favorite color is blue.\nI live in Lisbon."));
                         if (!stored.ok()) {
                           ++failures;
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(failures.load() == 0, "every memorize succeeded");

                     const auto key = scope::ScopeKey({{"project_id", "p1"}, {"agent_id", "a1"}});
                     auto resources = counted.backing->list_resources(
                         scope::ScopeSelector::for_key(key), store::ResourceFilter{});
                     require(resources.ok() && resources.value().size() == 1,
                             "one resource for identical content");

                     auto items = counted.service->list_items(scope);
                     require(items.ok() && items.value().size() == 2, "each fact stored once");
                     std::vector<std::string> hashes;
                     for (const auto &item : items.value()) {
                       hashes.push_back(item.content_hash);
                     }
                     std::sort(hashes.begin(), hashes.end());
                     require(std::adjacent_find(hashes.begin(), hashes.end()) == hashes.end(),
                             "no duplicate active items");
                   }});

  tests.push_back({"service_speaker_labels_are_normalized", [] {
                     auto memory = make_service();
                     auto stored = memory->memorize(
                         tenant("p1", "a1"),
                         conversation("  USER : My favorite color is blue.\n"
                                      "ASSISTANT : Noted, my favorite color is red."));
                     require(stored.ok(), stored.ok() ? "" : stored.error());
                     require(stored.value().items.size() == 1, "assistant turn ignored");
                     require(stored.value().items.front().text.find("blue") != std::string::npos,
                             "user fact kept");
                     const auto &segments = stored.value().resource.segments;
                     require(segments.size() == 2, "one segment per turn");
                     require(segments[0].speaker == "user" && segments[1].speaker == "assistant",
                             "speaker labels trimmed and lowercased");
                   }});

  tests.push_back({"service_identical_memorize_is_idempotent", [] {
                     auto memory = make_service();
                     const auto scope = tenant("p1", "a1");
                     auto first = memory->memorize(scope, conversation("My favorite color is blue."));
                     require(first.ok(), "first memorize");
                     auto second = memory->memorize(scope, conversation("My favorite color is blue."));
                     require(second.ok(), "second memorize");
                     require(second.value().resource_reused, "resource reused");
                     require(second.value().resource.id == first.value().resource.id,
                             "same resource id");
                     require(second.value().reinforced == 0, "no reinforcement on replay");
                     require(active_count(*memory, scope) == 1, "still one item");
                     require(second.value().items.front().reinforcement_count == 0,
                             "reinforcement count unchanged");
                   }});

  tests.push_back({"service_repeated_fact_in_new_resource_reinforces", [] {
                     auto memory = make_service();
                     const auto scope = tenant("p1", "a1");
                     auto first = memory->memorize(scope, conversation("My favorite color is blue."));
                     require(first.ok(), "first memorize");
                     auto second = memory->memorize(
                         scope, conversation("My favorite color is blue.\nI live in Lisbon."));
                     require(second.ok(), second.ok() ? "" : second.error());
                     require(!second.value().resource_reused, "new resource");
                     require(second.value().reinforced == 1, "existing fact reinforced");

                     auto items = memory->list_items(scope);
                     require(items.ok(), "list items");
                     const auto it = std::find_if(
                         items.value().begin(), items.value().end(),
                         [](const auto &item) { return item.text.find("blue") != std::string::npos; });
                     require(it != items.value().end(), "blue fact present");
                     require(it->reinforcement_count == 1, "reinforcement counted");
                     require(it->confidence > first.value().items.front().confidence,
                             "confidence raised");
                   }});

  tests.push_back({"service_same_subject_supersedes_or_rejects", [] {
                     auto memory = make_service();
                     const auto scope = tenant("p1", "a1");
                     auto first = memory->memorize(scope, conversation("My favorite color is blue."));
                     require(first.ok(), "first memorize");
                     const auto original = first.value().items.front();

                     auto changed = memory->memorize(scope, conversation("My favorite color is green."));
                     require(changed.ok(), changed.ok() ? "" : changed.error());
                     require(changed.value().superseded == 1, "old fact superseded");

                     auto active = memory->list_items(scope);
                     require(active.ok() && active.value().size() == 1, "one active item");
                     const auto &current = active.value().front();
                     require(current.text.find("green") != std::string::npos, "new fact active");
                     require(current.version == original.version + 1, "version incremented");
                     require(current.lineage_id == original.lineage_id, "lineage kept");

                     auto old = memory->list_items(
                         scope, store::ItemFilter{.ids = {original.id}, .active_only = false});
                     require(old.ok() && old.value().size() == 1, "old revision retained");
                     require(!old.value().front().active, "old revision inactive");
                     require(old.value().front().superseded_by == current.id, "successor linked");

                     auto hedged =
                         memory->memorize(scope, conversation("Maybe my favorite color is red."));
                     require(hedged.ok(), "low-confidence memorize still succeeds");
                     require(hedged.value().rejected == 1, "weaker claim rejected");
                     auto after = memory->list_items(scope);
                     require(after.ok() && after.value().size() == 1 &&
                                 after.value().front().id == current.id,
                             "active fact unchanged");
                   }});

  tests.push_back({"service_wildcard_selector_rejected_before_store_access", [] {
                     strata::testing::ObserverGuard guard;
                     auto counted = make_counted_service();
                     const std::size_t before = counted.store->reads.load();
                     auto result = counted.service->retrieve(
                         scope::SelectorSpec{{"project_id", scope::FieldMatch::wildcard()},
                                             {"agent_id", scope::FieldMatch::wildcard()}},
                         query("color"));
                     require(!result.ok(), "all-wildcard retrieve should fail");
                     require(result.kind() == ErrorKind::PolicyViolation, "policy violation");
                     require(counted.store->reads.load() == before, "no store reads");
                     require(guard.telemetry()
                                     .count_events<strata::observability::PolicyDecisionEvent>() >= 1,
                             "decision recorded");

                     auto blank = counted.service->retrieve(tenant("p1", "a1"), query("   "));
                     require(!blank.ok() && blank.kind() == ErrorKind::Validation,
                             "empty query rejected");
                   }});

  tests.push_back({"service_cross_scope_retrieve_spans_listed_agents", [] {
                     auto memory = make_service();
                     require(memory->memorize(tenant("p1", "a1"),
                                              conversation("My favorite color is blue."))
                                 .ok(),
                             "memorize a1");
                     require(memory->memorize(tenant("p1", "a2"),
                                              conversation("My favorite color is green."))
                                 .ok(),
                             "memorize a2");
                     require(memory->memorize(tenant("p1", "a3"),
                                              conversation("My favorite color is orange."))
                                 .ok(),
                             "memorize a3");

                     auto found = memory->retrieve(
                         scope::SelectorSpec{{"project_id", scope::FieldMatch::exact("p1")},
                                             {"agent_id", scope::FieldMatch::any_of({"a1", "a2"})}},
                         query("what color do they like"));
                     require(found.ok(), found.ok() ? "" : found.error());
                     require(mentions(found.value().items, "blue"), "a1 fact found");
                     require(mentions(found.value().items, "green"), "a2 fact found");
                     require(!mentions(found.value().items, "orange"), "a3 excluded");
                   }});

  tests.push_back({"service_pipeline_edits_do_not_touch_pinned_revisions", [] {
                     auto memory = make_service();
                     auto before = memory->current_pipeline(pipeline::kMemorizeWorkflow);
                     require(before.ok(), "current revision");
                     const auto pinned = before.value();
                     const auto steps = pinned->step_ids();

                     auto edited = memory->insert_step_after(
                         pipeline::kMemorizeWorkflow, "extract_items",
                         strata::testing::make_step(
                             "tag", {}, {"extra.tag"},
                             [](pipeline::WorkflowState &state, const pipeline::StepContext &) {
                               state.extras["extra.tag"] = "seen";
                               return strata::common::Status::success();
                             }));
                     require(edited.ok(), edited.ok() ? "" : edited.error());
                     require(edited.value()->number == pinned->number + 1, "new revision number");
                     require(pinned->step_ids() == steps, "pinned revision unchanged");
                     require(edited.value()->find("tag") != nullptr, "step inserted");

                     auto ran = memory->memorize(tenant("p1", "a1"),
                                                 conversation("My favorite color is blue."));
                     require(ran.ok(), "memorize on the edited pipeline");

                     auto history = memory->pipeline_history(pipeline::kMemorizeWorkflow);
                     require(history.ok() && history.value().size() == 2, "two revisions");
                     auto rolled = memory->rollback_pipeline(pipeline::kMemorizeWorkflow,
                                                             pinned->number);
                     require(rolled.ok(), "rollback succeeds");
                     require(rolled.value()->find("tag") == nullptr, "rollback restores steps");
                     require(memory->health_check().pipeline_revision.find("memorize@3") !=
                                 std::string::npos,
                             "revision token recorded");

                     auto bad = memory->remove_step(pipeline::kMemorizeWorkflow, "missing_step");
                     require(!bad.ok() && bad.kind() == ErrorKind::Validation,
                             "unknown target rejected");
                   }});

  tests.push_back({"service_in_flight_run_keeps_its_revision", [] {
                     std::atomic<bool> entered{false};
                     std::atomic<bool> released{false};
                     auto memory = make_service();
                     auto gated = memory->insert_step_before(
                         pipeline::kMemorizeWorkflow, "persist_index",
                         strata::testing::make_step(
                             "gate", {}, {"extra.gate"},
                             [&](pipeline::WorkflowState &, const pipeline::StepContext &) {
                               entered = true;
                               const auto deadline =
                                   std::chrono::steady_clock::now() + std::chrono::seconds(5);
                               while (!released.load() &&
                                      std::chrono::steady_clock::now() < deadline) {
                                 std::this_thread::sleep_for(std::chrono::milliseconds(1));
                               }
                               return strata::common::Status::success();
                             }));
                     require(gated.ok(), "gate inserted");

                     std::string run_id;
                     bool run_ok = false;
                     std::thread worker([&] {
                       auto stored = memory->memorize(tenant("p1", "a1"),
                                                      conversation("My favorite color is blue."));
                       run_ok = stored.ok();
                       if (stored.ok()) {
                         run_id = stored.value().run_id;
                       }
                     });
                     while (!entered.load()) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(1));
                     }
                     auto removed = memory->remove_step(pipeline::kMemorizeWorkflow, "gate");
                     released = true;
                     worker.join();

                     require(removed.ok(), "edit accepted while a run is in flight");
                     require(removed.value()->find("gate") == nullptr, "new revision drops the gate");
                     require(run_ok, "in-flight run completes");
                     auto log = memory->run_log(run_id);
                     require(log.ok(), "run logged");
                     require(log.value().revision == gated.value()->number,
                             "run pinned to the revision it started with");
                     require(std::any_of(log.value().steps.begin(), log.value().steps.end(),
                                         [](const auto &step) { return step.step_id == "gate"; }),
                             "old step sequence executed");
                     require(active_count(*memory, tenant("p1", "a1")) == 1, "fact persisted");
                   }});

  tests.push_back({"service_categories_are_listed_and_looked_up", [] {
                     auto memory = make_service();
                     const auto scope = tenant("p1", "a1");
                     auto stored = memory->memorize(scope, conversation("My favorite color is blue."));
                     require(stored.ok(), "memorize");

                     auto categories = memory->list_categories(scope);
                     require(categories.ok() && !categories.value().empty(), "categories listed");
                     const auto &rows = categories.value();
                     require(std::is_sorted(rows.begin(), rows.end(),
                                            [](const auto &lhs, const auto &rhs) {
                                              return lhs.name < rhs.name;
                                            }),
                             "sorted by name");

                     auto by_name = memory->get_category(scope, "Preferences");
                     require(by_name.ok(), "lookup by name");
                     require(by_name.value().name == "preferences", "canonical name");
                     require(!by_name.value().summary.empty(), "summary maintained");

                     auto by_id = memory->get_category(scope, by_name.value().id);
                     require(by_id.ok() && by_id.value().name == "preferences", "lookup by id");

                     auto missing = memory->get_category(scope, "hobbies");
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound, "not found");

                     auto bare = memory->list_categories(scope, false);
                     require(bare.ok() && bare.value().front().summary.empty(),
                             "summaries omitted on request");
                   }});

  tests.push_back({"service_patch_item_create_update_delete", [] {
                     auto memory = make_service();
                     const auto scope = tenant("p1", "a1");

                     auto created = memory->patch_item(
                         scope, service::ItemPatch{.action = service::PatchAction::Create,
                                                   .text = "Prefers aisle seats",
                                                   .memory_type = "profile"});
                     require(created.ok(), created.ok() ? "" : created.error());
                     require(created.value().version == 1, "first version");
                     require(!created.value().embedding.empty(), "embedded on create");

                     auto updated = memory->patch_item(
                         scope, service::ItemPatch{.action = service::PatchAction::Update,
                                                   .item_id = created.value().id,
                                                   .text = "Prefers window seats"});
                     require(updated.ok(), updated.ok() ? "" : updated.error());
                     require(updated.value().id != created.value().id, "new revision id");
                     require(updated.value().version == 2, "version incremented");
                     require(updated.value().lineage_id == created.value().lineage_id,
                             "lineage preserved");

                     auto old = memory->list_items(
                         scope, store::ItemFilter{.ids = {created.value().id}, .active_only = false});
                     require(old.ok() && old.value().size() == 1 && !old.value().front().active,
                             "old revision inactive");
                     require(old.value().front().superseded_by == updated.value().id,
                             "old revision points at successor");

                     auto stale = memory->patch_item(
                         scope, service::ItemPatch{.action = service::PatchAction::Update,
                                                   .item_id = created.value().id,
                                                   .text = "Prefers aisle seats again"});
                     require(!stale.ok() && stale.kind() == ErrorKind::NotFound,
                             "inactive revision cannot be edited");

                     auto deleted = memory->patch_item(
                         scope, service::ItemPatch{.action = service::PatchAction::Delete,
                                                   .item_id = updated.value().id});
                     require(deleted.ok() && !deleted.value().active, "delete deactivates");
                     require(active_count(*memory, scope) == 0, "no active items remain");

                     auto empty = memory->patch_item(
                         scope, service::ItemPatch{.action = service::PatchAction::Create,
                                                   .text = "  "});
                     require(!empty.ok() && empty.kind() == ErrorKind::Validation,
                             "empty text rejected");
                   }});

  tests.push_back({"service_evolve_deactivates_duplicates_and_records_diff", [] {
                     auto memory = make_service();
                     const auto scope = tenant("p1", "a1");
                     const service::ItemPatch create{.action = service::PatchAction::Create,
                                                     .text = "Prefers window seats",
                                                     .memory_type = "profile"};
                     require(memory->patch_item(scope, create).ok(), "first copy");
                     require(memory->patch_item(scope, create).ok(), "second copy");
                     require(active_count(*memory, scope) == 2, "duplicates active");

                     auto evolved = memory->evolve(scope);
                     require(evolved.ok(), evolved.ok() ? "" : evolved.error());
                     require(evolved.value().diff_summary.find("1 item_deactivated") !=
                                 std::string::npos,
                             "duplicate deactivated: " + evolved.value().diff_summary);
                     require(active_count(*memory, scope) == 1, "one copy remains");

                     auto diffs = memory->list_diffs(scope);
                     require(diffs.ok() && diffs.value().size() == 1, "diff recorded");
                     require(diffs.value().front().run_id == evolved.value().run_id,
                             "diff tied to its run");

                     auto quiet = memory->evolve(tenant("p9", "a9"));
                     require(quiet.ok(), "evolve on empty scope");
                     require(quiet.value().diff_summary == "no changes", "nothing to do");
                   }});

  tests.push_back({"service_purge_removes_one_tenant", [] {
                     auto memory = make_service();
                     require(memory->memorize(tenant("p1", "a1"),
                                              conversation("My favorite color is blue."))
                                 .ok(),
                             "memorize p1");
                     require(memory->memorize(tenant("p2", "a1"),
                                              conversation("My favorite color is green."))
                                 .ok(),
                             "memorize p2");

                     auto purged = memory->purge(tenant("p1", "a1"));
                     require(purged.ok(), "purge succeeds");
                     require(purged.value().items == 1 && purged.value().resources == 1,
                             "purge counts rows");
                     require(active_count(*memory, tenant("p1", "a1")) == 0, "p1 emptied");
                     require(active_count(*memory, tenant("p2", "a1")) == 1, "p2 untouched");

                     auto found = memory->retrieve(tenant("p1", "a1"),
                                                   query("what color do they like"));
                     require(found.ok() && found.value().items.empty(), "vectors purged too");
                   }});

  tests.push_back({"service_reindex_and_health_check", [] {
                     auto memory = make_service();
                     const auto scope = tenant("p1", "a1");
                     require(memory->memorize(scope, conversation("My favorite color is blue."))
                                 .ok(),
                             "memorize");
                     auto stats = memory->reindex(scope);
                     require(stats.ok(), stats.ok() ? "" : stats.error());
                     require(stats.value().items == 1, "item reindexed");
                     require(stats.value().categories >= 1, "categories reindexed");
                     require(stats.value().resources == 1, "resource reindexed");

                     const auto report = memory->health_check();
                     require(report.ok(), "store healthy");
                     require(report.vector_configured, "vector index configured");
                     require(report.runner == "inline", "runner reported");
                     require(report.capabilities.find("embedding") != std::string::npos,
                             "capabilities reported");
                     require(report.schema.find("project_id") != std::string::npos,
                             "schema reported");

                     auto deps = dependencies_for(strata::testing::mock_config(),
                                                  std::make_shared<store::InMemoryStore>());
                     deps.vector.reset();
                     auto plain = service::MemoryService::create(std::move(deps));
                     require(plain.ok(), "service without vectors");
                     auto unavailable = plain.value()->reindex(scope);
                     require(!unavailable.ok() &&
                                 unavailable.kind() == ErrorKind::CapabilityUnavailable,
                             "reindex needs a vector index");
                     auto fallback = plain.value()->retrieve(
                         scope::SelectorSpec{{"project_id", scope::FieldMatch::exact("p1")},
                                             {"agent_id", scope::FieldMatch::any_of({"a1", "a2"})}},
                         query("color"));
                     require(fallback.ok(), "retrieve without vectors");
                     require(fallback.value().mode == "category_only", "category-only mode");
                   }});

  tests.push_back({"service_run_logs_are_queryable", [] {
                     auto memory = make_service();
                     auto stored = memory->memorize(tenant("p1", "a1"),
                                                    conversation("My favorite color is blue."));
                     require(stored.ok(), "memorize");
                     auto log = memory->run_log(stored.value().run_id);
                     require(log.ok(), "run log stored");
                     require(log.value().workflow == "memorize", "workflow recorded");
                     require(log.value().status == store::RunStatus::Succeeded, "succeeded");
                     require(!log.value().steps.empty(), "step records kept");

                     auto recent = memory->recent_runs(5);
                     require(recent.ok() && !recent.value().empty(), "recent runs listed");

                     auto missing = memory->run_log("run_missing");
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound, "not found");
                   }});
}
