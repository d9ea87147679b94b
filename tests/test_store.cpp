#include "test_framework.hpp"

#include "strata/common/hash.hpp"
#include "strata/common/time.hpp"
#include "strata/scope/scope.hpp"
#include "strata/store/memory_store.hpp"
#include "strata/store/sqlite_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <functional>
#include <memory>

namespace {

namespace store = strata::store;
namespace scope = strata::scope;
using strata::tests::require;

const scope::ScopeSchema &schema() {
  static const scope::ScopeSchema parsed =
      scope::ScopeSchema::parse("project_id:string, agent_id:string").value();
  return parsed;
}

scope::ScopeKey key(const std::string &project, const std::string &agent) {
  return scope::ScopeKey({{"project_id", project}, {"agent_id", agent}});
}

store::Resource make_resource(const scope::ScopeKey &scope, const std::string &id,
                              const std::string &content) {
  store::Resource resource;
  resource.id = id;
  resource.scope = scope;
  resource.uri = "inline:" + id;
  resource.content = content;
  resource.modality = store::Modality::Conversation;
  resource.content_hash = strata::common::sha256_hex(content);
  resource.created_at = strata::common::now_rfc3339();
  resource.segments.push_back(store::Segment{.offset = 0, .length = content.size(), .speaker = "user"});
  return resource;
}

store::MemoryItem make_item(const scope::ScopeKey &scope, const std::string &id,
                            const std::string &resource_id, const std::string &text) {
  store::MemoryItem item;
  item.id = id;
  item.scope = scope;
  item.resource_id = resource_id;
  item.lineage_id = id;
  item.memory_type = "profile";
  item.text = text;
  item.subject = "favorite color";
  item.content_hash = store::item_content_hash(item.memory_type, text);
  item.evidence = store::Evidence{.offset = 0, .length = text.size(), .page = 2};
  item.confidence = 0.8;
  item.created_at = strata::common::now_rfc3339();
  item.updated_at = item.created_at;
  item.embedding = {0.5F, 0.25F, 0.125F};
  return item;
}

store::MemoryCategory make_category(const scope::ScopeKey &scope, const std::string &id,
                                    const std::string &name) {
  store::MemoryCategory category;
  category.id = id;
  category.scope = scope;
  category.name = name;
  category.description = "User preferences";
  category.summary = "likes blue";
  category.anchors = {"mem_1"};
  category.created_at = strata::common::now_rfc3339();
  category.updated_at = category.created_at;
  return category;
}

void seed(store::IMetadataStore &db, const scope::ScopeKey &scope, const std::string &suffix) {
  store::WriteBatch batch;
  batch.put_resource(make_resource(scope, "res_" + suffix, "My favorite color is blue."));
  batch.put_item(make_item(scope, "mem_" + suffix, "res_" + suffix, "My favorite color is blue"));
  batch.put_category(make_category(scope, "cat_" + suffix, "preferences"));
  batch.put_link(store::CategoryItem{.scope = scope,
                                     .category_id = "cat_" + suffix,
                                     .item_id = "mem_" + suffix,
                                     .created_at = strata::common::now_rfc3339()});
  const auto status = db.commit(batch);
  require(status.ok(), "seed commit failed: " + status.error());
}

using StoreFactory = std::function<std::shared_ptr<store::IMetadataStore>()>;

void add_backend_tests(std::vector<strata::tests::TestCase> &tests, const std::string &label,
                       const StoreFactory &factory) {
  tests.push_back({"store_" + label + "_commit_and_read_back", [factory] {
                     auto db = factory();
                     const auto p1 = key("p1", "a1");
                     seed(*db, p1, "1");

                     const auto resource = db->get_resource(p1, "res_1");
                     require(resource.ok() && resource.value().has_value(), "resource missing");
                     require(resource.value()->segments.size() == 1, "segments lost");
                     require(resource.value()->segments[0].speaker == "user", "speaker lost");

                     const auto item = db->get_item(p1, "mem_1");
                     require(item.ok() && item.value().has_value(), "item missing");
                     require(item.value()->subject == "favorite color", "subject lost");
                     require(item.value()->evidence.page == 2, "evidence page lost");
                     require(item.value()->embedding.size() == 3, "embedding lost");
                     require(item.value()->scope == p1, "scope lost");

                     const auto category = db->get_category(p1, "cat_1");
                     require(category.ok() && category.value().has_value(), "category missing");
                     require(category.value()->anchors.size() == 1, "anchors lost");

                     const auto links = db->list_links(scope::ScopeSelector::for_key(p1),
                                                       store::LinkFilter{.category_ids = {"cat_1"}});
                     require(links.ok() && links.value().size() == 1, "link missing");
                   }});

  tests.push_back({"store_" + label + "_scope_isolation", [factory] {
                     auto db = factory();
                     const auto p1 = key("p1", "a1");
                     const auto p2 = key("p2", "a1");
                     seed(*db, p1, "1");
                     seed(*db, p2, "2");

                     const auto only_p1 =
                         db->list_items(scope::ScopeSelector::for_key(p1), store::ItemFilter{});
                     require(only_p1.ok() && only_p1.value().size() == 1, "expected one item");
                     require(only_p1.value()[0].id == "mem_1", "leaked another scope's item");

                     const auto wrong_scope = db->get_item(p2, "mem_1");
                     require(wrong_scope.ok() && !wrong_scope.value().has_value(),
                             "item readable from another scope");

                     const scope::ScopeSelector both({{"project_id", scope::FieldMatch::any_of({"p1", "p2"})},
                                                      {"agent_id", scope::FieldMatch::exact("a1")}});
                     const auto union_items = db->list_items(both, store::ItemFilter{});
                     require(union_items.ok() && union_items.value().size() == 2,
                             "selector union should see both scopes");
                   }});

  tests.push_back({"store_" + label + "_item_filters", [factory] {
                     auto db = factory();
                     const auto p1 = key("p1", "a1");
                     seed(*db, p1, "1");
                     auto retired = make_item(p1, "mem_old", "res_1", "My favorite color is red");
                     retired.active = false;
                     retired.superseded_by = "mem_1";
                     store::WriteBatch batch;
                     batch.put_item(retired);
                     require(db->commit(batch).ok(), "commit failed");

                     const auto selector = scope::ScopeSelector::for_key(p1);
                     const auto active = db->list_items(selector, store::ItemFilter{});
                     require(active.ok() && active.value().size() == 1, "inactive item listed");
                     const auto all =
                         db->list_items(selector, store::ItemFilter{.active_only = false});
                     require(all.ok() && all.value().size() == 2, "all items expected");

                     const auto by_hash = db->list_items(
                         selector, store::ItemFilter{.content_hash = store::item_content_hash(
                                                         "profile", "My favorite color is blue")});
                     require(by_hash.ok() && by_hash.value().size() == 1, "hash filter");
                     const auto by_subject = db->list_items(
                         selector, store::ItemFilter{.active_only = false, .subject = "favorite color"});
                     require(by_subject.ok() && by_subject.value().size() == 2, "subject filter");
                     const auto by_term =
                         db->list_items(selector, store::ItemFilter{.terms = {"BLUE"}});
                     require(by_term.ok() && by_term.value().size() == 1, "term filter");
                     const auto old = db->get_item(p1, "mem_old");
                     require(old.value()->superseded_by == std::optional<std::string>("mem_1"),
                             "superseded_by lost");
                   }});

  tests.push_back({"store_" + label + "_batch_is_atomic", [factory] {
                     auto db = factory();
                     const auto p1 = key("p1", "a1");
                     store::WriteBatch batch;
                     batch.put_resource(make_resource(p1, "res_x", "text"));
                     batch.put_item(make_item(p1, "mem_x", "res_missing", "dangling item"));
                     const auto status = db->commit(batch);
                     require(!status.ok(), "dangling reference committed");
                     const auto resource = db->get_resource(p1, "res_x");
                     require(resource.ok() && !resource.value().has_value(),
                             "partial batch was applied");
                   }});

  tests.push_back({"store_" + label + "_rejects_mixed_scope_batch", [factory] {
                     auto db = factory();
                     store::WriteBatch batch;
                     batch.put_resource(make_resource(key("p1", "a1"), "res_a", "a"));
                     batch.put_resource(make_resource(key("p2", "a1"), "res_b", "b"));
                     require(!db->commit(batch).ok(), "mixed-scope batch committed");
                   }});

  tests.push_back({"store_" + label + "_cross_scope_link_rejected", [factory] {
                     auto db = factory();
                     const auto p1 = key("p1", "a1");
                     const auto p2 = key("p2", "a1");
                     seed(*db, p1, "1");
                     seed(*db, p2, "2");
                     store::WriteBatch batch;
                     batch.put_link(store::CategoryItem{
                         .scope = p1, .category_id = "cat_1", .item_id = "mem_2", .created_at = ""});
                     require(!db->commit(batch).ok(), "link to another scope's item committed");
                   }});

  tests.push_back({"store_" + label + "_intention_and_purge", [factory] {
                     auto db = factory();
                     const auto p1 = key("p1", "a1");
                     const auto p2 = key("p2", "a1");
                     seed(*db, p1, "1");
                     seed(*db, p2, "2");
                     store::WriteBatch batch;
                     batch.put_intention(store::Intention{.scope = p1,
                                                          .goals = {"learn rust"},
                                                          .constraints = {},
                                                          .summary = "Goals: learn rust.",
                                                          .version = 1,
                                                          .source_items = {"mem_1"},
                                                          .updated_at = ""});
                     require(db->commit(batch).ok(), "intention commit failed");
                     const auto intention = db->get_intention(p1);
                     require(intention.ok() && intention.value().has_value(), "intention missing");
                     require(intention.value()->goals.size() == 1, "goals lost");

                     const auto purged = db->purge_scope(p1);
                     require(purged.ok(), purged.error());
                     require(purged.value().items == 1 && purged.value().resources == 1,
                             "purge counts");
                     require(!db->get_item(p1, "mem_1").value().has_value(), "item survived purge");
                     require(!db->get_intention(p1).value().has_value(), "intention survived purge");
                     require(db->get_item(p2, "mem_2").value().has_value(),
                             "purge touched another scope");
                   }});

  tests.push_back({"store_" + label + "_run_logs_diffs_checkpoints", [factory] {
                     auto db = factory();
                     const auto p1 = key("p1", "a1");
                     store::RunLog log;
                     log.run_id = "run_1";
                     log.workflow = "memorize";
                     log.revision = 3;
                     log.scope = p1;
                     log.status = store::RunStatus::Failed;
                     log.steps.push_back(store::StepRecord{.step_id = "ingest_resource",
                                                           .attempts = 2,
                                                           .duration_ms = 4,
                                                           .status = "failed",
                                                           .error = "boom"});
                     log.error = strata::common::Error{.kind = strata::common::ErrorKind::TransientStore,
                                                       .message = "locked"};
                     log.started_at = strata::common::now_rfc3339();
                     require(db->put_run_log(log).ok(), "put_run_log failed");
                     const auto loaded = db->get_run_log("run_1");
                     require(loaded.ok() && loaded.value().has_value(), "run log missing");
                     require(loaded.value()->revision == 3, "revision lost");
                     require(loaded.value()->steps.size() == 1 &&
                                 loaded.value()->steps[0].attempts == 2,
                             "step records lost");
                     require(loaded.value()->error.has_value() &&
                                 loaded.value()->error->kind ==
                                     strata::common::ErrorKind::TransientStore,
                             "error kind lost");
                     require(db->list_run_logs(10).value().size() == 1, "list_run_logs");

                     seed(*db, p1, "1");
                     store::WriteBatch batch;
                     batch.put_diff(store::DiffRecord{
                         .id = "diff_1",
                         .run_id = "run_2",
                         .scope = p1,
                         .summary = "1 item_revised",
                         .changes = {store::DiffChange{
                             .kind = "item_revised", .target_id = "mem_1", .detail = "decay"}},
                         .created_at = strata::common::now_rfc3339()});
                     require(db->commit(batch).ok(), "diff commit failed");
                     const auto diffs = db->list_diffs(p1, 10);
                     require(diffs.ok() && diffs.value().size() == 1, "diff missing");
                     require(diffs.value()[0].changes.size() == 1, "diff changes lost");

                     store::Checkpoint checkpoint;
                     checkpoint.run_id = "run_3";
                     checkpoint.workflow = "memorize";
                     checkpoint.scope = p1;
                     checkpoint.completed_steps = {"ingest_resource"};
                     checkpoint.payload = R"({"workflow":"memorize"})";
                     require(db->put_checkpoint(checkpoint).ok(), "put_checkpoint failed");
                     const auto running = db->list_checkpoints("running");
                     require(running.ok() && running.value().size() == 1, "running checkpoint");
                     require(running.value()[0].payload == checkpoint.payload, "payload lost");
                     require(db->delete_checkpoint("run_3").ok(), "delete_checkpoint failed");
                     require(!db->get_checkpoint("run_3").value().has_value(),
                             "checkpoint survived delete");
                   }});
}

} // namespace

void register_store_tests(std::vector<strata::tests::TestCase> &tests) {
  add_backend_tests(tests, "memory", [] {
    auto db = std::make_shared<store::InMemoryStore>();
    require(db->provision(schema()).ok(), "memory provision failed");
    return std::shared_ptr<store::IMetadataStore>(db);
  });

  add_backend_tests(tests, "sqlite", [] {
    // The workspace outlives the store through the deleter.
    auto workspace = std::make_shared<strata::testing::TempWorkspace>();
    auto *raw = new store::SqliteStore(workspace->path() / "store.db", 1'000);
    std::shared_ptr<store::IMetadataStore> db(raw, [workspace](store::IMetadataStore *ptr) {
      delete ptr;
    });
    require(raw->open().ok(), "sqlite open failed");
    require(db->provision(schema()).ok(), "sqlite provision failed");
    return db;
  });

  tests.push_back({"store_item_content_hash_normalizes", [] {
                     const auto a = store::item_content_hash("profile", "My  favorite color is BLUE");
                     const auto b = store::item_content_hash("profile", "my favorite color is blue");
                     const auto c = store::item_content_hash("event", "my favorite color is blue");
                     require(a.size() == 16, "hash prefix length");
                     require(a == b, "normalization differs");
                     require(a != c, "type must affect the hash");
                   }});

  tests.push_back({"store_memory_run_logs_are_capped", [] {
                     store::InMemoryStore db(3);
                     for (int i = 1; i <= 5; ++i) {
                       store::RunLog log;
                       log.run_id = "run_" + std::to_string(i);
                       log.workflow = "memorize";
                       log.status = store::RunStatus::Succeeded;
                       require(db.put_run_log(log).ok(), "put_run_log failed");
                     }
                     store::RunLog again;
                     again.run_id = "run_5";
                     again.status = store::RunStatus::Failed;
                     require(db.put_run_log(again).ok(), "rewrite failed");

                     const auto recent = db.list_run_logs(0);
                     require(recent.ok() && recent.value().size() == 3, "oldest logs dropped");
                     require(recent.value().front().run_id == "run_5", "newest first");
                     require(recent.value().front().status == store::RunStatus::Failed,
                             "rewrite replaces in place");
                     require(!db.get_run_log("run_2").value().has_value(), "evicted log gone");
                     require(db.get_run_log("run_3").value().has_value(), "retained log kept");
                   }});

  tests.push_back({"store_sqlite_persists_across_reopen", [] {
                     strata::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "persist.db";
                     {
                       store::SqliteStore db(path, 1'000);
                       require(db.open().ok(), "open failed");
                       require(db.provision(schema()).ok(), "provision failed");
                       seed(db, key("p1", "a1"), "1");
                     }
                     store::SqliteStore reopened(path, 1'000);
                     require(reopened.open().ok(), "reopen failed");
                     require(reopened.provision(schema()).ok(), "re-provision failed");
                     const auto item = reopened.get_item(key("p1", "a1"), "mem_1");
                     require(item.ok() && item.value().has_value(), "item not persisted");
                   }});
}
