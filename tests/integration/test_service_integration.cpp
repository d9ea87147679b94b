#include "test_framework.hpp"

#include "strata/common/time.hpp"
#include "strata/service/memory_service.hpp"
#include "strata/store/factory.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

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

strata::config::Config durable_config(const strata::testing::TempWorkspace &workspace) {
  auto config = strata::testing::temp_config(workspace);
  config.runner.kind = "durable";
  config.runner.max_retries = 2;
  config.runner.backoff_ms = 1;
  config.runner.max_concurrency = 2;
  config.runner.checkpoint = true;
  return config;
}

std::unique_ptr<service::MemoryService> open_service(const strata::config::Config &config) {
  auto created = service::MemoryService::create(config);
  require(created.ok(), created.ok() ? "" : created.error());
  return std::move(created.value());
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

bool mentions(const pipeline::RetrieveResult &result, const std::string &word) {
  return std::any_of(result.items.begin(), result.items.end(), [&](const auto &scored) {
    return scored.item.text.find(word) != std::string::npos;
  });
}

} // namespace

void register_service_integration_tests(std::vector<strata::tests::TestCase> &tests) {
  using strata::tests::TestCase;

  tests.push_back({"integration_sqlite_durable_memorize_survives_restart", [] {
                     strata::testing::TempWorkspace workspace;
                     const auto config = durable_config(workspace);
                     std::string run_id;
                     {
                       auto memory = open_service(config);
                       require(memory->health_check().runner == "durable", "durable runner");
                       auto stored = memory->memorize(
                           tenant("p1", "a1"),
                           conversation("user: My favorite color is blue.\n"
                                        "assistant: Noted, blue it is."));
                       require(stored.ok(), stored.ok() ? "" : stored.error());
                       require(stored.value().items.size() == 1, "assistant turn ignored");
                       run_id = stored.value().run_id;
                     }

                     auto memory = open_service(config);
                     auto log = memory->run_log(run_id);
                     require(log.ok(), "run log persisted");
                     require(log.value().status == store::RunStatus::Succeeded, "run succeeded");

                     auto items = memory->list_items(tenant("p1", "a1"));
                     require(items.ok() && items.value().size() == 1, "item persisted");
                     require(!items.value().front().embedding.empty(), "embedding persisted");

                     auto stats = memory->reindex(tenant("p1", "a1"));
                     require(stats.ok() && stats.value().items == 1, "in-process index rebuilt");

                     auto found = memory->retrieve(tenant("p1", "a1"),
                                                   query("what color do they like"));
                     require(found.ok(), found.ok() ? "" : found.error());
                     require(mentions(found.value(), "blue"), "fact recalled after restart");

                     auto isolated = memory->retrieve(tenant("p2", "a1"),
                                                      query("what color do they like"));
                     require(isolated.ok() && isolated.value().items.empty(), "scope isolated");
                   }});

  tests.push_back({"integration_schema_locked_across_restarts", [] {
                     strata::testing::TempWorkspace workspace;
                     auto config = durable_config(workspace);
                     { auto memory = open_service(config); }

                     config.tenancy.fields = {"project_id:string", "agent_id:string",
                                              "user_id:string"};
                     auto refused = service::MemoryService::create(config);
                     require(!refused.ok(), "changed schema refused");
                     require(refused.kind() == ErrorKind::ScopeSchemaMismatch, "schema mismatch");
                   }});

  tests.push_back({"integration_memorize_resolves_blob_uri", [] {
                     strata::testing::TempWorkspace workspace;
                     workspace.create_file("resources/notes/profile.txt",
                                           "My favorite color is blue.\nI live in Lisbon.\n");
                     auto memory = open_service(durable_config(workspace));

                     pipeline::MemorizeRequest request;
                     request.uri = "notes/profile.txt";
                     request.modality = store::Modality::Document;
                     auto stored = memory->memorize(tenant("p1", "a1"), request);
                     require(stored.ok(), stored.ok() ? "" : stored.error());
                     require(stored.value().resource.uri == "notes/profile.txt", "uri kept");
                     require(stored.value().resource.content.find("Lisbon") != std::string::npos,
                             "content fetched from the blob store");
                     require(stored.value().items.size() == 2, "both facts extracted");

                     pipeline::MemorizeRequest escaping;
                     escaping.uri = "../outside.txt";
                     auto rejected = memory->memorize(tenant("p1", "a1"), escaping);
                     require(!rejected.ok(), "path outside the blob root refused");
                   }});

  tests.push_back({"integration_resume_pending_replays_running_checkpoint", [] {
                     strata::testing::TempWorkspace workspace;
                     const auto config = durable_config(workspace);
                     const std::string run_id = "run_interrupted";
                     { auto provisioned = open_service(config); }
                     {
                       auto metadata = strata::store::create_metadata_store(config);
                       require(metadata.ok(), "open store directly");
                       auto schema = scope::ScopeSchema::parse(config.tenancy.fields);
                       require(schema.ok(), "schema parses");
                       require(metadata.value()->provision(schema.value()).ok(), "tables ready");
                       store::Checkpoint checkpoint;
                       checkpoint.run_id = run_id;
                       checkpoint.workflow = "memorize";
                       checkpoint.revision = 1;
                       checkpoint.scope = scope::ScopeKey({{"project_id", "p1"}, {"agent_id", "a1"}});
                       checkpoint.completed_steps = {"ingest_resource"};
                       checkpoint.status = "running";
                       checkpoint.payload =
                           "{\"workflow\":\"memorize\",\"scope\":{\"project_id\":\"p1\","
                           "\"agent_id\":\"a1\"},\"uri\":\"\",\"content\":\"My favorite color is "
                           "blue.\",\"modality\":\"conversation\",\"memory_types\":[]}";
                       checkpoint.updated_at = strata::common::now_rfc3339();
                       require(metadata.value()->put_checkpoint(checkpoint).ok(),
                               "checkpoint written");
                     }

                     auto memory = open_service(config);
                     auto replayed = memory->resume_pending();
                     require(replayed.ok(), replayed.ok() ? "" : replayed.error());
                     require(replayed.value() == 1, "one run replayed");

                     auto items = memory->list_items(tenant("p1", "a1"));
                     require(items.ok() && items.value().size() == 1, "replayed run stored its item");

                     auto log = memory->run_log(run_id);
                     require(log.ok() && log.value().status == store::RunStatus::Succeeded,
                             "replay reuses the original run id");

                     auto again = memory->resume_pending();
                     require(again.ok() && again.value() == 0, "nothing left pending");
                   }});

  tests.push_back({"integration_concurrent_memorize_across_scopes", [] {
                     strata::testing::TempWorkspace workspace;
                     auto memory = open_service(durable_config(workspace));
                     std::atomic<int> failures{0};
                     std::vector<std::thread> workers;
                     for (int i = 0; i < 4; ++i) {
                       workers.emplace_back([&, i] {
                         const auto scope = tenant("p1", "a" + std::to_string(i));
                         for (int round = 0; round < 3; ++round) {
                           auto stored = memory->memorize(
                               scope, conversation("My favorite color is blue.\nI live in Lisbon."));
                           if (!stored.ok()) {
                             ++failures;
                           }
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(failures.load() == 0, "every memorize succeeded");
                     for (int i = 0; i < 4; ++i) {
                       auto items = memory->list_items(tenant("p1", "a" + std::to_string(i)));
                       require(items.ok() && items.value().size() == 2,
                               "identical content stored once per scope");
                     }
                   }});

  tests.push_back({"integration_evolve_then_cross_scope_retrieve", [] {
                     strata::testing::TempWorkspace workspace;
                     auto memory = open_service(durable_config(workspace));
                     require(memory->memorize(tenant("p1", "a1"),
                                              conversation("My favorite color is blue."))
                                 .ok(),
                             "memorize a1");
                     require(memory->memorize(tenant("p1", "a2"),
                                              conversation("My favorite color is green."))
                                 .ok(),
                             "memorize a2");

                     pipeline::EvolveRequest request;
                     request.force = true;
                     auto evolved = memory->evolve(tenant("p1", "a1"), request);
                     require(evolved.ok(), evolved.ok() ? "" : evolved.error());
                     auto diffs = memory->list_diffs(tenant("p1", "a1"));
                     require(diffs.ok() && diffs.value().size() == 1, "diff persisted");

                     auto found = memory->retrieve(
                         scope::SelectorSpec{{"project_id", scope::FieldMatch::exact("p1")},
                                             {"agent_id", scope::FieldMatch::any_of({"a1", "a2"})}},
                         query("what color do they like"));
                     require(found.ok(), found.ok() ? "" : found.error());
                     require(mentions(found.value(), "blue") && mentions(found.value(), "green"),
                             "both agents recalled");
                   }});
}
