#include "test_framework.hpp"

#include "strata/common/time.hpp"
#include "strata/pipeline/builtin_steps.hpp"
#include "strata/pipeline/hybrid_ranker.hpp"
#include "strata/pipeline/lexical.hpp"
#include "strata/pipeline/manager.hpp"
#include "strata/pipeline/taxonomy.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace pl = strata::pipeline;
using strata::capability::Capability;
using strata::capability::CapabilitySet;

CapabilitySet full_capabilities() {
  return CapabilitySet{Capability::Llm, Capability::Embedding, Capability::VectorQuery,
                       Capability::StoreWrite, Capability::Blob};
}

pl::StepHandler noop_handler() {
  return [](pl::WorkflowState &, const pl::StepContext &) {
    return strata::common::Status::success();
  };
}

std::unique_ptr<pl::PipelineManager> memorize_manager() {
  auto manager = std::make_unique<pl::PipelineManager>(full_capabilities());
  const auto status = manager->register_pipeline(pl::kMemorizeWorkflow, pl::memorize_steps(),
                                                 pl::memorize_inputs());
  strata::tests::require(status.ok(), status.error());
  return manager;
}

strata::store::MemoryItem item(const std::string &id, const std::string &text) {
  strata::store::MemoryItem out;
  out.id = id;
  out.text = text;
  out.created_at = strata::common::now_rfc3339();
  out.updated_at = out.created_at;
  return out;
}

} // namespace

void register_pipeline_tests(std::vector<strata::tests::TestCase> &tests) {
  using strata::tests::require;
  using strata::common::ErrorKind;

  tests.push_back({"pipeline_builtin_workflows_register", [] {
                     pl::PipelineManager manager(full_capabilities());
                     require(manager.register_pipeline(pl::kMemorizeWorkflow, pl::memorize_steps(),
                                                       pl::memorize_inputs()).ok(),
                             "memorize register");
                     require(manager.register_pipeline(pl::kRetrieveWorkflow, pl::retrieve_steps(),
                                                       pl::retrieve_inputs()).ok(),
                             "retrieve register");
                     require(manager.register_pipeline(pl::kEvolveWorkflow, pl::evolve_steps(),
                                                       pl::evolve_inputs()).ok(),
                             "evolve register");
                     require(manager.revision_token() == "evolve@1;memorize@1;retrieve@1",
                             manager.revision_token());

                     const auto built = manager.build(pl::kMemorizeWorkflow);
                     require(built.ok(), built.error());
                     const auto ids = built.value()->step_ids();
                     const std::vector<std::string> expected = {
                         "ingest_resource",   "preprocess",       "extract_items", "dedupe_items",
                         "assign_categories", "update_intention", "persist_index"};
                     require(ids == expected, "memorize step order");

                     require(!manager.register_pipeline(pl::kMemorizeWorkflow, pl::memorize_steps(),
                                                        pl::memorize_inputs()).ok(),
                             "double registration accepted");
                     require(manager.build("summarize").kind() == ErrorKind::NotFound,
                             "unknown workflow");
                   }});

  tests.push_back({"pipeline_config_step_publishes_new_revision", [] {
                     auto owned = memorize_manager();
                     auto &manager = *owned;
                     const auto before = manager.current(pl::kMemorizeWorkflow).value();
                     const auto edited = manager.config_step(pl::kMemorizeWorkflow,
                                                             "assign_categories",
                                                             {{"threshold", "0.4"}});
                     require(edited.ok(), edited.error());
                     require(edited.value()->number == 2, "revision number");
                     require(edited.value()->find("assign_categories")->config.at("threshold") ==
                                 "0.4",
                             "override stored");
                     require(before->find("assign_categories")->config.empty(),
                             "published revision mutated");

                     const auto unknown_key = manager.config_step(pl::kMemorizeWorkflow,
                                                                  "assign_categories",
                                                                  {{"colour", "blue"}});
                     require(!unknown_key.ok() && unknown_key.kind() == ErrorKind::Validation,
                             "unknown config key accepted");
                     const auto unknown_step =
                         manager.config_step(pl::kMemorizeWorkflow, "nope", {{"a", "b"}});
                     require(!unknown_step.ok() && unknown_step.kind() == ErrorKind::Validation,
                             "unknown step accepted");
                     require(manager.current(pl::kMemorizeWorkflow).value()->number == 2,
                             "failed edits must not publish");
                   }});

  tests.push_back({"pipeline_insert_validates_data_flow", [] {
                     auto owned = memorize_manager();
                     auto &manager = *owned;
                     const auto tagged = manager.insert_after(
                         pl::kMemorizeWorkflow, "extract_items",
                         strata::testing::make_step("tag", {"candidates"}, {"extra.tag"},
                                                    noop_handler()));
                     require(tagged.ok(), tagged.error());
                     require(tagged.value()->step_ids()[3] == "tag", "inserted after target");

                     const auto consumer = manager.insert_before(
                         pl::kMemorizeWorkflow, "persist_index",
                         strata::testing::make_step("audit", {"extra.tag"}, {}, noop_handler()));
                     require(consumer.ok(), consumer.error());

                     const auto dangling = manager.insert_before(
                         pl::kMemorizeWorkflow, "ingest_resource",
                         strata::testing::make_step("early", {"extra.tag"}, {}, noop_handler()));
                     require(!dangling.ok() && dangling.kind() == ErrorKind::Validation,
                             "input produced later accepted");

                     const auto duplicate = manager.insert_after(
                         pl::kMemorizeWorkflow, "preprocess",
                         strata::testing::make_step("tag", {}, {}, noop_handler()));
                     require(!duplicate.ok(), "duplicate id accepted");

                     const auto unknown_output = manager.insert_after(
                         pl::kMemorizeWorkflow, "preprocess",
                         strata::testing::make_step("odd", {}, {"mystery"}, noop_handler()));
                     require(!unknown_output.ok(), "unknown output field accepted");

                     const auto removed =
                         manager.remove_step(pl::kMemorizeWorkflow, "extract_items");
                     require(!removed.ok() && removed.kind() == ErrorKind::Validation,
                             "removing a producer must break validation");
                   }});

  tests.push_back({"pipeline_capability_gaps", [] {
                     pl::PipelineManager manager(CapabilitySet{Capability::StoreWrite});
                     require(manager.register_pipeline(pl::kMemorizeWorkflow, pl::memorize_steps(),
                                                       pl::memorize_inputs()).ok(),
                             "registration is structural only");
                     const auto built = manager.build(pl::kMemorizeWorkflow);
                     require(!built.ok() && built.kind() == ErrorKind::CapabilityUnavailable,
                             "extraction without llm");

                     pl::PipelineManager retrieve(CapabilitySet{Capability::StoreWrite});
                     require(retrieve.register_pipeline(pl::kRetrieveWorkflow, pl::retrieve_steps(),
                                                        pl::retrieve_inputs()).ok(),
                             "retrieve register");
                     require(retrieve.build(pl::kRetrieveWorkflow).ok(),
                             "retrieve has only optional capabilities");
                     auto step = strata::testing::make_step("judge", {"item_hits"}, {},
                                                            noop_handler());
                     step.capabilities = std::vector<Capability>{Capability::Llm};
                     const auto edited =
                         retrieve.insert_after(pl::kRetrieveWorkflow, "recall_items", step);
                     require(!edited.ok() && edited.kind() == ErrorKind::CapabilityUnavailable,
                             "llm step accepted without llm");
                   }});

  tests.push_back({"pipeline_replace_rollback_history", [] {
                     auto owned = memorize_manager();
                     auto &manager = *owned;
                     auto replacement = strata::testing::make_step(
                         "update_intention", {"scope", "merge"}, {"intention"}, noop_handler());
                     const auto replaced = manager.replace_step(pl::kMemorizeWorkflow,
                                                                "update_intention", replacement);
                     require(replaced.ok(), replaced.error());
                     require(replaced.value()->find("update_intention")->role ==
                                 pl::Role::Custom,
                             "replacement installed");

                     const auto rolled = manager.rollback(pl::kMemorizeWorkflow, 1);
                     require(rolled.ok(), rolled.error());
                     require(rolled.value()->number == 3, "rollback appends a revision");
                     require(rolled.value()->find("update_intention")->role == pl::Role::Routing,
                             "rollback restores steps");
                     require(rolled.value()->change == "rollback:1", rolled.value()->change);

                     require(!manager.rollback(pl::kMemorizeWorkflow, 9).ok(),
                             "unknown revision accepted");
                     const auto history = manager.history(pl::kMemorizeWorkflow);
                     require(history.ok() && history.value().size() == 3, "history length");
                     require(manager.revision_token() == "memorize@3", manager.revision_token());
                   }});

  tests.push_back({"pipeline_lexical_query_parsing", [] {
                     const auto query = pl::parse_lexical_query(
                         R"(+blue -red "favorite color" type:profile category:Preferences tea)");
                     require(query.must_terms.contains("blue"), "must term");
                     require(query.exclude_terms.contains("red"), "exclude term");
                     require(query.should_terms.contains("tea"), "should term");
                     require(query.phrases.size() == 1 &&
                                 query.phrases[0].first == "favorite color",
                             "phrase");
                     require(query.field_values("type", pl::TermSign::Should) ==
                                 std::vector<std::string>{"profile"},
                             "type filter");
                     require(query.field_values("category", pl::TermSign::Should) ==
                                 std::vector<std::string>{"preferences"},
                             "category filter lowercased");
                     require(query.plain_text() == "blue favorite color tea", query.plain_text());

                     const auto unknown_field = pl::parse_lexical_query("foo:bar");
                     require(unknown_field.fields.empty(), "unknown field kept as a filter");
                     require(unknown_field.should_terms.contains("bar"), "unknown field as text");
                   }});

  tests.push_back({"pipeline_bm25_applies_constraints", [] {
                     const std::vector<pl::LexicalDoc> docs = {
                         {"d1", "My favorite color is blue", {{"type", {"profile"}}}},
                         {"d2", "Blue whales are large animals", {{"type", {"knowledge"}}}},
                         {"d3", "Red is my favorite color", {{"type", {"profile"}}}},
                     };
                     const auto must = pl::bm25_rank(pl::parse_lexical_query("+blue color"), docs, 10);
                     require(must.size() == 2, "two documents contain blue");
                     require(must[0].first == "d1", "d1 matches both terms");

                     const auto excluded =
                         pl::bm25_rank(pl::parse_lexical_query("-red color"), docs, 10);
                     require(excluded.size() == 1 && excluded[0].first == "d1", "red excluded");

                     const auto typed =
                         pl::bm25_rank(pl::parse_lexical_query("+type:knowledge"), docs, 10);
                     require(typed.size() == 1 && typed[0].first == "d2", "type filter");

                     require(pl::bm25_rank(pl::parse_lexical_query("the"), docs, 10).empty(),
                             "stopword-only query scores nothing");
                   }});

  tests.push_back({"pipeline_rrf_fuse_prefers_agreement", [] {
                     const auto fused = pl::rrf_fuse({{{"a", 3.0}, {"b", 2.0}, {"c", 1.0}},
                                                      {{"b", 0.9}, {"c", 0.8}}},
                                                     10);
                     require(fused.size() == 3, "three ids");
                     require(fused[0].first == "b" && fused[1].first == "c" &&
                                 fused[2].first == "a",
                             "fused order");
                     require(pl::rrf_fuse({{{"a", 1.0}, {"b", 1.0}}}, 1).size() == 1, "limit");
                   }});

  tests.push_back({"pipeline_hybrid_ranker_blends_signals", [] {
                     const std::unordered_map<std::string, strata::store::MemoryItem> entries = {
                         {"i1", item("i1", "one")},
                         {"i2", item("i2", "two")},
                         {"i3", item("i3", "three")},
                     };
                     pl::HybridRanker ranker(0.6, 0.3, 0.1, 30.0);
                     std::vector<strata::vector::VectorHit> hits(2);
                     hits[0].id = "i1";
                     hits[0].score = 0.9F;
                     hits[1].id = "i2";
                     hits[1].score = 0.2F;
                     const auto ranked = ranker.rank(hits, {{"i2", 2.0}}, entries, 10);
                     require(ranked.size() == 2, "entries without signal are dropped");
                     require(ranked[0].item.id == "i1", "vector evidence should win");
                     require(ranked[1].keyword_score == 1.0, "keyword normalized");

                     const auto keyword_only = ranker.rank({}, {{"i3", 1.0}}, entries, 10);
                     require(keyword_only.size() == 1 && keyword_only[0].item.id == "i3",
                             "keyword-only ranking");
                     require(keyword_only[0].score >= 0.9, "keyword carries the vector weight");
                   }});

  tests.push_back({"pipeline_category_definitions", [] {
                     const auto definitions = pl::parse_category_definitions(
                         {"Preferences: likes and dislikes", "work_life", "preferences: dup", " "});
                     require(definitions.size() == 2, "duplicates and blanks dropped");
                     require(definitions[0].name == "preferences", definitions[0].name);
                     require(definitions[0].description == "likes and dislikes", "description");
                     require(definitions[1].description.empty(), "bare name");

                     strata::store::MemoryCategory category;
                     category.name = "work_life";
                     category.description = "jobs";
                     require(pl::category_embedding_text(category) == "work life: jobs",
                             pl::category_embedding_text(category));
                   }});

  tests.push_back({"pipeline_fold_intention", [] {
                     const strata::scope::ScopeKey scope({{"project_id", "p1"}, {"agent_id", "a1"}});
                     const std::vector<strata::store::MemoryItem> items = {
                         item("g", "I want to run a marathon"),
                         item("c", "I must avoid gluten"),
                         item("n", "My favorite color is blue"),
                     };
                     const auto folded = pl::fold_intention(std::nullopt, scope, items, 8);
                     require(folded.has_value(), "intention expected");
                     require(folded->goals.size() == 1 && folded->constraints.size() == 1,
                             "one goal and one constraint");
                     require(folded->version == 1, "first version");
                     require(folded->source_items.size() == 2, "sources");
                     require(folded->summary.find("Goals:") == 0, folded->summary);

                     require(!pl::fold_intention(folded, scope, items, 8).has_value(),
                             "refolding the same items changes nothing");
                     require(!pl::is_goal_text("My favorite color is blue"), "not a goal");
                   }});

  tests.push_back({"pipeline_known_fields", [] {
                     require(pl::is_known_field("merge"), "builtin field");
                     require(pl::is_known_field("extra.flag"), "extra field");
                     require(!pl::is_known_field("extra."), "bare extra prefix");
                     require(!pl::is_known_field("mystery"), "unknown field");
                   }});
}
