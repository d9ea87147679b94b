#include "test_framework.hpp"

#include "strata/capability/blob_store.hpp"
#include "strata/capability/capability.hpp"
#include "strata/capability/embedder_local.hpp"
#include "strata/capability/embedder_openai.hpp"
#include "strata/capability/extractor_openai.hpp"
#include "strata/capability/extractor_rule.hpp"
#include "strata/capability/http_client.hpp"
#include "strata/common/json_util.hpp"
#include "strata/vector/vector_index.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace cap = strata::capability;

std::string chat_reply(const std::string &content_json) {
  return R"({"choices":[{"index":0,"message":{"role":"assistant","content":)" +
         strata::common::json_quote(content_json) + "}}]}";
}

} // namespace

void register_capability_tests(std::vector<strata::tests::TestCase> &tests) {
  using strata::tests::require;
  using strata::common::ErrorKind;

  tests.push_back({"capability_set_describe_and_parse", [] {
                     cap::CapabilitySet set{cap::Capability::Llm, cap::Capability::StoreWrite};
                     require(set.has(cap::Capability::Llm), "llm present");
                     require(!set.has(cap::Capability::Embedding), "embedding absent");
                     set.add(cap::Capability::Embedding);
                     require(set.has(cap::Capability::Embedding), "add failed");
                     require(!set.describe().empty(), "describe empty");
                     const auto parsed = cap::capability_from_string("vector_query");
                     require(parsed.ok() && parsed.value() == cap::Capability::VectorQuery,
                             "vector_query parse");
                     require(!cap::capability_from_string("teleport").ok(), "unknown accepted");
                   }});

  tests.push_back({"capability_rule_extractor_first_person_facts", [] {
                     cap::RuleExtractor extractor;
                     const auto facts = extractor.extract(cap::ExtractionRequest{
                         .text = "user: My favorite color is blue.\n"
                                 "assistant: I will remember that your favorite color is blue.\n"
                                 "user: What is the weather like?",
                         .modality = strata::store::Modality::Conversation,
                         .memory_types = {"profile", "event", "knowledge"},
                         .segments = {},
                         .categories = {}});
                     require(facts.ok(), facts.error());
                     require(facts.value().size() == 1, "expected exactly one user fact");
                     const auto &fact = facts.value()[0];
                     require(fact.text == "My favorite color is blue", fact.text);
                     require(fact.memory_type == "profile", fact.memory_type);
                     require(fact.subject == "favorite color", fact.subject);
                     require(fact.evidence.offset == 6, "evidence offset should skip speaker");
                     require(!fact.category_hints.empty() &&
                                 fact.category_hints.front() == "preferences",
                             "preferences hint expected");
                   }});

  tests.push_back({"capability_rule_extractor_confidence_and_types", [] {
                     require(cap::classify_memory_type("I went hiking yesterday") == "event",
                             "event classification");
                     require(cap::classify_memory_type("I usually run every morning") == "behavior",
                             "behavior classification");
                     require(cap::classify_memory_type("Water boils at 100 degrees") == "knowledge",
                             "knowledge classification");
                     require(cap::extract_subject("I live in Oslo") == "residence", "residence");
                     require(cap::extract_subject("I'm 34 years old") == "age", "age");

                     cap::RuleExtractor extractor;
                     const auto hedged = extractor.extract(cap::ExtractionRequest{
                         .text = "I might move to Berlin next spring.",
                         .modality = strata::store::Modality::Document,
                         .memory_types = {},
                         .segments = {},
                         .categories = {}});
                     require(hedged.ok() && hedged.value().size() == 1, "hedged fact expected");
                     require(hedged.value()[0].confidence == 0.5, "hedge lowers confidence");
                   }});

  tests.push_back({"capability_rule_summarize_and_rerank", [] {
                     cap::RuleExtractor extractor;
                     const auto summary = extractor.summarize(
                         "preferences", {"Likes tea.", "likes tea", "Prefers window seats."}, 400);
                     require(summary.ok(), summary.error());
                     require(summary.value() == "Likes tea; Prefers window seats", summary.value());

                     const auto scores =
                         extractor.rerank("favorite color", {"my favorite color is blue", "tea"});
                     require(scores.ok() && scores.value().size() == 2, "two scores");
                     require(scores.value()[0] == 1.0 && scores.value()[1] == 0.0, "rerank scores");
                   }});

  tests.push_back({"capability_judge_by_coverage", [] {
                     const auto covered = cap::judge_by_coverage(
                         "favorite color", {"My favorite color is blue"});
                     require(covered.sufficient, "should be sufficient");
                     const auto partial = cap::judge_by_coverage(
                         "favorite color and pet", {"My favorite color is blue"});
                     require(!partial.sufficient, "pet is missing");
                     require(partial.next_query == "pet", partial.next_query);
                   }});

  tests.push_back({"capability_rule_describe_media", [] {
                     cap::RuleExtractor extractor;
                     strata::store::Resource audio;
                     audio.uri = "file://calls/standup.txt";
                     audio.modality = strata::store::Modality::Audio;
                     const auto described = extractor.describe_media(audio, "I lead the team.");
                     require(described.ok(), described.error());
                     require(described.value().transcription == "I lead the team.",
                             "textual audio becomes the transcription");
                     require(described.value().caption.find("audio") == 0,
                             described.value().caption);

                     strata::store::Resource image;
                     image.uri = "photo.png";
                     image.modality = strata::store::Modality::Image;
                     const auto pic = extractor.describe_media(image, std::string("\x89PNG\0\0", 6));
                     require(pic.ok() && pic.value().transcription.empty(), "image transcription");
                   }});

  tests.push_back({"capability_local_embedder_similarity", [] {
                     cap::LocalEmbedder embedder(128);
                     const auto a = embedder.embed("my favorite color is blue");
                     const auto b = embedder.embed("favorite colour blue");
                     const auto c = embedder.embed("quarterly tax filing deadline");
                     require(a.ok() && b.ok() && c.ok(), "embedding failed");
                     require(a.value().size() == 128, "dimensions");
                     const float near = strata::vector::cosine_similarity(a.value(), b.value());
                     const float far = strata::vector::cosine_similarity(a.value(), c.value());
                     require(near > far, "related texts should be closer");
                     const auto again = embedder.embed("my favorite color is blue");
                     require(again.value() == a.value(), "embedding not deterministic");
                   }});

  tests.push_back({"capability_classify_response_kinds", [] {
                     cap::HttpResponse timeout;
                     timeout.timeout = true;
                     require(cap::classify_response(timeout, "x").kind() ==
                                 ErrorKind::TransientCapability,
                             "timeout is transient");
                     cap::HttpResponse throttled;
                     throttled.status = 429;
                     require(cap::classify_response(throttled, "x").kind() ==
                                 ErrorKind::TransientCapability,
                             "429 is transient");
                     cap::HttpResponse server;
                     server.status = 503;
                     require(cap::classify_response(server, "x").kind() ==
                                 ErrorKind::TransientCapability,
                             "5xx is transient");
                     cap::HttpResponse bad;
                     bad.status = 400;
                     require(cap::classify_response(bad, "x").kind() == ErrorKind::Internal,
                             "4xx is fatal");
                     cap::HttpResponse good;
                     good.status = 200;
                     good.body = "{}";
                     require(cap::classify_response(good, "x").ok(), "2xx accepted");
                   }});

  tests.push_back({"capability_openai_extractor_parses_facts", [] {
                     auto http = std::make_shared<strata::testing::MockHttpClient>();
                     http->push_json(
                         200, chat_reply(R"({"facts":[{"text":"Prefers tea","memory_type":"profile",)"
                                         R"("subject":"drink","confidence":1.4,"quote":"I prefer tea",)"
                                         R"("categories":["preferences"]},)"
                                         R"({"text":"Teleports daily","memory_type":"magic"}]})"));
                     cap::OpenAiExtractor extractor("sk-test", "gpt-4o-mini", "https://api.test/v1",
                                                    0.0, 1'000, http);
                     const std::string source = "Honestly I prefer tea over coffee.";
                     const auto facts = extractor.extract(cap::ExtractionRequest{
                         .text = source,
                         .modality = strata::store::Modality::Conversation,
                         .memory_types = {"profile", "knowledge"},
                         .segments = {},
                         .categories = {"preferences"}});
                     require(facts.ok(), facts.error());
                     require(facts.value().size() == 2, "two facts expected");
                     const auto &first = facts.value()[0];
                     require(first.confidence == 1.0, "confidence should clamp");
                     require(first.evidence.offset == source.find("I prefer tea"),
                             "evidence should anchor the quote");
                     require(first.category_hints.size() == 1, "category hints");
                     require(facts.value()[1].memory_type == "knowledge",
                             "unknown type should fall back");

                     const auto requests = http->requests();
                     require(requests.size() == 1, "one request");
                     require(requests[0].url == "https://api.test/v1/chat/completions", requests[0].url);
                     require(requests[0].headers.at("Authorization") == "Bearer sk-test",
                             "auth header");
                   }});

  tests.push_back({"capability_openai_extractor_error_mapping", [] {
                     auto http = std::make_shared<strata::testing::MockHttpClient>();
                     http->push_json(503, "unavailable");
                     cap::OpenAiExtractor extractor("sk-test", "m", "https://api.test/v1", 0.0, 1'000,
                                                    http);
                     const auto failed = extractor.summarize("t", {"a"}, 100);
                     require(!failed.ok() && failed.kind() == ErrorKind::TransientCapability,
                             "503 should be transient");

                     cap::OpenAiExtractor keyless("", "m", "https://api.test/v1", 0.0, 1'000, http);
                     const auto missing = keyless.rerank("q", {"a"});
                     require(!missing.ok() && missing.kind() == ErrorKind::CapabilityUnavailable,
                             "missing key is a capability gap");
                   }});

  tests.push_back({"capability_openai_extractor_sufficiency", [] {
                     auto http = std::make_shared<strata::testing::MockHttpClient>();
                     http->push_json(200, chat_reply(R"({"sufficient":false,"next_query":"pet name","reason":"no pet"})"));
                     cap::OpenAiExtractor extractor("sk-test", "m", "https://api.test/v1", 0.0, 1'000,
                                                    http);
                     const auto verdict = extractor.judge_sufficiency("what is my pet called",
                                                                      {"I like tea"});
                     require(verdict.ok(), verdict.error());
                     require(!verdict.value().sufficient, "should be insufficient");
                     require(verdict.value().next_query == "pet name", "next query");
                   }});

  tests.push_back({"capability_openai_embedder_batches", [] {
                     auto http = std::make_shared<strata::testing::MockHttpClient>();
                     http->push_json(200, R"({"data":[{"index":1,"embedding":[0.0,1.0]},)"
                                          R"({"index":0,"embedding":[1.0,0.0]}]})");
                     cap::OpenAiEmbedder embedder("sk-test", "text-embedding-3-small", 2,
                                                  "https://api.test/v1", 1'000, http);
                     const auto batch = embedder.embed_batch({"a", "b"});
                     require(batch.ok(), batch.error());
                     require(batch.value().size() == 2, "two vectors");
                     require(batch.value()[0][0] == 1.0F, "index order not restored");

                     http->push_json(200, R"({"data":[{"index":0,"embedding":[1.0,0.0,0.0]}]})");
                     const auto wrong = embedder.embed("a");
                     require(!wrong.ok(), "dimension mismatch accepted");
                   }});

  tests.push_back({"capability_local_blob_store_resolves_under_root", [] {
                     strata::testing::TempWorkspace workspace;
                     workspace.create_file("docs/note.txt", "hello");
                     cap::LocalBlobStore blobs(workspace.path());
                     const auto relative = blobs.fetch("docs/note.txt");
                     require(relative.ok() && relative.value() == "hello", "relative fetch");
                     const auto uri = blobs.fetch("file://docs/note.txt");
                     require(uri.ok() && uri.value() == "hello", "file uri fetch");
                     require(!blobs.fetch("../../etc/passwd").ok(), "escape accepted");
                     const auto missing = blobs.fetch("docs/absent.txt");
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound,
                             "missing blob should be NotFound");
                   }});
}
