#include "strata/capability/extractor_openai.hpp"

#include "strata/common/json_util.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace strata::capability {

namespace {

constexpr std::size_t kMaxPromptChars = 12'000;

constexpr const char *kExtractPrompt =
    "You extract durable memory facts from content. Reply with a JSON object "
    "{\"facts\":[{\"text\":string,\"memory_type\":string,\"subject\":string,"
    "\"confidence\":number,\"stable\":bool,\"categories\":[string],\"quote\":string}]}. "
    "`quote` is the exact source span supporting the fact. `subject` names what the fact is "
    "about in two or three lowercase words, or is empty.";

constexpr const char *kSummarizePrompt =
    "You maintain a rolling summary of a memory category. Reply with a JSON object "
    "{\"summary\":string}. Keep it under the requested length and drop contradicted facts.";

constexpr const char *kRerankPrompt =
    "You score how relevant each numbered candidate is to the query. Reply with a JSON "
    "object {\"scores\":[number]} holding one score in [0,1] per candidate, in order.";

constexpr const char *kSufficiencyPrompt =
    "You decide whether retrieved context answers a query. Reply with a JSON object "
    "{\"sufficient\":bool,\"next_query\":string,\"reason\":string}. When not sufficient, "
    "`next_query` restates what is still missing.";

constexpr const char *kMediaPrompt =
    "You describe a media resource for a memory system. Reply with a JSON object "
    "{\"caption\":string,\"transcription\":string}.";

std::string clip(const std::string &text) {
  return text.size() <= kMaxPromptChars ? text : text.substr(0, kMaxPromptChars);
}

common::Result<std::vector<double>> parse_number_array(const std::string &array) {
  if (array.size() < 2 || array.front() != '[') {
    return common::Result<std::vector<double>>::failure("expected a numeric array");
  }
  std::vector<double> values;
  std::stringstream stream(array.substr(1, array.size() - 2));
  std::string item;
  while (std::getline(stream, item, ',')) {
    const char *begin = item.c_str();
    char *end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin) {
      return common::Result<std::vector<double>>::failure("invalid score value: " + item);
    }
    values.push_back(value);
  }
  return common::Result<std::vector<double>>::success(std::move(values));
}

} // namespace

common::Result<std::string> parse_chat_content(const std::string &body) {
  if (body.find("\"choices\"") == std::string::npos) {
    return common::Result<std::string>::failure("choices field missing");
  }
  const std::string message = common::json_get_object(body, "message");
  const std::string content = common::json_get_string(message, "content");
  if (content.empty()) {
    return common::Result<std::string>::failure("choices[0].message.content missing");
  }
  return common::Result<std::string>::success(content);
}

common::Result<std::vector<CandidateFact>>
parse_facts(const std::string &json, const std::string &source,
            const std::vector<std::string> &memory_types) {
  if (common::json_find_key(json, "facts") == std::string::npos) {
    return common::Result<std::vector<CandidateFact>>::failure("facts field missing");
  }

  std::vector<CandidateFact> facts;
  for (const auto &object :
       common::json_split_top_level_objects(common::json_get_array(json, "facts"))) {
    CandidateFact fact;
    fact.text = common::json_get_string(object, "text");
    if (fact.text.empty()) {
      continue;
    }
    fact.memory_type = common::json_get_string(object, "memory_type");
    if (fact.memory_type.empty() ||
        (!memory_types.empty() && std::find(memory_types.begin(), memory_types.end(),
                                            fact.memory_type) == memory_types.end())) {
      fact.memory_type = "knowledge";
    }
    fact.subject = common::json_get_string(object, "subject");
    fact.confidence = std::clamp(common::json_get_double(object, "confidence", 0.8), 0.0, 1.0);
    fact.stable = common::json_get_bool(object, "stable", true);
    fact.category_hints = common::json_get_string_array(object, "categories");

    std::string quote = common::json_get_string(object, "quote");
    std::size_t offset = quote.empty() ? std::string::npos : source.find(quote);
    if (offset == std::string::npos) {
      quote = fact.text;
      offset = source.find(quote);
    }
    if (offset == std::string::npos) {
      fact.evidence.offset = 0;
      fact.evidence.length = source.size();
    } else {
      fact.evidence.offset = offset;
      fact.evidence.length = quote.size();
    }
    facts.push_back(std::move(fact));
  }
  return common::Result<std::vector<CandidateFact>>::success(std::move(facts));
}

OpenAiExtractor::OpenAiExtractor(std::string api_key, std::string model, std::string base_url,
                                 const double temperature, const std::uint64_t timeout_ms,
                                 std::shared_ptr<HttpClient> http_client)
    : api_key_(std::move(api_key)), model_(std::move(model)), base_url_(std::move(base_url)),
      temperature_(temperature), timeout_ms_(timeout_ms), http_client_(std::move(http_client)) {}

std::string_view OpenAiExtractor::name() const { return "openai"; }

common::Result<std::string> OpenAiExtractor::complete_json(const std::string &system_prompt,
                                                           const std::string &user_prompt) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::CapabilityUnavailable,
                                                "missing API key");
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":" << common::json_quote(model_) << ",";
  body << "\"messages\":[";
  body << "{\"role\":\"system\",\"content\":" << common::json_quote(system_prompt) << "},";
  body << "{\"role\":\"user\",\"content\":" << common::json_quote(user_prompt) << "}";
  body << "],";
  body << "\"response_format\":{\"type\":\"json_object\"},";
  body << "\"temperature\":" << temperature_;
  body << "}";

  const HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response =
      http_client_->post_json(base_url_ + "/chat/completions", headers, body.str(), timeout_ms_);
  auto payload = classify_response(response, "chat completion");
  if (!payload.ok()) {
    return payload;
  }
  auto content = parse_chat_content(payload.value());
  if (!content.ok()) {
    return content;
  }
  const std::string blob = common::json_extract_blob(content.value());
  if (blob.empty()) {
    return common::Result<std::string>::failure("model reply carries no JSON object");
  }
  return common::Result<std::string>::success(blob);
}

common::Result<std::vector<CandidateFact>>
OpenAiExtractor::extract(const ExtractionRequest &request) {
  std::ostringstream prompt;
  prompt << "Modality: " << store::modality_to_string(request.modality) << "\n";
  prompt << "Allowed memory types: " << common::json_string_array(request.memory_types) << "\n";
  if (!request.categories.empty()) {
    prompt << "Known categories: " << common::json_string_array(request.categories) << "\n";
  }
  prompt << "Content:\n" << clip(request.text);

  auto json = complete_json(kExtractPrompt, prompt.str());
  if (!json.ok()) {
    return common::Result<std::vector<CandidateFact>>::failure(json.error_info());
  }
  return parse_facts(json.value(), request.text, request.memory_types);
}

common::Result<std::string> OpenAiExtractor::summarize(const std::string &topic,
                                                       const std::vector<std::string> &texts,
                                                       const std::size_t target_length) {
  std::ostringstream prompt;
  prompt << "Category: " << topic << "\n";
  prompt << "Target length: " << target_length << " characters\n";
  prompt << "Facts:\n";
  for (const auto &text : texts) {
    prompt << "- " << text << "\n";
  }

  auto json = complete_json(kSummarizePrompt, clip(prompt.str()));
  if (!json.ok()) {
    return json;
  }
  if (common::json_find_key(json.value(), "summary") == std::string::npos) {
    return common::Result<std::string>::failure("summary field missing");
  }
  return common::Result<std::string>::success(common::json_get_string(json.value(), "summary"));
}

common::Result<std::vector<double>>
OpenAiExtractor::rerank(const std::string &query, const std::vector<std::string> &candidates) {
  if (candidates.empty()) {
    return common::Result<std::vector<double>>::success({});
  }
  std::ostringstream prompt;
  prompt << "Query: " << query << "\nCandidates:\n";
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    prompt << i << ". " << candidates[i] << "\n";
  }

  auto json = complete_json(kRerankPrompt, clip(prompt.str()));
  if (!json.ok()) {
    return common::Result<std::vector<double>>::failure(json.error_info());
  }
  auto scores = parse_number_array(common::json_get_array(json.value(), "scores"));
  if (!scores.ok()) {
    return scores;
  }
  if (scores.value().size() != candidates.size()) {
    return common::Result<std::vector<double>>::failure("rerank returned " +
                                                        std::to_string(scores.value().size()) +
                                                        " scores for " +
                                                        std::to_string(candidates.size()));
  }
  for (double &score : scores.value()) {
    score = std::clamp(score, 0.0, 1.0);
  }
  return scores;
}

common::Result<SufficiencyVerdict>
OpenAiExtractor::judge_sufficiency(const std::string &query,
                                   const std::vector<std::string> &context) {
  std::ostringstream prompt;
  prompt << "Query: " << query << "\nRetrieved context:\n";
  if (context.empty()) {
    prompt << "No content retrieved yet.\n";
  }
  for (const auto &text : context) {
    prompt << "- " << text << "\n";
  }

  auto json = complete_json(kSufficiencyPrompt, clip(prompt.str()));
  if (!json.ok()) {
    return common::Result<SufficiencyVerdict>::failure(json.error_info());
  }
  if (common::json_find_key(json.value(), "sufficient") == std::string::npos) {
    return common::Result<SufficiencyVerdict>::failure("sufficient field missing");
  }
  SufficiencyVerdict verdict;
  verdict.sufficient = common::json_get_bool(json.value(), "sufficient", false);
  verdict.next_query = common::json_get_string(json.value(), "next_query");
  if (verdict.next_query.empty()) {
    verdict.next_query = query;
  }
  verdict.reason = common::json_get_string(json.value(), "reason");
  return common::Result<SufficiencyVerdict>::success(std::move(verdict));
}

common::Result<MediaDescription> OpenAiExtractor::describe_media(const store::Resource &resource,
                                                                 const std::string &raw) {
  std::ostringstream prompt;
  prompt << "Modality: " << store::modality_to_string(resource.modality) << "\n";
  prompt << "Reference: " << resource.uri << "\n";
  if (!raw.empty()) {
    prompt << "Payload excerpt:\n" << clip(raw);
  }

  auto json = complete_json(kMediaPrompt, prompt.str());
  if (!json.ok()) {
    return common::Result<MediaDescription>::failure(json.error_info());
  }
  MediaDescription description;
  description.caption = common::json_get_string(json.value(), "caption");
  description.transcription = common::json_get_string(json.value(), "transcription");
  return common::Result<MediaDescription>::success(std::move(description));
}

} // namespace strata::capability
