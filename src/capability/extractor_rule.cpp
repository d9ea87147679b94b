#include "strata/capability/extractor_rule.hpp"

#include "strata/common/fs.hpp"
#include "strata/common/text.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <regex>
#include <set>
#include <unordered_set>

namespace strata::capability {

namespace {

constexpr double kBaseConfidence = 0.8;
constexpr double kHedgedConfidence = 0.5;
constexpr double kEmphaticConfidence = 0.9;
constexpr std::size_t kMinContentTerms = 2;

struct KeywordRule {
  std::string label;
  std::vector<std::string> keywords;
};

const std::vector<KeywordRule> &type_rules() {
  static const std::vector<KeywordRule> rules = {
      {"behavior",
       {"usually", "always", "often", "every", "habit", "routine", "tend", "typically", "daily",
        "weekly", "never"}},
      {"event",
       {"yesterday", "today", "tomorrow", "tonight", "last week", "last month", "last year",
        "ago", "went", "visited", "attended", "met", "happened", "this weekend"}},
      {"skill",
       {"can", "fluent", "proficient", "skilled", "expert", "know how", "learned",
        "certified"}},
      {"profile",
       {"name", "favorite", "favourite", "like", "love", "prefer", "live", "born", "work",
        "years old", "allergic", "enjoy", "hate", "dislike"}},
  };
  return rules;
}

const std::vector<KeywordRule> &category_rules() {
  static const std::vector<KeywordRule> rules = {
      {"preferences",
       {"favorite", "favourite", "like", "love", "prefer", "enjoy", "hate", "dislike"}},
      {"personal_info", {"name", "age", "born", "live", "years old", "birthday", "allergic"}},
      {"relationships",
       {"friend", "wife", "husband", "mother", "father", "mom", "dad", "sister", "brother",
        "partner", "colleague", "son", "daughter", "family"}},
      {"activities",
       {"hobby", "play", "sport", "hiking", "reading", "music", "game", "cooking", "running"}},
      {"goals", {"goal", "plan", "want to", "aspire", "hope", "aim", "trying to"}},
      {"experiences", {"went", "visited", "traveled", "travelled", "trip", "attended"}},
      {"habits", {"usually", "every", "always", "routine", "often", "daily"}},
      {"work_life",
       {"work", "job", "office", "manager", "company", "career", "project", "team", "boss"}},
      {"opinions", {"think", "believe", "opinion", "feel"}},
  };
  return rules;
}

const std::unordered_set<std::string> &first_person() {
  static const std::unordered_set<std::string> words = {
      "i", "i'm", "i've", "i'd", "i'll", "my", "me", "mine", "myself", "we", "our", "us"};
  return words;
}

const std::vector<std::string> &hedges() {
  static const std::vector<std::string> words = {"maybe",   "probably", "might", "perhaps",
                                                 "guess",   "not sure", "unsure", "i think",
                                                 "possibly"};
  return words;
}

const std::vector<std::string> &emphatics() {
  static const std::vector<std::string> words = {"definitely", "certainly", "absolutely",
                                                 "really love", "always"};
  return words;
}

// " token token " form so keyword phrases match on word boundaries.
std::string padded_tokens(const std::string &sentence) {
  return " " + common::join(common::tokenize(sentence), " ") + " ";
}

bool has_keyword(const std::string &padded, const std::string &keyword) {
  return padded.find(" " + keyword + " ") != std::string::npos;
}

bool is_first_person(const std::string &sentence) {
  const auto tokens = common::tokenize(sentence);
  return std::any_of(tokens.begin(), tokens.end(),
                     [](const std::string &token) { return first_person().contains(token); });
}

bool is_assistant_speaker(const std::string &speaker) {
  const auto lowered = common::to_lower(speaker);
  return lowered == "assistant" || lowered == "system" || lowered == "bot" || lowered == "ai";
}

// Strips "speaker: " and "[timestamp] speaker: " prefixes. Returns the number of bytes
// removed and the speaker.
std::pair<std::size_t, std::string> strip_speaker(const std::string &sentence) {
  static const std::regex prefix(R"(^\s*(?:\[[^\]]{1,40}\]\s*)?([A-Za-z][\w .-]{0,30}):\s+)");
  std::smatch match;
  if (std::regex_search(sentence, match, prefix)) {
    return {static_cast<std::size_t>(match.length(0)), common::trim(match[1].str())};
  }
  return {0, ""};
}

std::optional<std::size_t> segment_for(const std::vector<store::Segment> &segments,
                                       const std::size_t offset) {
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const auto &segment = segments[i];
    if (offset >= segment.offset && offset < segment.offset + segment.length) {
      return i;
    }
  }
  return std::nullopt;
}

double confidence_for(const std::string &padded) {
  for (const auto &hedge : hedges()) {
    if (has_keyword(padded, hedge)) {
      return kHedgedConfidence;
    }
  }
  for (const auto &word : emphatics()) {
    if (has_keyword(padded, word)) {
      return kEmphaticConfidence;
    }
  }
  return kBaseConfidence;
}

std::string allowed_type(const std::string &type, const std::vector<std::string> &allowed) {
  if (allowed.empty() || std::find(allowed.begin(), allowed.end(), type) != allowed.end()) {
    return type;
  }
  if (std::find(allowed.begin(), allowed.end(), "knowledge") != allowed.end()) {
    return "knowledge";
  }
  return "";
}

bool looks_textual(const std::string &raw) {
  if (raw.empty()) {
    return false;
  }
  std::size_t printable = 0;
  for (const char ch : raw) {
    const auto c = static_cast<unsigned char>(ch);
    if (c == 0) {
      return false;
    }
    if (std::isprint(c) != 0 || std::isspace(c) != 0 || c >= 0x80) {
      ++printable;
    }
  }
  return printable * 10 >= raw.size() * 9;
}

std::string strip_terminal(std::string text) {
  while (!text.empty() && (text.back() == '.' || text.back() == '!' || text.back() == ';')) {
    text.pop_back();
  }
  return common::trim(text);
}

} // namespace

std::string classify_memory_type(const std::string &sentence) {
  const std::string padded = padded_tokens(sentence);
  for (const auto &rule : type_rules()) {
    for (const auto &keyword : rule.keywords) {
      if (has_keyword(padded, keyword)) {
        return rule.label;
      }
    }
  }
  return is_first_person(sentence) ? "profile" : "knowledge";
}

std::string extract_subject(const std::string &sentence) {
  static const std::regex possessive(R"(\bmy ([a-z][a-z ]{0,40}?) (?:is|are|was|were)\b)");
  static const std::regex residence(R"(\bi (?:live|am living|moved) (?:in|to)\b)");
  static const std::regex occupation(R"(\bi work (?:as|at|for)\b)");
  static const std::regex age(R"(\bi am \d+ years old\b)");

  std::string lowered = common::normalize_whitespace(sentence);
  lowered = std::regex_replace(lowered, std::regex(R"(\bi'm\b)"), "i am");

  std::smatch match;
  if (std::regex_search(lowered, match, possessive)) {
    return common::trim(match[1].str());
  }
  if (std::regex_search(lowered, residence)) {
    return "residence";
  }
  if (std::regex_search(lowered, occupation)) {
    return "occupation";
  }
  if (std::regex_search(lowered, age)) {
    return "age";
  }
  return "";
}

std::vector<std::string> category_hints_for(const std::string &sentence) {
  const std::string padded = padded_tokens(sentence);
  std::vector<std::string> hints;
  for (const auto &rule : category_rules()) {
    for (const auto &keyword : rule.keywords) {
      if (has_keyword(padded, keyword)) {
        hints.push_back(rule.label);
        break;
      }
    }
  }
  return hints;
}

SufficiencyVerdict judge_by_coverage(const std::string &query,
                                     const std::vector<std::string> &context) {
  const auto terms = common::content_terms(query);
  if (terms.empty()) {
    return SufficiencyVerdict{.sufficient = true, .next_query = query, .reason = "no terms"};
  }

  std::set<std::string> available;
  for (const auto &text : context) {
    const auto found = common::content_term_set(text);
    available.insert(found.begin(), found.end());
  }

  std::vector<std::string> missing;
  std::set<std::string> seen;
  for (const auto &term : terms) {
    if (!available.contains(term) && seen.insert(term).second) {
      missing.push_back(term);
    }
  }

  const std::size_t unique_terms = common::content_term_set(query).size();
  SufficiencyVerdict verdict;
  verdict.sufficient = missing.empty();
  verdict.next_query = missing.empty() ? query : common::join(missing, " ");
  verdict.reason = "covered " + std::to_string(unique_terms - missing.size()) + "/" +
                   std::to_string(unique_terms) + " terms";
  return verdict;
}

std::string_view RuleExtractor::name() const { return "rule"; }

common::Result<std::vector<CandidateFact>>
RuleExtractor::extract(const ExtractionRequest &request) {
  const bool conversational = request.modality == store::Modality::Conversation ||
                              request.modality == store::Modality::Audio ||
                              request.modality == store::Modality::Video;

  std::vector<CandidateFact> facts;
  std::set<std::string> seen;
  for (const auto &sentence : common::split_sentences(request.text)) {
    const auto [stripped, prefix_speaker] = strip_speaker(sentence.text);
    const std::string text = common::trim(sentence.text.substr(stripped));
    if (text.empty() || text.back() == '?') {
      continue;
    }

    const auto segment = segment_for(request.segments, sentence.offset);
    std::string speaker = prefix_speaker;
    if (speaker.empty() && segment.has_value()) {
      speaker = request.segments[*segment].speaker;
    }
    if (is_assistant_speaker(speaker)) {
      continue;
    }
    if (conversational && !is_first_person(text)) {
      continue;
    }
    if (common::content_terms(text).size() < kMinContentTerms) {
      continue;
    }

    const std::string type = allowed_type(classify_memory_type(text), request.memory_types);
    if (type.empty()) {
      continue;
    }
    const std::string fact_text = strip_terminal(text);
    if (!seen.insert(common::normalize_whitespace(fact_text)).second) {
      continue;
    }

    const std::size_t offset = sentence.offset + stripped;
    CandidateFact fact;
    fact.text = fact_text;
    fact.memory_type = type;
    fact.subject = extract_subject(text);
    fact.evidence.offset = offset;
    fact.evidence.length = sentence.length - stripped;
    fact.evidence.segment = segment;
    if (segment.has_value()) {
      fact.evidence.page = request.segments[*segment].page;
      fact.evidence.timestamp = request.segments[*segment].timestamp;
    }
    fact.confidence = confidence_for(padded_tokens(text));
    fact.stable = type != "event";
    fact.category_hints = category_hints_for(text);
    facts.push_back(std::move(fact));
  }

  return common::Result<std::vector<CandidateFact>>::success(std::move(facts));
}

common::Result<std::string> RuleExtractor::summarize(const std::string & /*topic*/,
                                                     const std::vector<std::string> &texts,
                                                     const std::size_t target_length) {
  std::string summary;
  std::set<std::string> seen;
  for (const auto &raw : texts) {
    const std::string text = strip_terminal(raw);
    if (text.empty() || !seen.insert(common::normalize_whitespace(text)).second) {
      continue;
    }
    const std::size_t added = summary.empty() ? text.size() : text.size() + 2;
    if (!summary.empty() && summary.size() + added > target_length) {
      break;
    }
    if (!summary.empty()) {
      summary += "; ";
    }
    summary += text;
  }
  if (target_length > 3 && summary.size() > target_length) {
    summary = summary.substr(0, target_length - 3) + "...";
  }
  return common::Result<std::string>::success(std::move(summary));
}

common::Result<std::vector<double>>
RuleExtractor::rerank(const std::string &query, const std::vector<std::string> &candidates) {
  const auto terms = common::content_term_set(query);
  std::vector<double> scores;
  scores.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    if (terms.empty()) {
      scores.push_back(0.0);
      continue;
    }
    const auto found = common::content_term_set(candidate);
    std::size_t hits = 0;
    for (const auto &term : terms) {
      if (found.contains(term)) {
        ++hits;
      }
    }
    scores.push_back(static_cast<double>(hits) / static_cast<double>(terms.size()));
  }
  return common::Result<std::vector<double>>::success(std::move(scores));
}

common::Result<SufficiencyVerdict>
RuleExtractor::judge_sufficiency(const std::string &query,
                                 const std::vector<std::string> &context) {
  return common::Result<SufficiencyVerdict>::success(judge_by_coverage(query, context));
}

common::Result<MediaDescription> RuleExtractor::describe_media(const store::Resource &resource,
                                                               const std::string &raw) {
  MediaDescription description;
  const std::string file = std::filesystem::path(resource.uri).filename().string();
  description.caption = store::modality_to_string(resource.modality) +
                        (file.empty() ? std::string() : " " + file);
  if (resource.modality != store::Modality::Image && looks_textual(raw)) {
    description.transcription = raw;
  }
  return common::Result<MediaDescription>::success(std::move(description));
}

} // namespace strata::capability
