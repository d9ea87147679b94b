#include "strata/pipeline/lexical.hpp"

#include "strata/common/fs.hpp"
#include "strata/common/text.hpp"

#include <algorithm>
#include <cmath>
#include <regex>
#include <unordered_map>

namespace strata::pipeline {

namespace {

const std::set<std::string> &known_fields() {
  static const std::set<std::string> fields = {"type", "category"};
  return fields;
}

std::set<std::string> stemmed_tokens(const std::string &text) {
  std::set<std::string> out;
  for (const auto &token : common::tokenize(text)) {
    out.insert(common::stem(token));
  }
  return out;
}

void add_token(LexicalQuery &query, const std::string &field, const std::string &body,
               const TermSign sign) {
  const bool is_phrase = body.size() >= 2 && body.front() == '"' && body.back() == '"';
  const std::string value =
      common::to_lower(common::trim(is_phrase ? body.substr(1, body.size() - 2) : body));
  if (value.empty()) {
    return;
  }

  if (!field.empty()) {
    query.fields.push_back({field, {value, sign}});
    return;
  }
  if (is_phrase) {
    query.phrases.emplace_back(common::normalize_whitespace(value), sign);
    if (sign != TermSign::Exclude) {
      query.plain_parts.push_back(value);
    }
    return;
  }

  for (const auto &token : common::tokenize(value)) {
    if (sign == TermSign::Should && common::is_stopword(token)) {
      continue;
    }
    const std::string term = common::stem(token);
    switch (sign) {
    case TermSign::Must:
      query.must_terms.insert(term);
      query.plain_parts.push_back(token);
      break;
    case TermSign::Exclude:
      query.exclude_terms.insert(term);
      break;
    case TermSign::Should:
      query.should_terms.insert(term);
      query.plain_parts.push_back(token);
      break;
    }
  }
}

bool field_matches(const LexicalDoc &doc, const std::string &field, const std::string &value) {
  const auto it = doc.fields.find(field);
  if (it == doc.fields.end()) {
    return false;
  }
  return std::any_of(it->second.begin(), it->second.end(), [&](const std::string &candidate) {
    return common::to_lower(candidate) == value;
  });
}

double boost(const LexicalQuery &query, const LexicalDoc &doc, const std::string &lowered) {
  double score = 0.0;
  for (const auto &[phrase, sign] : query.phrases) {
    if (sign != TermSign::Exclude && lowered.find(phrase) != std::string::npos) {
      score += sign == TermSign::Should ? 0.8 : 1.2;
    }
  }
  for (const auto &[field, match] : query.fields) {
    const auto &[value, sign] = match;
    if (sign != TermSign::Exclude && field_matches(doc, field, value)) {
      score += sign == TermSign::Should ? 0.4 : 0.7;
    }
  }
  return score;
}

} // namespace

bool LexicalQuery::empty() const {
  return should_terms.empty() && must_terms.empty() && phrases.empty() && fields.empty() &&
         exclude_terms.empty();
}

std::vector<std::string> LexicalQuery::positive_terms() const {
  std::vector<std::string> terms(should_terms.begin(), should_terms.end());
  for (const auto &term : must_terms) {
    if (!should_terms.contains(term)) {
      terms.push_back(term);
    }
  }
  return terms;
}

std::string LexicalQuery::plain_text() const { return common::join(plain_parts, " "); }

std::vector<std::string> LexicalQuery::field_values(const std::string &field,
                                                    const TermSign sign) const {
  std::vector<std::string> out;
  for (const auto &[name, match] : fields) {
    if (name == field && match.second == sign) {
      out.push_back(match.first);
    }
  }
  return out;
}

LexicalQuery parse_lexical_query(const std::string &query) {
  static const std::regex pattern(R"re(([+-]?)(?:([A-Za-z_][\w.]*):)?("[^"]+"|\S+))re");

  LexicalQuery parsed;
  for (auto it = std::sregex_iterator(query.begin(), query.end(), pattern);
       it != std::sregex_iterator(); ++it) {
    const auto &match = *it;
    const std::string prefix = match[1].str();
    std::string field = common::to_lower(match[2].str());
    std::string body = match[3].str();
    if (!field.empty() && !known_fields().contains(field)) {
      body = match[2].str() + ":" + body;
      field.clear();
    }
    const TermSign sign = prefix == "+"   ? TermSign::Must
                          : prefix == "-" ? TermSign::Exclude
                                          : TermSign::Should;
    add_token(parsed, field, body, sign);
  }
  return parsed;
}

bool passes_constraints(const LexicalQuery &query, const LexicalDoc &doc) {
  const std::string lowered = common::normalize_whitespace(doc.text);
  const auto tokens = stemmed_tokens(doc.text);

  for (const auto &term : query.exclude_terms) {
    if (tokens.contains(term)) {
      return false;
    }
  }
  for (const auto &term : query.must_terms) {
    if (!tokens.contains(term)) {
      return false;
    }
  }
  for (const auto &[phrase, sign] : query.phrases) {
    const bool present = lowered.find(phrase) != std::string::npos;
    if ((sign == TermSign::Exclude && present) || (sign == TermSign::Must && !present)) {
      return false;
    }
  }
  for (const auto &[field, match] : query.fields) {
    const auto &[value, sign] = match;
    const bool present = field_matches(doc, field, value);
    if ((sign == TermSign::Exclude && present) || (sign == TermSign::Must && !present)) {
      return false;
    }
  }
  return true;
}

std::vector<std::pair<std::string, double>> bm25_rank(const LexicalQuery &query,
                                                      const std::vector<LexicalDoc> &docs,
                                                      const std::size_t limit, const double k1,
                                                      const double b) {
  const auto terms = query.positive_terms();
  if (terms.empty() && query.phrases.empty() && query.fields.empty()) {
    return {};
  }

  std::vector<std::pair<const LexicalDoc *, std::vector<std::string>>> filtered;
  for (const auto &doc : docs) {
    if (passes_constraints(query, doc)) {
      filtered.emplace_back(&doc, common::content_terms(doc.text));
    }
  }
  if (filtered.empty()) {
    return {};
  }

  const double n_docs = static_cast<double>(filtered.size());
  double total_length = 0.0;
  std::unordered_map<std::string, std::size_t> df;
  for (const auto &[doc, tokens] : filtered) {
    total_length += static_cast<double>(tokens.size());
    const std::set<std::string> unique(tokens.begin(), tokens.end());
    for (const auto &term : terms) {
      if (unique.contains(term)) {
        ++df[term];
      }
    }
  }
  const double avgdl = std::max(total_length / n_docs, 1e-9);

  std::vector<std::pair<std::string, double>> scores;
  for (const auto &[doc, tokens] : filtered) {
    std::unordered_map<std::string, std::size_t> tf;
    for (const auto &token : tokens) {
      ++tf[token];
    }
    const double doc_length = static_cast<double>(std::max<std::size_t>(tokens.size(), 1));

    double score = 0.0;
    for (const auto &term : terms) {
      const auto it = tf.find(term);
      if (it == tf.end()) {
        continue;
      }
      const double freq = static_cast<double>(it->second);
      const double n_t = static_cast<double>(df[term]);
      const double idf = std::log((n_docs - n_t + 0.5) / (n_t + 0.5) + 1.0);
      score += idf * freq * (k1 + 1.0) / (freq + k1 * (1.0 - b + b * doc_length / avgdl));
    }
    score += boost(query, *doc, common::normalize_whitespace(doc->text));
    if (score > 0.0) {
      scores.emplace_back(doc->id, score);
    }
  }

  std::sort(scores.begin(), scores.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.second != rhs.second ? lhs.second > rhs.second : lhs.first < rhs.first;
  });
  if (limit > 0 && scores.size() > limit) {
    scores.resize(limit);
  }
  return scores;
}

std::vector<std::pair<std::string, double>>
rrf_fuse(const std::vector<std::vector<std::pair<std::string, double>>> &lists,
         const std::size_t limit, const std::size_t k) {
  std::unordered_map<std::string, double> fused;
  for (const auto &list : lists) {
    for (std::size_t rank = 0; rank < list.size(); ++rank) {
      fused[list[rank].first] += 1.0 / static_cast<double>(k + rank + 1);
    }
  }
  std::vector<std::pair<std::string, double>> out(fused.begin(), fused.end());
  std::sort(out.begin(), out.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.second != rhs.second ? lhs.second > rhs.second : lhs.first < rhs.first;
  });
  if (limit > 0 && out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

} // namespace strata::pipeline
