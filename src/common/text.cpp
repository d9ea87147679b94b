#include "strata/common/text.hpp"

#include <cctype>
#include <sstream>
#include <unordered_set>

namespace strata::common {

namespace {

const std::unordered_set<std::string> &stopwords() {
  static const std::unordered_set<std::string> words = {
      "a",     "an",    "and",   "are",  "as",    "at",    "be",    "been", "but",   "by",
      "can",   "could", "did",   "do",   "does",  "for",   "from",  "had",  "has",   "have",
      "he",    "her",   "him",   "his",  "how",   "i",     "i'm",   "if",   "in",    "into",
      "is",    "it",    "it's",  "its",  "me",    "my",    "of",    "on",   "or",    "our",
      "she",   "so",    "that",  "the",  "their", "them",  "then",  "there", "these", "they",
      "this",  "to",    "was",   "we",   "were",  "what",  "when",  "where", "which", "who",
      "whom",  "why",   "will",  "with", "would", "you",   "your",  "about", "any",   "some",
      "tell",  "know",  "does",  "am",   "also",  "just",  "very",  "really", "should", "shall"};
  return words;
}

} // namespace

std::vector<std::string> tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto ch = static_cast<unsigned char>(text[i]);
    const bool inner_apostrophe = ch == '\'' && !current.empty() && i + 1 < text.size() &&
                                  std::isalnum(static_cast<unsigned char>(text[i + 1])) != 0;
    if (std::isalnum(ch) != 0 || ch >= 0x80 || inner_apostrophe) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

bool is_stopword(const std::string &token) { return stopwords().contains(token); }

std::string stem(const std::string &token) {
  if (token.size() > 4 && token.ends_with("ies")) {
    return token.substr(0, token.size() - 3) + "y";
  }
  if (token.size() > 4 && token.ends_with("ing")) {
    return token.substr(0, token.size() - 3);
  }
  if (token.size() > 3 && token.ends_with("es") &&
      (token.ends_with("ses") || token.ends_with("xes") || token.ends_with("ches"))) {
    return token.substr(0, token.size() - 2);
  }
  if (token.size() > 3 && token.ends_with('s') && !token.ends_with("ss")) {
    return token.substr(0, token.size() - 1);
  }
  return token;
}

std::vector<std::string> content_terms(const std::string &text) {
  std::vector<std::string> terms;
  for (const auto &token : tokenize(text)) {
    if (is_stopword(token)) {
      continue;
    }
    terms.push_back(stem(token));
  }
  return terms;
}

std::set<std::string> content_term_set(const std::string &text) {
  const auto terms = content_terms(text);
  return {terms.begin(), terms.end()};
}

std::string normalize_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

std::vector<Sentence> split_sentences(const std::string &text, const std::size_t base_offset) {
  std::vector<Sentence> sentences;
  std::size_t start = 0;

  const auto flush = [&](std::size_t end) {
    std::size_t first = start;
    while (first < end && std::isspace(static_cast<unsigned char>(text[first])) != 0) {
      ++first;
    }
    std::size_t last = end;
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1])) != 0) {
      --last;
    }
    if (last > first) {
      sentences.push_back(Sentence{.text = text.substr(first, last - first),
                                   .offset = base_offset + first,
                                   .length = last - first});
    }
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '\n' || ch == '\f') {
      flush(i);
      start = i + 1;
      continue;
    }
    if (ch == '.' || ch == '!' || ch == '?') {
      const bool boundary =
          i + 1 >= text.size() || std::isspace(static_cast<unsigned char>(text[i + 1])) != 0;
      if (boundary) {
        flush(i + 1);
        start = i + 1;
      }
    }
  }
  flush(text.size());
  return sentences;
}

std::string join(const std::vector<std::string> &parts, const std::string &sep) {
  std::ostringstream out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out << sep;
    }
    out << parts[i];
  }
  return out.str();
}

} // namespace strata::common
