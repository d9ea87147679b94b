#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace strata::common {

struct Sentence {
  std::string text;
  std::size_t offset = 0;
  std::size_t length = 0;
};

/// Lowercased alphanumeric tokens, apostrophes kept inside words.
[[nodiscard]] std::vector<std::string> tokenize(const std::string &text);

/// Tokens minus stopwords, with a light plural/verb suffix strip.
[[nodiscard]] std::vector<std::string> content_terms(const std::string &text);
[[nodiscard]] std::set<std::string> content_term_set(const std::string &text);

[[nodiscard]] bool is_stopword(const std::string &token);
[[nodiscard]] std::string stem(const std::string &token);

/// Lowercase and collapse runs of whitespace to single spaces.
[[nodiscard]] std::string normalize_whitespace(const std::string &text);

/// Split on terminal punctuation and newlines; offsets index into `text`.
[[nodiscard]] std::vector<Sentence> split_sentences(const std::string &text,
                                                    std::size_t base_offset = 0);

[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &sep);

} // namespace strata::common
