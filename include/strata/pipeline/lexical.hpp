#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace strata::pipeline {

enum class TermSign { Should, Must, Exclude };

/// Parsed lexical query. Supports `+must`, `-exclude`, `"exact phrase"` and the field
/// filters `type:<memory type>` and `category:<name>`.
struct LexicalQuery {
  std::set<std::string> should_terms;
  std::set<std::string> must_terms;
  std::set<std::string> exclude_terms;
  std::vector<std::pair<std::string, TermSign>> phrases;
  // field -> (value, sign)
  std::vector<std::pair<std::string, std::pair<std::string, TermSign>>> fields;
  // Positive free-text fragments in query order.
  std::vector<std::string> plain_parts;

  [[nodiscard]] bool empty() const;
  /// Positive terms in scoring order.
  [[nodiscard]] std::vector<std::string> positive_terms() const;
  /// Free text with operators and field filters removed.
  [[nodiscard]] std::string plain_text() const;
  [[nodiscard]] std::vector<std::string> field_values(const std::string &field,
                                                      TermSign sign) const;
};

[[nodiscard]] LexicalQuery parse_lexical_query(const std::string &query);

/// A document as seen by lexical matching.
struct LexicalDoc {
  std::string id;
  std::string text;
  std::map<std::string, std::vector<std::string>> fields;
};

/// Applies must/exclude terms, phrases and field filters.
[[nodiscard]] bool passes_constraints(const LexicalQuery &query, const LexicalDoc &doc);

/// BM25 over the documents that pass the constraints, plus phrase and field boosts.
/// Returns (id, score) for positive scores, best first.
[[nodiscard]] std::vector<std::pair<std::string, double>>
bm25_rank(const LexicalQuery &query, const std::vector<LexicalDoc> &docs, std::size_t limit,
          double k1 = 1.2, double b = 0.75);

/// Reciprocal rank fusion of several ranked lists.
[[nodiscard]] std::vector<std::pair<std::string, double>>
rrf_fuse(const std::vector<std::vector<std::pair<std::string, double>>> &lists,
         std::size_t limit, std::size_t k = 60);

} // namespace strata::pipeline
