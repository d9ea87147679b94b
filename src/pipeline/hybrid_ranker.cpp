#include "strata/pipeline/hybrid_ranker.hpp"

#include "strata/common/time.hpp"

#include <algorithm>

namespace strata::pipeline {

HybridRanker::HybridRanker(const double vector_weight, const double keyword_weight,
                           const double recency_weight, const double half_life_days)
    : vector_weight_(vector_weight), keyword_weight_(keyword_weight),
      recency_weight_(recency_weight), half_life_days_(half_life_days) {}

std::vector<ScoredItem>
HybridRanker::rank(const std::vector<vector::VectorHit> &vector_results,
                   const std::vector<std::pair<std::string, double>> &keyword_results,
                   const std::unordered_map<std::string, store::MemoryItem> &entries,
                   const std::size_t limit) const {
  std::unordered_map<std::string, double> vector_by_key;
  std::unordered_map<std::string, double> keyword_by_key;

  for (const auto &result : vector_results) {
    vector_by_key[result.id] = result.score;
  }
  double max_keyword = 0.0;
  for (const auto &[key, score] : keyword_results) {
    keyword_by_key[key] = score;
    max_keyword = std::max(max_keyword, score);
  }

  // Without vector evidence the keyword signal carries the vector share.
  const double vector_weight = vector_results.empty() ? 0.0 : vector_weight_;
  const double keyword_weight =
      vector_results.empty() ? keyword_weight_ + vector_weight_ : keyword_weight_;

  std::vector<ScoredItem> ranked;
  ranked.reserve(entries.size());

  for (const auto &[key, entry] : entries) {
    const double vec = vector_by_key.contains(key) ? vector_by_key.at(key) : 0.0;
    const double raw_kw = keyword_by_key.contains(key) ? keyword_by_key.at(key) : 0.0;
    if (vec <= 0.0 && raw_kw <= 0.0) {
      continue;
    }
    const double kw = max_keyword > 0.0 ? raw_kw / max_keyword : 0.0;
    const double rec = common::recency_score(entry.updated_at, half_life_days_);

    ScoredItem result;
    result.item = entry;
    result.vector_score = vec;
    result.keyword_score = kw;
    result.recency = rec;
    result.score = vector_weight * vec + keyword_weight * kw + recency_weight_ * rec;
    ranked.push_back(std::move(result));
  }

  std::sort(ranked.begin(), ranked.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.score != rhs.score ? lhs.score > rhs.score : lhs.item.id < rhs.item.id;
  });

  if (ranked.size() > limit) {
    ranked.resize(limit);
  }
  return ranked;
}

} // namespace strata::pipeline
