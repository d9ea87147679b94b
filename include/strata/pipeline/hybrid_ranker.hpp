#pragma once

#include "strata/pipeline/state.hpp"
#include "strata/vector/vector_index.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata::pipeline {

/// Weighted blend of vector similarity, normalized keyword score and recency. Entries
/// with neither a vector nor a keyword signal are dropped.
class HybridRanker {
public:
  HybridRanker(double vector_weight, double keyword_weight, double recency_weight,
               double half_life_days);

  [[nodiscard]] std::vector<ScoredItem>
  rank(const std::vector<vector::VectorHit> &vector_results,
       const std::vector<std::pair<std::string, double>> &keyword_results,
       const std::unordered_map<std::string, store::MemoryItem> &entries,
       std::size_t limit) const;

private:
  double vector_weight_;
  double keyword_weight_;
  double recency_weight_;
  double half_life_days_;
};

} // namespace strata::pipeline
