#include "strata/vector/vector_index.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace strata::vector {

std::string entity_kind_to_string(const EntityKind kind) {
  switch (kind) {
  case EntityKind::Item:
    return "item";
  case EntityKind::Resource:
    return "resource";
  case EntityKind::Category:
    return "category";
  }
  return "item";
}

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0F;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;

  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  if (norm_a < 1e-9 || norm_b < 1e-9) {
    return 0.0F;
  }

  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

void rank_hits(std::vector<VectorHit> &hits, const std::size_t limit) {
  std::sort(hits.begin(), hits.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.id < rhs.id;
  });
  if (hits.size() > limit) {
    hits.resize(limit);
  }
}

BruteForceVectorIndex::BruteForceVectorIndex(const std::size_t dimensions,
                                             const std::size_t max_elements)
    : dimensions_(dimensions), max_elements_(max_elements) {}

std::string_view BruteForceVectorIndex::name() const { return "brute_force"; }

std::size_t BruteForceVectorIndex::dimensions() const { return dimensions_; }

common::Status BruteForceVectorIndex::upsert(const scope::ScopeKey &scope, const EntityKind kind,
                                             const std::string &id,
                                             const std::vector<float> &embedding) {
  if (embedding.size() != dimensions_) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "embedding dimensions mismatch: expected " +
                                     std::to_string(dimensions_) + ", got " +
                                     std::to_string(embedding.size()));
  }

  std::unique_lock lock(mutex_);
  auto &partition = partitions_[scope.id()];
  partition.key = scope;
  const auto slot = std::make_pair(kind, id);
  const bool exists = partition.vectors.count(slot) > 0;
  if (!exists && count_ >= max_elements_) {
    return common::Status::error(common::ErrorKind::Internal, "vector index full");
  }
  partition.vectors[slot] = embedding;
  if (!exists) {
    ++count_;
  }
  return common::Status::success();
}

common::Status BruteForceVectorIndex::remove(const scope::ScopeKey &scope, const EntityKind kind,
                                             const std::string &id) {
  std::unique_lock lock(mutex_);
  const auto it = partitions_.find(scope.id());
  if (it != partitions_.end()) {
    count_ -= it->second.vectors.erase({kind, id});
  }
  return common::Status::success();
}

common::Result<std::vector<VectorHit>>
BruteForceVectorIndex::query(const scope::ScopeSelector &selector, const EntityKind kind,
                             const std::vector<float> &query, const std::size_t limit) {
  if (query.size() != dimensions_) {
    return common::Result<std::vector<VectorHit>>::failure(common::ErrorKind::Validation,
                                                           "query dimensions mismatch");
  }

  std::shared_lock lock(mutex_);
  std::vector<VectorHit> hits;
  for (const auto &[_, partition] : partitions_) {
    if (!selector.matches(partition.key)) {
      continue;
    }
    for (const auto &[slot, embedding] : partition.vectors) {
      if (slot.first != kind) {
        continue;
      }
      const float similarity = cosine_similarity(query, embedding);
      hits.push_back(VectorHit{
          .scope = partition.key,
          .id = slot.second,
          .distance = 1.0F - similarity,
          .score = std::clamp(similarity, 0.0F, 1.0F),
      });
    }
  }

  rank_hits(hits, limit);
  return common::Result<std::vector<VectorHit>>::success(std::move(hits));
}

common::Status BruteForceVectorIndex::purge(const scope::ScopeKey &scope) {
  std::unique_lock lock(mutex_);
  const auto it = partitions_.find(scope.id());
  if (it != partitions_.end()) {
    count_ -= it->second.vectors.size();
    partitions_.erase(it);
  }
  return common::Status::success();
}

std::size_t BruteForceVectorIndex::size() {
  std::shared_lock lock(mutex_);
  return count_;
}

} // namespace strata::vector
