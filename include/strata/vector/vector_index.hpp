#pragma once

#include "strata/common/result.hpp"
#include "strata/scope/scope.hpp"

#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata::vector {

enum class EntityKind { Item, Resource, Category };

[[nodiscard]] std::string entity_kind_to_string(EntityKind kind);

struct VectorHit {
  scope::ScopeKey scope;
  std::string id;
  float distance = 0.0F;
  // Cosine similarity clamped to [0, 1].
  float score = 0.0F;
};

/// Scoped similarity index. Every query is bounded by a selector; nothing is returned
/// from a scope the selector does not match.
class IVectorIndex {
public:
  virtual ~IVectorIndex() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;

  [[nodiscard]] virtual common::Status upsert(const scope::ScopeKey &scope, EntityKind kind,
                                              const std::string &id,
                                              const std::vector<float> &embedding) = 0;
  [[nodiscard]] virtual common::Status remove(const scope::ScopeKey &scope, EntityKind kind,
                                              const std::string &id) = 0;
  [[nodiscard]] virtual common::Result<std::vector<VectorHit>>
  query(const scope::ScopeSelector &selector, EntityKind kind, const std::vector<float> &query,
        std::size_t limit) = 0;
  [[nodiscard]] virtual common::Status purge(const scope::ScopeKey &scope) = 0;
  [[nodiscard]] virtual std::size_t size() = 0;
};

[[nodiscard]] float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

/// Full scan over in-process vectors, partitioned by scope.
class BruteForceVectorIndex final : public IVectorIndex {
public:
  explicit BruteForceVectorIndex(std::size_t dimensions, std::size_t max_elements = 1'000'000);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::size_t dimensions() const override;
  [[nodiscard]] common::Status upsert(const scope::ScopeKey &scope, EntityKind kind,
                                      const std::string &id,
                                      const std::vector<float> &embedding) override;
  [[nodiscard]] common::Status remove(const scope::ScopeKey &scope, EntityKind kind,
                                      const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<VectorHit>>
  query(const scope::ScopeSelector &selector, EntityKind kind, const std::vector<float> &query,
        std::size_t limit) override;
  [[nodiscard]] common::Status purge(const scope::ScopeKey &scope) override;
  [[nodiscard]] std::size_t size() override;

private:
  struct Partition {
    scope::ScopeKey key;
    std::map<std::pair<EntityKind, std::string>, std::vector<float>> vectors;
  };

  std::size_t dimensions_;
  std::size_t max_elements_;
  std::size_t count_ = 0;
  std::unordered_map<std::string, Partition> partitions_;
  std::shared_mutex mutex_;
};

/// Sorts by descending score (ties by id) and truncates.
void rank_hits(std::vector<VectorHit> &hits, std::size_t limit);

} // namespace strata::vector
