#pragma once

#include "strata/common/result.hpp"
#include "strata/pipeline/step.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata::pipeline {

struct CategoryDefinition {
  std::string name;
  std::string description;
};

/// Parses "name: description" entries; entries without a description keep an empty one.
[[nodiscard]] std::vector<CategoryDefinition>
parse_category_definitions(const std::vector<std::string> &entries);

/// Scores items against the scope's categories and the configured defaults. Default
/// categories are materialized only when an item is first assigned to them.
class CategoryAssigner {
public:
  CategoryAssigner(const StepServices &services, scope::ScopeKey scope, double threshold,
                   std::size_t max_per_item, std::string fallback);

  [[nodiscard]] common::Status load();

  /// Category ids for the item, best first; falls back to the fallback category.
  [[nodiscard]] common::Result<std::vector<std::string>>
  assign(const store::MemoryItem &item, const std::vector<std::string> &hints);

  [[nodiscard]] store::MemoryCategory *find(const std::string &id);
  [[nodiscard]] std::vector<std::string> names() const;
  /// Categories created since load().
  [[nodiscard]] std::vector<store::MemoryCategory> created() const;
  [[nodiscard]] bool is_new(const std::string &id) const;

private:
  struct Entry {
    store::MemoryCategory category;
    bool exists = false;
    std::set<std::string> terms;
  };

  [[nodiscard]] double score(const Entry &entry, const store::MemoryItem &item,
                             const std::set<std::string> &item_terms,
                             const std::vector<std::string> &hints) const;
  [[nodiscard]] common::Status materialize(Entry &entry);
  [[nodiscard]] Entry *entry_by_name(const std::string &name);

  const StepServices &services_;
  scope::ScopeKey scope_;
  double threshold_;
  std::size_t max_per_item_;
  std::string fallback_;
  std::vector<Entry> entries_;
};

/// Embeds "name: description" for category routing.
[[nodiscard]] std::string category_embedding_text(const store::MemoryCategory &category);

/// Rolling summary through the extraction capability, or a joined digest without one.
[[nodiscard]] common::Result<std::string> summarize_texts(const StepServices &services,
                                                          const std::string &topic,
                                                          const std::vector<std::string> &texts,
                                                          std::size_t target_length);

[[nodiscard]] bool is_goal_text(const std::string &text);
[[nodiscard]] bool is_constraint_text(const std::string &text);

/// Folds goal and constraint statements from `items` into the intention. Returns nullopt
/// when nothing changes.
[[nodiscard]] std::optional<store::Intention>
fold_intention(const std::optional<store::Intention> &existing, const scope::ScopeKey &scope,
               const std::vector<store::MemoryItem> &items, std::size_t max_entries);

/// Rebuilds goals and constraints from the scope's active items.
[[nodiscard]] std::optional<store::Intention>
rebuild_intention(const std::optional<store::Intention> &existing, const scope::ScopeKey &scope,
                  const std::vector<store::MemoryItem> &active_items, std::size_t max_entries);

} // namespace strata::pipeline
