#include "strata/pipeline/taxonomy.hpp"

#include "strata/capability/extractor_rule.hpp"
#include "strata/common/fs.hpp"
#include "strata/common/hash.hpp"
#include "strata/common/text.hpp"
#include "strata/common/time.hpp"
#include "strata/observability/global.hpp"

#include <algorithm>
#include <utility>

namespace strata::pipeline {

namespace {

const std::vector<std::string> &goal_markers() {
  static const std::vector<std::string> markers = {
      "my goal", "want to", "plan to", "planning to", "trying to", "aim to", "hope to",
      "aspire", "would like to", "intend to", "working toward", "working towards"};
  return markers;
}

const std::vector<std::string> &constraint_markers() {
  static const std::vector<std::string> markers = {
      "must not", "must", "never", "don't", "do not", "cannot", "can't", "allergic",
      "avoid", "not allowed", "budget", "deadline", "only use", "have to"};
  return markers;
}

bool contains_marker(const std::string &text, const std::vector<std::string> &markers) {
  const std::string lowered = " " + common::normalize_whitespace(text) + " ";
  for (const auto &marker : markers) {
    if (lowered.find(" " + marker + " ") != std::string::npos ||
        lowered.find(" " + marker + ",") != std::string::npos ||
        lowered.find(" " + marker + ".") != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool contains_normalized(const std::vector<std::string> &values, const std::string &text) {
  const std::string key = common::normalize_whitespace(text);
  return std::any_of(values.begin(), values.end(), [&](const std::string &value) {
    return common::normalize_whitespace(value) == key;
  });
}

void cap_front(std::vector<std::string> &values, const std::size_t max_entries) {
  if (max_entries > 0 && values.size() > max_entries) {
    values.erase(values.begin(),
                 values.begin() + static_cast<std::ptrdiff_t>(values.size() - max_entries));
  }
}

std::string intention_summary(const store::Intention &intention) {
  std::string summary;
  if (!intention.goals.empty()) {
    summary += "Goals: " + common::join(intention.goals, "; ") + ".";
  }
  if (!intention.constraints.empty()) {
    if (!summary.empty()) {
      summary += " ";
    }
    summary += "Constraints: " + common::join(intention.constraints, "; ") + ".";
  }
  return summary;
}

std::set<std::string> name_terms(const std::string &name) {
  std::string spaced = name;
  std::replace(spaced.begin(), spaced.end(), '_', ' ');
  return common::content_term_set(spaced);
}

} // namespace

std::vector<CategoryDefinition>
parse_category_definitions(const std::vector<std::string> &entries) {
  std::vector<CategoryDefinition> definitions;
  for (const auto &entry : entries) {
    const auto colon = entry.find(':');
    CategoryDefinition definition;
    definition.name = common::to_lower(common::trim(entry.substr(0, colon)));
    if (colon != std::string::npos) {
      definition.description = common::trim(entry.substr(colon + 1));
    }
    if (definition.name.empty()) {
      continue;
    }
    const bool duplicate =
        std::any_of(definitions.begin(), definitions.end(),
                    [&](const CategoryDefinition &d) { return d.name == definition.name; });
    if (!duplicate) {
      definitions.push_back(std::move(definition));
    }
  }
  return definitions;
}

std::string category_embedding_text(const store::MemoryCategory &category) {
  std::string name = category.name;
  std::replace(name.begin(), name.end(), '_', ' ');
  return category.description.empty() ? name : name + ": " + category.description;
}

CategoryAssigner::CategoryAssigner(const StepServices &services, scope::ScopeKey scope,
                                   const double threshold, const std::size_t max_per_item,
                                   std::string fallback)
    : services_(services), scope_(std::move(scope)), threshold_(threshold),
      max_per_item_(std::max<std::size_t>(1, max_per_item)), fallback_(std::move(fallback)) {}

common::Status CategoryAssigner::load() {
  entries_.clear();
  auto existing = services_.store->list_categories(scope::ScopeSelector::for_key(scope_), {});
  if (!existing.ok()) {
    return common::Status::error(existing.error_info());
  }
  for (auto &category : existing.value()) {
    Entry entry;
    entry.terms = name_terms(category.name);
    for (const auto &term : common::content_term_set(category.description)) {
      entry.terms.insert(term);
    }
    entry.category = std::move(category);
    entry.exists = true;
    entries_.push_back(std::move(entry));
  }

  auto definitions = parse_category_definitions(services_.config->memorize.categories);
  if (!fallback_.empty() &&
      std::none_of(definitions.begin(), definitions.end(),
                   [&](const CategoryDefinition &d) { return d.name == fallback_; })) {
    definitions.push_back(CategoryDefinition{.name = fallback_, .description = ""});
  }
  for (const auto &definition : definitions) {
    if (entry_by_name(definition.name) != nullptr) {
      continue;
    }
    Entry entry;
    entry.category.scope = scope_;
    entry.category.name = definition.name;
    entry.category.description = definition.description;
    entry.terms = name_terms(definition.name);
    for (const auto &term : common::content_term_set(definition.description)) {
      entry.terms.insert(term);
    }
    entries_.push_back(std::move(entry));
  }

  if (services_.embedder) {
    for (auto &entry : entries_) {
      if (!entry.category.embedding.empty()) {
        continue;
      }
      auto embedded = services_.embedder->embed(category_embedding_text(entry.category));
      if (!embedded.ok()) {
        return common::Status::error(embedded.error_info());
      }
      entry.category.embedding = std::move(embedded.value());
    }
  }
  return common::Status::success();
}

double CategoryAssigner::score(const Entry &entry, const store::MemoryItem &item,
                               const std::set<std::string> &item_terms,
                               const std::vector<std::string> &hints) const {
  if (std::find(hints.begin(), hints.end(), entry.category.name) != hints.end()) {
    return 1.0;
  }
  double lexical = 0.0;
  if (!item_terms.empty()) {
    std::size_t overlap = 0;
    for (const auto &term : item_terms) {
      if (entry.terms.contains(term)) {
        ++overlap;
      }
    }
    lexical = static_cast<double>(overlap) / static_cast<double>(item_terms.size());
  }
  double semantic = 0.0;
  if (!item.embedding.empty() && item.embedding.size() == entry.category.embedding.size()) {
    semantic = std::max(0.0F, vector::cosine_similarity(item.embedding, entry.category.embedding));
  }
  return std::max(lexical, semantic);
}

common::Result<std::vector<std::string>>
CategoryAssigner::assign(const store::MemoryItem &item, const std::vector<std::string> &hints) {
  const auto item_terms = common::content_term_set(item.text);

  std::vector<std::pair<double, std::size_t>> scored;
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const double value = score(entries_[i], item, item_terms, hints);
    if (value >= threshold_) {
      scored.emplace_back(value, i);
    }
  }
  std::sort(scored.begin(), scored.end(), [&](const auto &lhs, const auto &rhs) {
    if (lhs.first != rhs.first) {
      return lhs.first > rhs.first;
    }
    return entries_[lhs.second].category.name < entries_[rhs.second].category.name;
  });
  if (scored.size() > max_per_item_) {
    scored.resize(max_per_item_);
  }

  std::vector<std::size_t> chosen;
  for (const auto &[value, index] : scored) {
    chosen.push_back(index);
  }
  if (chosen.empty()) {
    Entry *fallback = entry_by_name(fallback_);
    if (fallback == nullptr) {
      return common::Result<std::vector<std::string>>::success({});
    }
    chosen.push_back(static_cast<std::size_t>(fallback - entries_.data()));
  }

  std::vector<std::string> ids;
  for (const auto index : chosen) {
    Entry &entry = entries_[index];
    if (entry.category.id.empty()) {
      const auto status = materialize(entry);
      if (!status.ok()) {
        return common::Result<std::vector<std::string>>::failure(status.error_info());
      }
    }
    ids.push_back(entry.category.id);
  }
  return common::Result<std::vector<std::string>>::success(std::move(ids));
}

common::Status CategoryAssigner::materialize(Entry &entry) {
  const std::string now = common::now_rfc3339();
  entry.category.id = common::random_id("cat_");
  entry.category.scope = scope_;
  entry.category.created_at = now;
  entry.category.updated_at = now;
  return common::Status::success();
}

store::MemoryCategory *CategoryAssigner::find(const std::string &id) {
  for (auto &entry : entries_) {
    if (!entry.category.id.empty() && entry.category.id == id) {
      return &entry.category;
    }
  }
  return nullptr;
}

CategoryAssigner::Entry *CategoryAssigner::entry_by_name(const std::string &name) {
  for (auto &entry : entries_) {
    if (entry.category.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

std::vector<std::string> CategoryAssigner::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &entry : entries_) {
    out.push_back(entry.category.name);
  }
  return out;
}

std::vector<store::MemoryCategory> CategoryAssigner::created() const {
  std::vector<store::MemoryCategory> out;
  for (const auto &entry : entries_) {
    if (!entry.exists && !entry.category.id.empty()) {
      out.push_back(entry.category);
    }
  }
  return out;
}

bool CategoryAssigner::is_new(const std::string &id) const {
  return std::any_of(entries_.begin(), entries_.end(), [&](const Entry &entry) {
    return !entry.exists && entry.category.id == id;
  });
}

common::Result<std::string> summarize_texts(const StepServices &services,
                                            const std::string &topic,
                                            const std::vector<std::string> &texts,
                                            const std::size_t target_length) {
  if (services.extractor) {
    auto summary = services.extractor->summarize(topic, texts, target_length);
    if (summary.ok() || common::is_retryable(summary.kind())) {
      return summary;
    }
    observability::record_error("summarize", summary.error());
  }
  capability::RuleExtractor digest;
  return digest.summarize(topic, texts, target_length);
}

bool is_goal_text(const std::string &text) { return contains_marker(text, goal_markers()); }

bool is_constraint_text(const std::string &text) {
  return contains_marker(text, constraint_markers());
}

std::optional<store::Intention> fold_intention(const std::optional<store::Intention> &existing,
                                               const scope::ScopeKey &scope,
                                               const std::vector<store::MemoryItem> &items,
                                               const std::size_t max_entries) {
  store::Intention intention = existing.value_or(store::Intention{.scope = scope});
  bool changed = false;
  for (const auto &item : items) {
    std::vector<std::string> *target = nullptr;
    if (is_constraint_text(item.text)) {
      target = &intention.constraints;
    } else if (is_goal_text(item.text)) {
      target = &intention.goals;
    }
    if (target == nullptr || contains_normalized(*target, item.text)) {
      continue;
    }
    target->push_back(item.text);
    intention.source_items.push_back(item.id);
    changed = true;
  }
  if (!changed) {
    return std::nullopt;
  }
  cap_front(intention.goals, max_entries);
  cap_front(intention.constraints, max_entries);
  cap_front(intention.source_items, max_entries * 2);
  intention.scope = scope;
  intention.summary = intention_summary(intention);
  intention.version += 1;
  intention.updated_at = common::now_rfc3339();
  return intention;
}

std::optional<store::Intention>
rebuild_intention(const std::optional<store::Intention> &existing, const scope::ScopeKey &scope,
                  const std::vector<store::MemoryItem> &active_items,
                  const std::size_t max_entries) {
  std::vector<store::MemoryItem> ordered = active_items;
  std::sort(ordered.begin(), ordered.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.created_at != rhs.created_at ? lhs.created_at < rhs.created_at
                                            : lhs.id < rhs.id;
  });

  store::Intention rebuilt{.scope = scope};
  auto folded = fold_intention(std::nullopt, scope, ordered, max_entries);
  if (folded.has_value()) {
    rebuilt = std::move(*folded);
  }
  if (!existing.has_value() && rebuilt.goals.empty() && rebuilt.constraints.empty()) {
    return std::nullopt;
  }
  if (existing.has_value() && existing->goals == rebuilt.goals &&
      existing->constraints == rebuilt.constraints) {
    return std::nullopt;
  }
  rebuilt.version = existing.has_value() ? existing->version + 1 : 1;
  rebuilt.summary = intention_summary(rebuilt);
  rebuilt.updated_at = common::now_rfc3339();
  return rebuilt;
}

} // namespace strata::pipeline
