#include "strata/store/metadata_store.hpp"

#include "strata/common/fs.hpp"

namespace strata::store {

bool WriteBatch::empty() const { return size() == 0; }

std::size_t WriteBatch::size() const {
  return resources_.size() + items_.size() + categories_.size() + links_.size() +
         unlinks_.size() + (intention_.has_value() ? 1U : 0U) + diffs_.size();
}

common::Result<std::optional<scope::ScopeKey>> WriteBatch::common_scope() const {
  using Out = common::Result<std::optional<scope::ScopeKey>>;
  std::optional<scope::ScopeKey> found;
  bool mixed = false;
  const auto visit = [&](const scope::ScopeKey &key) {
    if (!found.has_value()) {
      found = key;
    } else if (*found != key) {
      mixed = true;
    }
  };

  for (const auto &resource : resources_) {
    visit(resource.scope);
  }
  for (const auto &item : items_) {
    visit(item.scope);
  }
  for (const auto &category : categories_) {
    visit(category.scope);
  }
  for (const auto &link : links_) {
    visit(link.scope);
  }
  for (const auto &link : unlinks_) {
    visit(link.scope);
  }
  if (intention_.has_value()) {
    visit(intention_->scope);
  }
  for (const auto &diff : diffs_) {
    visit(diff.scope);
  }

  if (mixed) {
    return Out::failure(common::ErrorKind::Validation, "write batch spans more than one scope");
  }
  return Out::success(std::move(found));
}

bool matches_terms(const std::string &text, const std::vector<std::string> &terms) {
  if (terms.empty()) {
    return true;
  }
  const std::string lowered = common::to_lower(text);
  for (const auto &term : terms) {
    if (!term.empty() && lowered.find(common::to_lower(term)) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace strata::store
