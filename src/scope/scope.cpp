#include "strata/scope/scope.hpp"

#include "strata/common/fs.hpp"
#include "strata/common/hash.hpp"

#include <cctype>
#include <set>
#include <sstream>

namespace strata::scope {

namespace {

// Appends "<length>:<text>" so that no name or value can mimic a field boundary.
void append_framed(std::string &out, const std::string &text) {
  out += std::to_string(text.size());
  out.push_back(':');
  out += text;
}

std::string render_match(const FieldMatch &match) {
  switch (match.mode) {
  case MatchMode::Exact:
    return match.values.empty() ? "" : match.values.front();
  case MatchMode::AnyOf: {
    std::string out = "{";
    for (std::size_t i = 0; i < match.values.size(); ++i) {
      if (i > 0) {
        out += "|";
      }
      out += match.values[i];
    }
    return out + "}";
  }
  case MatchMode::Wildcard:
    return "*";
  }
  return "*";
}

} // namespace

std::string field_type_to_string(const FieldType type) {
  return type == FieldType::Integer ? "integer" : "string";
}

bool is_identifier(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(value.front())) != 0 || value.front() == '_')) {
    return false;
  }
  for (const char ch : value) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

ScopeSchema::ScopeSchema(std::vector<ScopeField> fields) : fields_(std::move(fields)) {}

common::Result<ScopeSchema> ScopeSchema::parse(const std::string &description) {
  std::vector<std::string> specs;
  std::stringstream stream(description);
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (!common::trim(part).empty()) {
      specs.push_back(part);
    }
  }
  return parse(specs);
}

common::Result<ScopeSchema> ScopeSchema::parse(const std::vector<std::string> &field_specs) {
  using Out = common::Result<ScopeSchema>;
  if (field_specs.empty()) {
    return Out::failure(common::ErrorKind::Validation, "scope schema needs at least one field");
  }

  std::vector<ScopeField> fields;
  std::set<std::string> seen;
  for (const auto &raw : field_specs) {
    const std::string spec = common::trim(raw);
    const auto colon = spec.find(':');
    const std::string name = common::trim(colon == std::string::npos ? spec : spec.substr(0, colon));
    const std::string type =
        colon == std::string::npos ? "string" : common::to_lower(common::trim(spec.substr(colon + 1)));

    if (!is_identifier(name)) {
      return Out::failure(common::ErrorKind::Validation, "invalid scope field name: '" + name + "'");
    }
    if (!seen.insert(name).second) {
      return Out::failure(common::ErrorKind::Validation, "duplicate scope field: " + name);
    }

    ScopeField field{.name = name};
    if (type == "string" || type == "str" || type == "text") {
      field.type = FieldType::String;
    } else if (type == "integer" || type == "int") {
      field.type = FieldType::Integer;
    } else {
      return Out::failure(common::ErrorKind::Validation,
                          "unsupported type '" + type + "' for scope field " + name);
    }
    fields.push_back(std::move(field));
  }
  return Out::success(ScopeSchema(std::move(fields)));
}

const ScopeField *ScopeSchema::find(const std::string &name) const {
  for (const auto &field : fields_) {
    if (field.name == name) {
      return &field;
    }
  }
  return nullptr;
}

std::string ScopeSchema::describe() const {
  std::string out;
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += fields_[i].name + ":" + field_type_to_string(fields_[i].type);
  }
  return out;
}

std::string ScopeSchema::fingerprint() const { return common::sha256_hex(describe()); }

ScopeKey::ScopeKey(std::vector<std::pair<std::string, std::string>> entries)
    : entries_(std::move(entries)) {
  for (const auto &[name, value] : entries_) {
    append_framed(id_, name);
    append_framed(id_, value);
  }
}

std::vector<std::string> ScopeKey::values() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[_, value] : entries_) {
    out.push_back(value);
  }
  return out;
}

std::string ScopeKey::value(const std::string &field) const {
  for (const auto &[name, value] : entries_) {
    if (name == field) {
      return value;
    }
  }
  return "";
}

std::string ScopeKey::to_string() const {
  std::string out;
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += entries_[i].first + "=" + entries_[i].second;
  }
  return out;
}

FieldMatch FieldMatch::exact(std::string value) {
  return FieldMatch{.mode = MatchMode::Exact, .values = {std::move(value)}};
}

FieldMatch FieldMatch::any_of(std::vector<std::string> values) {
  return FieldMatch{.mode = MatchMode::AnyOf, .values = std::move(values)};
}

FieldMatch FieldMatch::wildcard() { return FieldMatch{.mode = MatchMode::Wildcard, .values = {}}; }

ScopeSelector::ScopeSelector(std::vector<std::pair<std::string, FieldMatch>> matches)
    : matches_(std::move(matches)) {}

ScopeSelector ScopeSelector::for_key(const ScopeKey &key) {
  std::vector<std::pair<std::string, FieldMatch>> matches;
  for (const auto &[name, value] : key.entries()) {
    matches.emplace_back(name, FieldMatch::exact(value));
  }
  return ScopeSelector(std::move(matches));
}

bool ScopeSelector::matches(const ScopeKey &key) const {
  const auto &entries = key.entries();
  if (entries.size() != matches_.size()) {
    return false;
  }
  for (std::size_t i = 0; i < matches_.size(); ++i) {
    const auto &[name, match] = matches_[i];
    if (entries[i].first != name) {
      return false;
    }
    if (match.mode == MatchMode::Wildcard) {
      continue;
    }
    bool hit = false;
    for (const auto &value : match.values) {
      if (value == entries[i].second) {
        hit = true;
        break;
      }
    }
    if (!hit) {
      return false;
    }
  }
  return true;
}

bool ScopeSelector::is_single_exact() const {
  for (const auto &[_, match] : matches_) {
    if (match.mode == MatchMode::Wildcard || match.values.size() != 1) {
      return false;
    }
  }
  return !matches_.empty();
}

bool ScopeSelector::all_wildcard() const {
  for (const auto &[_, match] : matches_) {
    if (match.mode != MatchMode::Wildcard) {
      return false;
    }
  }
  return true;
}

bool ScopeSelector::has_wildcard() const {
  for (const auto &[_, match] : matches_) {
    if (match.mode == MatchMode::Wildcard) {
      return true;
    }
  }
  return false;
}

std::size_t ScopeSelector::combination_count() const {
  std::size_t count = 1;
  for (const auto &[_, match] : matches_) {
    if (match.mode == MatchMode::Wildcard) {
      continue;
    }
    count *= match.values.size();
  }
  return count;
}

std::vector<ScopeKey> ScopeSelector::expand() const {
  std::vector<std::vector<std::pair<std::string, std::string>>> partial = {{}};
  for (const auto &[name, match] : matches_) {
    if (match.mode == MatchMode::Wildcard) {
      return {};
    }
    std::vector<std::vector<std::pair<std::string, std::string>>> next;
    next.reserve(partial.size() * match.values.size());
    for (const auto &prefix : partial) {
      for (const auto &value : match.values) {
        auto extended = prefix;
        extended.emplace_back(name, value);
        next.push_back(std::move(extended));
      }
    }
    partial = std::move(next);
  }

  std::vector<ScopeKey> keys;
  keys.reserve(partial.size());
  for (auto &entries : partial) {
    keys.emplace_back(std::move(entries));
  }
  return keys;
}

std::string ScopeSelector::to_string() const {
  std::string out;
  for (std::size_t i = 0; i < matches_.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += matches_[i].first + "=" + render_match(matches_[i].second);
  }
  return out;
}

ScopeKey ScopeSelector::label_key() const {
  std::vector<std::pair<std::string, std::string>> entries;
  for (const auto &[name, match] : matches_) {
    entries.emplace_back(name, render_match(match));
  }
  return ScopeKey(std::move(entries));
}

} // namespace strata::scope
