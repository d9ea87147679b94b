#pragma once

#include "strata/common/result.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace strata::scope {

enum class FieldType { String, Integer };

[[nodiscard]] std::string field_type_to_string(FieldType type);

struct ScopeField {
  std::string name;
  FieldType type = FieldType::String;
};

/// Ordered tenant identity schema. Field order is significant and fixed at provisioning.
class ScopeSchema {
public:
  ScopeSchema() = default;
  explicit ScopeSchema(std::vector<ScopeField> fields);

  /// Parses "project_id:string, agent_id:string" or a list of "name:type" entries.
  [[nodiscard]] static common::Result<ScopeSchema> parse(const std::string &description);
  [[nodiscard]] static common::Result<ScopeSchema>
  parse(const std::vector<std::string> &field_specs);

  [[nodiscard]] const std::vector<ScopeField> &fields() const { return fields_; }
  [[nodiscard]] std::size_t size() const { return fields_.size(); }
  [[nodiscard]] bool empty() const { return fields_.empty(); }
  [[nodiscard]] const ScopeField *find(const std::string &name) const;

  /// Canonical "name:type,..." text; the fingerprint is its SHA-256.
  [[nodiscard]] std::string describe() const;
  [[nodiscard]] std::string fingerprint() const;

private:
  std::vector<ScopeField> fields_;
};

/// Caller-supplied scope values, keyed by field name in any order.
using ScopeValues = std::map<std::string, std::string>;

/// A validated scope: values ordered exactly as the provisioned schema.
class ScopeKey {
public:
  ScopeKey() = default;
  explicit ScopeKey(std::vector<std::pair<std::string, std::string>> entries);

  [[nodiscard]] const std::vector<std::pair<std::string, std::string>> &entries() const {
    return entries_;
  }
  [[nodiscard]] std::vector<std::string> values() const;
  [[nodiscard]] std::string value(const std::string &field) const;

  /// Stable partition identifier used for map keys and lock names.
  [[nodiscard]] const std::string &id() const { return id_; }
  /// Human-readable "field=value,..." form.
  [[nodiscard]] std::string to_string() const;

  bool operator==(const ScopeKey &other) const { return id_ == other.id_; }
  bool operator!=(const ScopeKey &other) const { return id_ != other.id_; }
  bool operator<(const ScopeKey &other) const { return id_ < other.id_; }

private:
  std::vector<std::pair<std::string, std::string>> entries_;
  std::string id_;
};

enum class MatchMode { Exact, AnyOf, Wildcard };

struct FieldMatch {
  MatchMode mode = MatchMode::Exact;
  std::vector<std::string> values;

  [[nodiscard]] static FieldMatch exact(std::string value);
  [[nodiscard]] static FieldMatch any_of(std::vector<std::string> values);
  [[nodiscard]] static FieldMatch wildcard();
};

/// Caller-supplied selector, keyed by field name.
using SelectorSpec = std::map<std::string, FieldMatch>;

/// A validated cross-scope selector, one match per schema field in schema order.
class ScopeSelector {
public:
  ScopeSelector() = default;
  explicit ScopeSelector(std::vector<std::pair<std::string, FieldMatch>> matches);

  [[nodiscard]] static ScopeSelector for_key(const ScopeKey &key);

  [[nodiscard]] const std::vector<std::pair<std::string, FieldMatch>> &matches() const {
    return matches_;
  }
  [[nodiscard]] bool matches(const ScopeKey &key) const;
  [[nodiscard]] bool is_single_exact() const;
  [[nodiscard]] bool all_wildcard() const;
  [[nodiscard]] bool has_wildcard() const;

  /// Number of concrete combinations over the non-wildcard fields.
  [[nodiscard]] std::size_t combination_count() const;
  /// Concrete keys; only meaningful when no field is a wildcard.
  [[nodiscard]] std::vector<ScopeKey> expand() const;

  /// Field-shaped label, e.g. "project=p1,agent={a1|a2}" or "agent=*".
  [[nodiscard]] std::string to_string() const;
  /// The label as a ScopeKey, used to stamp run logs of cross-scope requests.
  [[nodiscard]] ScopeKey label_key() const;

private:
  std::vector<std::pair<std::string, FieldMatch>> matches_;
};

[[nodiscard]] bool is_identifier(const std::string &value);

} // namespace strata::scope
