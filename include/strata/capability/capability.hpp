#pragma once

#include "strata/common/result.hpp"

#include <initializer_list>
#include <set>
#include <string>
#include <string_view>

namespace strata::capability {

/// External capabilities a pipeline step may depend on.
enum class Capability {
  Llm,
  Embedding,
  VectorQuery,
  StoreWrite,
  Blob,
};

[[nodiscard]] std::string capability_to_string(Capability capability);
[[nodiscard]] common::Result<Capability> capability_from_string(std::string_view value);

/// Capabilities configured for a deployment.
class CapabilitySet {
public:
  CapabilitySet() = default;
  CapabilitySet(std::initializer_list<Capability> capabilities) : set_(capabilities) {}

  void add(Capability capability) { set_.insert(capability); }
  void remove(Capability capability) { set_.erase(capability); }
  [[nodiscard]] bool has(Capability capability) const { return set_.contains(capability); }
  [[nodiscard]] const std::set<Capability> &all() const { return set_; }
  [[nodiscard]] std::string describe() const;

private:
  std::set<Capability> set_;
};

} // namespace strata::capability
