#include "strata/capability/capability.hpp"

namespace strata::capability {

std::string capability_to_string(const Capability capability) {
  switch (capability) {
  case Capability::Llm:
    return "llm";
  case Capability::Embedding:
    return "embedding";
  case Capability::VectorQuery:
    return "vector_query";
  case Capability::StoreWrite:
    return "store_write";
  case Capability::Blob:
    return "blob";
  }
  return "unknown";
}

common::Result<Capability> capability_from_string(const std::string_view value) {
  if (value == "llm") {
    return common::Result<Capability>::success(Capability::Llm);
  }
  if (value == "embedding") {
    return common::Result<Capability>::success(Capability::Embedding);
  }
  if (value == "vector_query") {
    return common::Result<Capability>::success(Capability::VectorQuery);
  }
  if (value == "store_write") {
    return common::Result<Capability>::success(Capability::StoreWrite);
  }
  if (value == "blob") {
    return common::Result<Capability>::success(Capability::Blob);
  }
  return common::Result<Capability>::failure(common::ErrorKind::Validation,
                                             "unknown capability: " + std::string(value));
}

std::string CapabilitySet::describe() const {
  std::string out;
  for (const auto capability : set_) {
    if (!out.empty()) {
      out += ",";
    }
    out += capability_to_string(capability);
  }
  return out;
}

} // namespace strata::capability
