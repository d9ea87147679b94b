#pragma once

#include "strata/common/result.hpp"
#include "strata/config/schema.hpp"
#include "strata/scope/scope.hpp"
#include "strata/vector/vector_index.hpp"

#include <memory>

namespace strata::vector {

/// Builds the configured index. Success with nullptr means the deployment declares no
/// vector index (`none`); retrieval then routes lexically.
[[nodiscard]] common::Result<std::shared_ptr<IVectorIndex>>
create_vector_index(const config::Config &config, const scope::ScopeSchema &schema,
                    std::size_t dimensions);

} // namespace strata::vector
