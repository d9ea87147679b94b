#pragma once

#include "strata/common/result.hpp"
#include "strata/config/schema.hpp"
#include "strata/store/metadata_store.hpp"

#include <memory>

namespace strata::store {

/// Builds and opens the configured metadata backend (`memory` or `sqlite`).
[[nodiscard]] common::Result<std::shared_ptr<IMetadataStore>>
create_metadata_store(const config::Config &config);

} // namespace strata::store
