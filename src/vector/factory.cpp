#include "strata/vector/factory.hpp"

#include "strata/common/fs.hpp"
#include "strata/vector/sqlite_vector_index.hpp"

namespace strata::vector {

common::Result<std::shared_ptr<IVectorIndex>>
create_vector_index(const config::Config &config, const scope::ScopeSchema &schema,
                    const std::size_t dimensions) {
  using R = common::Result<std::shared_ptr<IVectorIndex>>;
  const std::string backend = common::to_lower(common::trim(config.vector.backend));

  if (backend == "none") {
    return R::success(nullptr);
  }
  if (dimensions == 0) {
    return R::failure(common::ErrorKind::Validation, "vector index needs non-zero dimensions");
  }

  if (backend == "brute_force") {
    return R::success(std::make_shared<BruteForceVectorIndex>(dimensions));
  }

  if (backend == "sqlite") {
    const std::string path =
        config.vector.path.empty() ? config.store.path + ".vectors" : config.vector.path;
    auto index = std::make_shared<SqliteVectorIndex>(common::expand_path(path), schema,
                                                     dimensions, config.store.busy_timeout_ms);
    auto opened = index->open();
    if (!opened.ok()) {
      return R::failure(opened.error_info());
    }
    return R::success(std::move(index));
  }

  return R::failure(common::ErrorKind::Validation, "unknown vector backend: " + backend);
}

} // namespace strata::vector
