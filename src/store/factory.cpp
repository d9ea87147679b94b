#include "strata/store/factory.hpp"

#include "strata/common/fs.hpp"
#include "strata/store/memory_store.hpp"
#include "strata/store/sqlite_store.hpp"

namespace strata::store {

common::Result<std::shared_ptr<IMetadataStore>>
create_metadata_store(const config::Config &config) {
  using R = common::Result<std::shared_ptr<IMetadataStore>>;
  const std::string backend = common::to_lower(common::trim(config.store.backend));

  if (backend == "memory") {
    return R::success(std::make_shared<InMemoryStore>());
  }

  if (backend == "sqlite") {
    auto store = std::make_shared<SqliteStore>(common::expand_path(config.store.path),
                                               config.store.busy_timeout_ms);
    auto opened = store->open();
    if (!opened.ok()) {
      return R::failure(opened.error_info());
    }
    return R::success(std::move(store));
  }

  return R::failure(common::ErrorKind::Validation, "unknown store backend: " + backend);
}

} // namespace strata::store
