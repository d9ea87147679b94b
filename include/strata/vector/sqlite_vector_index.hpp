#pragma once

#include "strata/vector/vector_index.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace strata::vector {

/// Embeddings persisted in a scope-prefixed SQLite table; queries scan the rows the
/// selector admits and score them in process.
class SqliteVectorIndex final : public IVectorIndex {
public:
  SqliteVectorIndex(std::filesystem::path db_path, scope::ScopeSchema schema,
                    std::size_t dimensions, std::uint32_t busy_timeout_ms);
  ~SqliteVectorIndex() override;

  SqliteVectorIndex(const SqliteVectorIndex &) = delete;
  SqliteVectorIndex &operator=(const SqliteVectorIndex &) = delete;

  [[nodiscard]] common::Status open();

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::size_t dimensions() const override;
  [[nodiscard]] common::Status upsert(const scope::ScopeKey &scope, EntityKind kind,
                                      const std::string &id,
                                      const std::vector<float> &embedding) override;
  [[nodiscard]] common::Status remove(const scope::ScopeKey &scope, EntityKind kind,
                                      const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<VectorHit>>
  query(const scope::ScopeSelector &selector, EntityKind kind, const std::vector<float> &query,
        std::size_t limit) override;
  [[nodiscard]] common::Status purge(const scope::ScopeKey &scope) override;
  [[nodiscard]] std::size_t size() override;

private:
  [[nodiscard]] std::string scope_columns() const;
  [[nodiscard]] std::string scope_where(const scope::ScopeSelector &selector,
                                        std::vector<std::string> &params) const;

  std::filesystem::path db_path_;
  scope::ScopeSchema schema_;
  std::size_t dimensions_;
  std::uint32_t busy_timeout_ms_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace strata::vector
