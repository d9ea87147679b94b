#pragma once

#include "strata/common/result.hpp"

#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace strata::store::sqlite {

/// Prepared statement finalized on scope exit.
class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql);
  ~Statement();
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return rc_ == SQLITE_OK; }
  [[nodiscard]] int rc() const { return rc_; }
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }

private:
  sqlite3_stmt *stmt_ = nullptr;
  int rc_ = SQLITE_OK;
};

/// Busy/locked map to TransientStore, constraint failures to Validation.
[[nodiscard]] common::Status error_status(sqlite3 *db, int rc, const std::string &context);
[[nodiscard]] common::Status exec(sqlite3 *db, const std::string &sql);

[[nodiscard]] std::string column_text(sqlite3_stmt *stmt, int column);
[[nodiscard]] std::optional<std::string> column_optional_text(sqlite3_stmt *stmt, int column);
[[nodiscard]] std::vector<float> column_vector(sqlite3_stmt *stmt, int column);

void bind_text(sqlite3_stmt *stmt, int index, const std::string &value);
void bind_optional_text(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value);
void bind_vector(sqlite3_stmt *stmt, int index, const std::vector<float> &values);
void bind_params(sqlite3_stmt *stmt, const std::vector<std::string> &params);

} // namespace strata::store::sqlite
