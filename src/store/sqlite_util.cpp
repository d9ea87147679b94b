#include "strata/store/sqlite_util.hpp"

#include <cstring>

namespace strata::store::sqlite {

Statement::Statement(sqlite3 *db, const std::string &sql) {
  rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

common::Status error_status(sqlite3 *db, const int rc, const std::string &context) {
  const std::string message = context + ": " + (db == nullptr ? "no database" : sqlite3_errmsg(db));
  const int primary = rc & 0xff;
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    return common::Status::error(common::ErrorKind::TransientStore, message);
  }
  if (primary == SQLITE_CONSTRAINT) {
    return common::Status::error(common::ErrorKind::Validation, message);
  }
  return common::Status::error(common::ErrorKind::Internal, message);
}

common::Status exec(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return error_status(db, rc, msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? "" : reinterpret_cast<const char *>(text);
}

std::optional<std::string> column_optional_text(sqlite3_stmt *stmt, const int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, column);
}

std::vector<float> column_vector(sqlite3_stmt *stmt, const int column) {
  const void *blob = sqlite3_column_blob(stmt, column);
  const int bytes = sqlite3_column_bytes(stmt, column);
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }
  std::vector<float> values(static_cast<std::size_t>(bytes) / sizeof(float));
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt *stmt, const int index,
                        const std::optional<std::string> &value) {
  if (value.has_value()) {
    bind_text(stmt, index, *value);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

void bind_vector(sqlite3_stmt *stmt, const int index, const std::vector<float> &values) {
  if (values.empty()) {
    sqlite3_bind_null(stmt, index);
    return;
  }
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  std::memcpy(blob.data(), values.data(), blob.size());
  sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
}

void bind_params(sqlite3_stmt *stmt, const std::vector<std::string> &params) {
  for (std::size_t i = 0; i < params.size(); ++i) {
    bind_text(stmt, static_cast<int>(i + 1), params[i]);
  }
}

} // namespace strata::store::sqlite
