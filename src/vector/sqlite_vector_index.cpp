#include "strata/vector/sqlite_vector_index.hpp"

#include "strata/common/fs.hpp"
#include "strata/store/sqlite_util.hpp"

#include <algorithm>

namespace strata::vector {

namespace sql = store::sqlite;

SqliteVectorIndex::SqliteVectorIndex(std::filesystem::path db_path, scope::ScopeSchema schema,
                                     const std::size_t dimensions,
                                     const std::uint32_t busy_timeout_ms)
    : db_path_(std::move(db_path)), schema_(std::move(schema)), dimensions_(dimensions),
      busy_timeout_ms_(busy_timeout_ms) {}

SqliteVectorIndex::~SqliteVectorIndex() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

std::string_view SqliteVectorIndex::name() const { return "sqlite"; }

std::size_t SqliteVectorIndex::dimensions() const { return dimensions_; }

std::string SqliteVectorIndex::scope_columns() const {
  std::string out;
  for (const auto &field : schema_.fields()) {
    if (!out.empty()) {
      out += ", ";
    }
    out += "s_" + field.name;
  }
  return out;
}

std::string SqliteVectorIndex::scope_where(const scope::ScopeSelector &selector,
                                           std::vector<std::string> &params) const {
  std::string out;
  for (const auto &[field, match] : selector.matches()) {
    if (match.mode == scope::MatchMode::Wildcard) {
      continue;
    }
    out += " AND s_" + field + " IN (";
    for (std::size_t i = 0; i < match.values.size(); ++i) {
      out += i == 0 ? "?" : ",?";
      params.push_back(match.values[i]);
    }
    out += ")";
  }
  return out;
}

common::Status SqliteVectorIndex::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }
  if (schema_.empty()) {
    return common::Status::error(common::ErrorKind::Validation, "scope schema is empty");
  }
  if (db_path_.has_parent_path()) {
    auto dir = common::ensure_dir(db_path_.parent_path());
    if (!dir.ok()) {
      return common::Status::error(dir.error_info());
    }
  }

  const int rc = sqlite3_open_v2(db_path_.string().c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                     SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    auto status = sql::error_status(db_, rc, "failed to open " + db_path_.string());
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    return status;
  }
  sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms_));

  auto status = sql::exec(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  std::string columns;
  for (const auto &field : schema_.fields()) {
    columns += "  s_" + field.name + " TEXT NOT NULL,\n";
  }
  const std::string key = scope_columns();
  return sql::exec(db_, "CREATE TABLE IF NOT EXISTS vectors (\n" + columns +
                            "  kind TEXT NOT NULL,\n"
                            "  id TEXT NOT NULL,\n"
                            "  embedding BLOB NOT NULL,\n"
                            "  PRIMARY KEY (" +
                            key + ", kind, id)\n);");
}

common::Status SqliteVectorIndex::upsert(const scope::ScopeKey &scope, const EntityKind kind,
                                         const std::string &id,
                                         const std::vector<float> &embedding) {
  if (embedding.size() != dimensions_) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "embedding dimensions mismatch: expected " +
                                     std::to_string(dimensions_) + ", got " +
                                     std::to_string(embedding.size()));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Internal, "vector index not opened");
  }

  std::string marks;
  for (std::size_t i = 0; i < scope.entries().size(); ++i) {
    marks += "?,";
  }
  sql::Statement stmt(db_, "INSERT INTO vectors(" + scope_columns() +
                               ", kind, id, embedding) VALUES(" + marks +
                               "?,?,?) ON CONFLICT(" + scope_columns() +
                               ", kind, id) DO UPDATE SET embedding=excluded.embedding");
  if (!stmt.ok()) {
    return sql::error_status(db_, stmt.rc(), "upsert vector");
  }
  int index = 1;
  for (const auto &[_, value] : scope.entries()) {
    sql::bind_text(stmt.get(), index++, value);
  }
  sql::bind_text(stmt.get(), index++, entity_kind_to_string(kind));
  sql::bind_text(stmt.get(), index++, id);
  sql::bind_vector(stmt.get(), index++, embedding);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return sql::error_status(db_, rc, "upsert vector");
  }
  return common::Status::success();
}

common::Status SqliteVectorIndex::remove(const scope::ScopeKey &scope, const EntityKind kind,
                                         const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Internal, "vector index not opened");
  }

  std::vector<std::string> params;
  const std::string where = scope_where(scope::ScopeSelector::for_key(scope), params);
  sql::Statement stmt(db_, "DELETE FROM vectors WHERE 1=1" + where + " AND kind = ? AND id = ?");
  if (!stmt.ok()) {
    return sql::error_status(db_, stmt.rc(), "remove vector");
  }
  params.push_back(entity_kind_to_string(kind));
  params.push_back(id);
  sql::bind_params(stmt.get(), params);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return sql::error_status(db_, rc, "remove vector");
  }
  return common::Status::success();
}

common::Result<std::vector<VectorHit>>
SqliteVectorIndex::query(const scope::ScopeSelector &selector, const EntityKind kind,
                         const std::vector<float> &query, const std::size_t limit) {
  using Out = common::Result<std::vector<VectorHit>>;
  if (query.size() != dimensions_) {
    return Out::failure(common::ErrorKind::Validation, "query dimensions mismatch");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Out::failure(common::ErrorKind::Internal, "vector index not opened");
  }

  std::vector<std::string> params;
  const std::string where = scope_where(selector, params);
  sql::Statement stmt(db_, "SELECT " + scope_columns() +
                               ", id, embedding FROM vectors WHERE 1=1" + where +
                               " AND kind = ?");
  if (!stmt.ok()) {
    return Out::failure(sql::error_status(db_, stmt.rc(), "query vectors").error_info());
  }
  params.push_back(entity_kind_to_string(kind));
  sql::bind_params(stmt.get(), params);

  const auto &fields = schema_.fields();
  const int base = static_cast<int>(fields.size());
  std::vector<VectorHit> hits;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    std::vector<std::pair<std::string, std::string>> entries;
    for (std::size_t i = 0; i < fields.size(); ++i) {
      entries.emplace_back(fields[i].name, sql::column_text(stmt.get(), static_cast<int>(i)));
    }
    const auto embedding = sql::column_vector(stmt.get(), base + 1);
    const float similarity = cosine_similarity(query, embedding);
    hits.push_back(VectorHit{
        .scope = scope::ScopeKey(std::move(entries)),
        .id = sql::column_text(stmt.get(), base),
        .distance = 1.0F - similarity,
        .score = std::clamp(similarity, 0.0F, 1.0F),
    });
  }
  if (rc != SQLITE_DONE) {
    return Out::failure(sql::error_status(db_, rc, "query vectors").error_info());
  }

  rank_hits(hits, limit);
  return Out::success(std::move(hits));
}

common::Status SqliteVectorIndex::purge(const scope::ScopeKey &scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Internal, "vector index not opened");
  }

  std::vector<std::string> params;
  const std::string where = scope_where(scope::ScopeSelector::for_key(scope), params);
  sql::Statement stmt(db_, "DELETE FROM vectors WHERE 1=1" + where);
  if (!stmt.ok()) {
    return sql::error_status(db_, stmt.rc(), "purge vectors");
  }
  sql::bind_params(stmt.get(), params);
  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return sql::error_status(db_, rc, "purge vectors");
  }
  return common::Status::success();
}

std::size_t SqliteVectorIndex::size() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return 0;
  }
  sql::Statement stmt(db_, "SELECT COUNT(*) FROM vectors");
  if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return 0;
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace strata::vector
