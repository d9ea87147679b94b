#include "strata/store/sqlite_store.hpp"

#include "strata/common/fs.hpp"
#include "strata/common/text.hpp"
#include "strata/store/sqlite_util.hpp"

namespace strata::store {

namespace {

using sqlite::bind_optional_text;
using sqlite::bind_params;
using sqlite::bind_text;
using sqlite::bind_vector;
using sqlite::column_optional_text;
using sqlite::column_text;
using sqlite::column_vector;
using sqlite::Statement;

int bind_scope(sqlite3_stmt *stmt, const scope::ScopeKey &key) {
  int index = 1;
  for (const auto &[_, value] : key.entries()) {
    bind_text(stmt, index++, value);
  }
  return index;
}

std::string placeholders(const std::size_t count) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    out += i == 0 ? "?" : ",?";
  }
  return out;
}

std::string in_clause(const std::string &column, const std::vector<std::string> &values,
                      std::vector<std::string> &params) {
  params.insert(params.end(), values.begin(), values.end());
  return " AND " + column + " IN (" + placeholders(values.size()) + ")";
}

std::string limit_clause(const std::size_t limit) {
  return limit == 0 ? "" : " LIMIT " + std::to_string(limit);
}

template <typename T> common::Result<T> failure_from(const common::Status &status) {
  return common::Result<T>::failure(status.error_info());
}

} // namespace

SqliteStore::SqliteStore(std::filesystem::path db_path, const std::uint32_t busy_timeout_ms)
    : db_path_(std::move(db_path)), busy_timeout_ms_(busy_timeout_ms) {}

SqliteStore::~SqliteStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

std::string_view SqliteStore::name() const { return "sqlite"; }

common::Status SqliteStore::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
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
    auto status = sqlite::error_status(db_, rc, "failed to open " + db_path_.string());
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    return status;
  }
  sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms_));

  for (const char *pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA foreign_keys=ON;",
                             "PRAGMA synchronous=NORMAL;"}) {
    auto status = sqlite::exec(db_, pragma);
    if (!status.ok()) {
      return status;
    }
  }

  return sqlite::exec(db_, R"(
CREATE TABLE IF NOT EXISTS service_meta (
  id INTEGER PRIMARY KEY CHECK (id = 1),
  fingerprint TEXT NOT NULL,
  schema_version INTEGER NOT NULL,
  fields TEXT NOT NULL,
  taxonomy_version INTEGER NOT NULL,
  pipeline_revision TEXT NOT NULL DEFAULT '',
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)");
}

common::Status SqliteStore::ensure_ready() const {
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Internal, "database not initialized");
  }
  if (scope_fields_.empty()) {
    return common::Status::error(common::ErrorKind::Internal, "store is not provisioned");
  }
  return common::Status::success();
}

common::Result<std::optional<ServiceMeta>> SqliteStore::load_service_meta() {
  std::lock_guard<std::mutex> lock(mutex_);
  using Out = common::Result<std::optional<ServiceMeta>>;
  if (db_ == nullptr) {
    return Out::failure(common::ErrorKind::Internal, "database not initialized");
  }

  Statement stmt(db_, "SELECT fingerprint, schema_version, fields, taxonomy_version, "
                      "pipeline_revision, created_at, updated_at FROM service_meta WHERE id = 1");
  if (!stmt.ok()) {
    return failure_from<std::optional<ServiceMeta>>(
        sqlite::error_status(db_, stmt.rc(), "load service meta"));
  }

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return Out::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return failure_from<std::optional<ServiceMeta>>(sqlite::error_status(db_, rc, "load service meta"));
  }

  ServiceMeta meta;
  meta.fingerprint = column_text(stmt.get(), 0);
  meta.schema_version = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 1));
  meta.fields = column_text(stmt.get(), 2);
  meta.taxonomy_version = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 3));
  meta.pipeline_revision = column_text(stmt.get(), 4);
  meta.created_at = column_text(stmt.get(), 5);
  meta.updated_at = column_text(stmt.get(), 6);
  return Out::success(std::move(meta));
}

common::Status SqliteStore::save_service_meta(const ServiceMeta &meta) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Internal, "database not initialized");
  }

  Statement stmt(db_, R"(
INSERT INTO service_meta(id, fingerprint, schema_version, fields, taxonomy_version,
                         pipeline_revision, created_at, updated_at)
VALUES(1, ?1, ?2, ?3, ?4, ?5, ?6, ?7)
ON CONFLICT(id) DO UPDATE SET
  fingerprint=excluded.fingerprint,
  schema_version=excluded.schema_version,
  fields=excluded.fields,
  taxonomy_version=excluded.taxonomy_version,
  pipeline_revision=excluded.pipeline_revision,
  updated_at=excluded.updated_at
)");
  if (!stmt.ok()) {
    return sqlite::error_status(db_, stmt.rc(), "save service meta");
  }
  bind_text(stmt.get(), 1, meta.fingerprint);
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(meta.schema_version));
  bind_text(stmt.get(), 3, meta.fields);
  sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(meta.taxonomy_version));
  bind_text(stmt.get(), 5, meta.pipeline_revision);
  bind_text(stmt.get(), 6, meta.created_at);
  bind_text(stmt.get(), 7, meta.updated_at);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return sqlite::error_status(db_, rc, "save service meta");
  }
  return common::Status::success();
}

common::Status SqliteStore::provision(const scope::ScopeSchema &schema) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Internal, "database not initialized");
  }
  if (schema.empty()) {
    return common::Status::error(common::ErrorKind::Validation, "scope schema is empty");
  }

  std::vector<std::string> fields;
  std::string columns;
  for (const auto &field : schema.fields()) {
    fields.push_back("s_" + field.name);
    columns += "  s_" + field.name + " TEXT NOT NULL,\n";
  }
  const std::string key = common::join(fields, ", ");

  const std::string ddl =
      "CREATE TABLE IF NOT EXISTS resources (\n" + columns +
      "  id TEXT NOT NULL,\n"
      "  uri TEXT NOT NULL,\n"
      "  content TEXT NOT NULL,\n"
      "  modality TEXT NOT NULL,\n"
      "  content_hash TEXT NOT NULL,\n"
      "  created_at TEXT NOT NULL,\n"
      "  supersedes TEXT,\n"
      "  caption TEXT NOT NULL DEFAULT '',\n"
      "  transcription TEXT NOT NULL DEFAULT '',\n"
      "  segments TEXT NOT NULL DEFAULT '[]',\n"
      "  PRIMARY KEY (" + key + ", id)\n"
      ");\n"
      "CREATE INDEX IF NOT EXISTS idx_resources_hash ON resources(" + key + ", content_hash);\n"
      "CREATE INDEX IF NOT EXISTS idx_resources_uri ON resources(" + key + ", uri);\n"
      "CREATE INDEX IF NOT EXISTS idx_resources_created ON resources(" + key + ", created_at);\n"
      "CREATE TABLE IF NOT EXISTS items (\n" + columns +
      "  id TEXT NOT NULL,\n"
      "  resource_id TEXT NOT NULL,\n"
      "  lineage_id TEXT NOT NULL,\n"
      "  memory_type TEXT NOT NULL,\n"
      "  text TEXT NOT NULL,\n"
      "  subject TEXT NOT NULL DEFAULT '',\n"
      "  content_hash TEXT NOT NULL,\n"
      "  evidence TEXT NOT NULL,\n"
      "  confidence REAL NOT NULL,\n"
      "  stable INTEGER NOT NULL,\n"
      "  version INTEGER NOT NULL,\n"
      "  active INTEGER NOT NULL,\n"
      "  reinforcement_count INTEGER NOT NULL DEFAULT 0,\n"
      "  superseded_by TEXT,\n"
      "  created_at TEXT NOT NULL,\n"
      "  updated_at TEXT NOT NULL,\n"
      "  embedding BLOB,\n"
      "  PRIMARY KEY (" + key + ", id),\n"
      "  FOREIGN KEY (" + key + ", resource_id) REFERENCES resources(" + key + ", id)\n"
      ");\n"
      "CREATE INDEX IF NOT EXISTS idx_items_updated ON items(" + key + ", updated_at);\n"
      "CREATE INDEX IF NOT EXISTS idx_items_hash ON items(" + key + ", content_hash);\n"
      "CREATE INDEX IF NOT EXISTS idx_items_subject ON items(" + key + ", subject);\n"
      "CREATE INDEX IF NOT EXISTS idx_items_resource ON items(" + key + ", resource_id);\n"
      "CREATE TABLE IF NOT EXISTS categories (\n" + columns +
      "  id TEXT NOT NULL,\n"
      "  name TEXT NOT NULL,\n"
      "  description TEXT NOT NULL DEFAULT '',\n"
      "  summary TEXT NOT NULL DEFAULT '',\n"
      "  anchors TEXT NOT NULL DEFAULT '[]',\n"
      "  created_at TEXT NOT NULL,\n"
      "  updated_at TEXT NOT NULL,\n"
      "  embedding BLOB,\n"
      "  PRIMARY KEY (" + key + ", id),\n"
      "  UNIQUE (" + key + ", name)\n"
      ");\n"
      "CREATE TABLE IF NOT EXISTS category_items (\n" + columns +
      "  category_id TEXT NOT NULL,\n"
      "  item_id TEXT NOT NULL,\n"
      "  created_at TEXT NOT NULL,\n"
      "  PRIMARY KEY (" + key + ", category_id, item_id),\n"
      "  FOREIGN KEY (" + key + ", category_id) REFERENCES categories(" + key + ", id),\n"
      "  FOREIGN KEY (" + key + ", item_id) REFERENCES items(" + key + ", id)\n"
      ");\n"
      "CREATE INDEX IF NOT EXISTS idx_category_items_item ON category_items(" + key +
      ", item_id);\n"
      "CREATE TABLE IF NOT EXISTS intentions (\n" + columns +
      "  goals TEXT NOT NULL DEFAULT '[]',\n"
      "  constraints TEXT NOT NULL DEFAULT '[]',\n"
      "  summary TEXT NOT NULL DEFAULT '',\n"
      "  version INTEGER NOT NULL,\n"
      "  source_items TEXT NOT NULL DEFAULT '[]',\n"
      "  updated_at TEXT NOT NULL,\n"
      "  PRIMARY KEY (" + key + ")\n"
      ");\n"
      "CREATE TABLE IF NOT EXISTS diffs (\n" + columns +
      "  id TEXT NOT NULL,\n"
      "  run_id TEXT NOT NULL,\n"
      "  summary TEXT NOT NULL,\n"
      "  changes TEXT NOT NULL DEFAULT '[]',\n"
      "  created_at TEXT NOT NULL,\n"
      "  PRIMARY KEY (" + key + ", id)\n"
      ");\n"
      "CREATE INDEX IF NOT EXISTS idx_diffs_created ON diffs(" + key + ", created_at);\n"
      "CREATE TABLE IF NOT EXISTS run_logs (\n" + columns +
      "  run_id TEXT PRIMARY KEY,\n"
      "  workflow TEXT NOT NULL,\n"
      "  revision INTEGER NOT NULL,\n"
      "  status TEXT NOT NULL,\n"
      "  input_summary TEXT NOT NULL DEFAULT '',\n"
      "  steps TEXT NOT NULL DEFAULT '[]',\n"
      "  error_kind TEXT,\n"
      "  error_message TEXT,\n"
      "  error_step TEXT,\n"
      "  started_at TEXT NOT NULL,\n"
      "  finished_at TEXT NOT NULL DEFAULT ''\n"
      ");\n"
      "CREATE INDEX IF NOT EXISTS idx_run_logs_scope ON run_logs(" + key + ", started_at);\n"
      "CREATE TABLE IF NOT EXISTS checkpoints (\n" + columns +
      "  run_id TEXT PRIMARY KEY,\n"
      "  workflow TEXT NOT NULL,\n"
      "  revision INTEGER NOT NULL,\n"
      "  completed_steps TEXT NOT NULL DEFAULT '[]',\n"
      "  status TEXT NOT NULL,\n"
      "  payload TEXT NOT NULL DEFAULT '',\n"
      "  updated_at TEXT NOT NULL\n"
      ");\n";

  auto status = sqlite::exec(db_, ddl);
  if (!status.ok()) {
    return status;
  }
  scope_fields_.clear();
  for (const auto &field : schema.fields()) {
    scope_fields_.push_back(field.name);
  }
  return common::Status::success();
}

std::string SqliteStore::scope_column_list() const {
  std::string out;
  for (std::size_t i = 0; i < scope_fields_.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += "s_" + scope_fields_[i];
  }
  return out;
}

std::string SqliteStore::scope_where(const scope::ScopeSelector &selector,
                                     std::vector<std::string> &params) const {
  std::string out;
  for (const auto &[field, match] : selector.matches()) {
    const std::string column = "s_" + field;
    switch (match.mode) {
    case scope::MatchMode::Exact:
      out += " AND " + column + " = ?";
      params.push_back(match.values.empty() ? "" : match.values.front());
      break;
    case scope::MatchMode::AnyOf:
      out += in_clause(column, match.values, params);
      break;
    case scope::MatchMode::Wildcard:
      break;
    }
  }
  return out;
}

scope::ScopeKey SqliteStore::read_scope(sqlite3_stmt *stmt) const {
  std::vector<std::pair<std::string, std::string>> entries;
  entries.reserve(scope_fields_.size());
  for (std::size_t i = 0; i < scope_fields_.size(); ++i) {
    entries.emplace_back(scope_fields_[i], column_text(stmt, static_cast<int>(i)));
  }
  return scope::ScopeKey(std::move(entries));
}

common::Result<std::vector<Resource>>
SqliteStore::query_resources(const std::string &where, const std::vector<std::string> &params,
                             const std::string &tail) {
  const std::string sql = "SELECT " + scope_column_list() +
                          ", id, uri, content, modality, content_hash, created_at, supersedes, "
                          "caption, transcription, segments FROM resources WHERE 1=1" +
                          where + tail;
  Statement stmt(db_, sql);
  if (!stmt.ok()) {
    return failure_from<std::vector<Resource>>(sqlite::error_status(db_, stmt.rc(), "query resources"));
  }
  bind_params(stmt.get(), params);

  const int base = static_cast<int>(scope_fields_.size());
  std::vector<Resource> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    Resource resource;
    resource.scope = read_scope(stmt.get());
    resource.id = column_text(stmt.get(), base);
    resource.uri = column_text(stmt.get(), base + 1);
    resource.content = column_text(stmt.get(), base + 2);
    auto modality = modality_from_string(column_text(stmt.get(), base + 3));
    resource.modality = modality.ok() ? modality.value() : Modality::Text;
    resource.content_hash = column_text(stmt.get(), base + 4);
    resource.created_at = column_text(stmt.get(), base + 5);
    resource.supersedes = column_optional_text(stmt.get(), base + 6);
    resource.caption = column_text(stmt.get(), base + 7);
    resource.transcription = column_text(stmt.get(), base + 8);
    resource.segments = decode_segments(column_text(stmt.get(), base + 9));
    out.push_back(std::move(resource));
  }
  if (rc != SQLITE_DONE) {
    return failure_from<std::vector<Resource>>(sqlite::error_status(db_, rc, "query resources"));
  }
  return common::Result<std::vector<Resource>>::success(std::move(out));
}

common::Result<std::vector<MemoryItem>>
SqliteStore::query_items(const std::string &where, const std::vector<std::string> &params,
                         const std::string &tail) {
  const std::string sql =
      "SELECT " + scope_column_list() +
      ", id, resource_id, lineage_id, memory_type, text, subject, content_hash, evidence, "
      "confidence, stable, version, active, reinforcement_count, superseded_by, created_at, "
      "updated_at, embedding FROM items WHERE 1=1" +
      where + tail;
  Statement stmt(db_, sql);
  if (!stmt.ok()) {
    return failure_from<std::vector<MemoryItem>>(sqlite::error_status(db_, stmt.rc(), "query items"));
  }
  bind_params(stmt.get(), params);

  const int base = static_cast<int>(scope_fields_.size());
  std::vector<MemoryItem> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    MemoryItem item;
    item.scope = read_scope(stmt.get());
    item.id = column_text(stmt.get(), base);
    item.resource_id = column_text(stmt.get(), base + 1);
    item.lineage_id = column_text(stmt.get(), base + 2);
    item.memory_type = column_text(stmt.get(), base + 3);
    item.text = column_text(stmt.get(), base + 4);
    item.subject = column_text(stmt.get(), base + 5);
    item.content_hash = column_text(stmt.get(), base + 6);
    item.evidence = decode_evidence(column_text(stmt.get(), base + 7));
    item.confidence = sqlite3_column_double(stmt.get(), base + 8);
    item.stable = sqlite3_column_int(stmt.get(), base + 9) != 0;
    item.version = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), base + 10));
    item.active = sqlite3_column_int(stmt.get(), base + 11) != 0;
    item.reinforcement_count =
        static_cast<std::uint32_t>(sqlite3_column_int64(stmt.get(), base + 12));
    item.superseded_by = column_optional_text(stmt.get(), base + 13);
    item.created_at = column_text(stmt.get(), base + 14);
    item.updated_at = column_text(stmt.get(), base + 15);
    item.embedding = column_vector(stmt.get(), base + 16);
    out.push_back(std::move(item));
  }
  if (rc != SQLITE_DONE) {
    return failure_from<std::vector<MemoryItem>>(sqlite::error_status(db_, rc, "query items"));
  }
  return common::Result<std::vector<MemoryItem>>::success(std::move(out));
}

common::Result<std::vector<MemoryCategory>>
SqliteStore::query_categories(const std::string &where, const std::vector<std::string> &params,
                              const std::string &tail) {
  const std::string sql = "SELECT " + scope_column_list() +
                          ", id, name, description, summary, anchors, created_at, updated_at, "
                          "embedding FROM categories WHERE 1=1" +
                          where + tail;
  Statement stmt(db_, sql);
  if (!stmt.ok()) {
    return failure_from<std::vector<MemoryCategory>>(
        sqlite::error_status(db_, stmt.rc(), "query categories"));
  }
  bind_params(stmt.get(), params);

  const int base = static_cast<int>(scope_fields_.size());
  std::vector<MemoryCategory> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    MemoryCategory category;
    category.scope = read_scope(stmt.get());
    category.id = column_text(stmt.get(), base);
    category.name = column_text(stmt.get(), base + 1);
    category.description = column_text(stmt.get(), base + 2);
    category.summary = column_text(stmt.get(), base + 3);
    category.anchors = decode_string_list(column_text(stmt.get(), base + 4));
    category.created_at = column_text(stmt.get(), base + 5);
    category.updated_at = column_text(stmt.get(), base + 6);
    category.embedding = column_vector(stmt.get(), base + 7);
    out.push_back(std::move(category));
  }
  if (rc != SQLITE_DONE) {
    return failure_from<std::vector<MemoryCategory>>(sqlite::error_status(db_, rc, "query categories"));
  }
  return common::Result<std::vector<MemoryCategory>>::success(std::move(out));
}

common::Result<std::vector<Intention>>
SqliteStore::query_intentions(const std::string &where, const std::vector<std::string> &params) {
  const std::string sql = "SELECT " + scope_column_list() +
                          ", goals, constraints, summary, version, source_items, updated_at "
                          "FROM intentions WHERE 1=1" +
                          where;
  Statement stmt(db_, sql);
  if (!stmt.ok()) {
    return failure_from<std::vector<Intention>>(sqlite::error_status(db_, stmt.rc(), "query intentions"));
  }
  bind_params(stmt.get(), params);

  const int base = static_cast<int>(scope_fields_.size());
  std::vector<Intention> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    Intention intention;
    intention.scope = read_scope(stmt.get());
    intention.goals = decode_string_list(column_text(stmt.get(), base));
    intention.constraints = decode_string_list(column_text(stmt.get(), base + 1));
    intention.summary = column_text(stmt.get(), base + 2);
    intention.version = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), base + 3));
    intention.source_items = decode_string_list(column_text(stmt.get(), base + 4));
    intention.updated_at = column_text(stmt.get(), base + 5);
    out.push_back(std::move(intention));
  }
  if (rc != SQLITE_DONE) {
    return failure_from<std::vector<Intention>>(sqlite::error_status(db_, rc, "query intentions"));
  }
  return common::Result<std::vector<Intention>>::success(std::move(out));
}

common::Result<std::vector<RunLog>>
SqliteStore::query_run_logs(const std::string &where, const std::vector<std::string> &params,
                            const std::string &tail) {
  const std::string sql = "SELECT " + scope_column_list() +
                          ", run_id, workflow, revision, status, input_summary, steps, "
                          "error_kind, error_message, error_step, started_at, finished_at "
                          "FROM run_logs WHERE 1=1" +
                          where + tail;
  Statement stmt(db_, sql);
  if (!stmt.ok()) {
    return failure_from<std::vector<RunLog>>(sqlite::error_status(db_, stmt.rc(), "query run logs"));
  }
  bind_params(stmt.get(), params);

  const int base = static_cast<int>(scope_fields_.size());
  std::vector<RunLog> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    RunLog log;
    log.scope = read_scope(stmt.get());
    log.run_id = column_text(stmt.get(), base);
    log.workflow = column_text(stmt.get(), base + 1);
    log.revision = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), base + 2));
    log.status = run_status_from_string(column_text(stmt.get(), base + 3));
    log.input_summary = column_text(stmt.get(), base + 4);
    log.steps = decode_steps(column_text(stmt.get(), base + 5));
    if (const auto kind = column_optional_text(stmt.get(), base + 6); kind.has_value()) {
      common::Error error;
      error.kind = error_kind_from_string(*kind).value_or(common::ErrorKind::Internal);
      error.message = column_text(stmt.get(), base + 7);
      error.step_id = column_text(stmt.get(), base + 8);
      error.run_id = log.run_id;
      error.scope = log.scope.to_string();
      log.error = std::move(error);
    }
    log.started_at = column_text(stmt.get(), base + 9);
    log.finished_at = column_text(stmt.get(), base + 10);
    out.push_back(std::move(log));
  }
  if (rc != SQLITE_DONE) {
    return failure_from<std::vector<RunLog>>(sqlite::error_status(db_, rc, "query run logs"));
  }
  return common::Result<std::vector<RunLog>>::success(std::move(out));
}

common::Result<std::vector<Checkpoint>>
SqliteStore::query_checkpoints(const std::string &where, const std::vector<std::string> &params) {
  const std::string sql = "SELECT " + scope_column_list() +
                          ", run_id, workflow, revision, completed_steps, status, payload, "
                          "updated_at FROM checkpoints WHERE 1=1" +
                          where + " ORDER BY updated_at ASC";
  Statement stmt(db_, sql);
  if (!stmt.ok()) {
    return failure_from<std::vector<Checkpoint>>(
        sqlite::error_status(db_, stmt.rc(), "query checkpoints"));
  }
  bind_params(stmt.get(), params);

  const int base = static_cast<int>(scope_fields_.size());
  std::vector<Checkpoint> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    Checkpoint checkpoint;
    checkpoint.scope = read_scope(stmt.get());
    checkpoint.run_id = column_text(stmt.get(), base);
    checkpoint.workflow = column_text(stmt.get(), base + 1);
    checkpoint.revision = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), base + 2));
    checkpoint.completed_steps = decode_string_list(column_text(stmt.get(), base + 3));
    checkpoint.status = column_text(stmt.get(), base + 4);
    checkpoint.payload = column_text(stmt.get(), base + 5);
    checkpoint.updated_at = column_text(stmt.get(), base + 6);
    out.push_back(std::move(checkpoint));
  }
  if (rc != SQLITE_DONE) {
    return failure_from<std::vector<Checkpoint>>(sqlite::error_status(db_, rc, "query checkpoints"));
  }
  return common::Result<std::vector<Checkpoint>>::success(std::move(out));
}

common::Result<std::optional<Resource>> SqliteStore::get_resource(const scope::ScopeKey &scope,
                                                                  const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::optional<Resource>>(ready);
  }
  std::vector<std::string> params;
  std::string where = scope_where(scope::ScopeSelector::for_key(scope), params);
  where += " AND id = ?";
  params.push_back(id);

  auto rows = query_resources(where, params, "");
  if (!rows.ok()) {
    return common::Result<std::optional<Resource>>::failure(rows.error_info());
  }
  std::optional<Resource> out;
  if (!rows.value().empty()) {
    out = std::move(rows.value().front());
  }
  return common::Result<std::optional<Resource>>::success(std::move(out));
}

common::Result<std::vector<Resource>>
SqliteStore::list_resources(const scope::ScopeSelector &selector, const ResourceFilter &filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::vector<Resource>>(ready);
  }
  std::vector<std::string> params;
  std::string where = scope_where(selector, params);
  if (!filter.ids.empty()) {
    where += in_clause("id", filter.ids, params);
  }
  if (filter.content_hash.has_value()) {
    where += " AND content_hash = ?";
    params.push_back(*filter.content_hash);
  }
  if (filter.uri.has_value()) {
    where += " AND uri = ?";
    params.push_back(*filter.uri);
  }
  return query_resources(where, params,
                         " ORDER BY created_at DESC, id ASC" + limit_clause(filter.limit));
}

common::Result<std::optional<MemoryItem>> SqliteStore::get_item(const scope::ScopeKey &scope,
                                                                const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::optional<MemoryItem>>(ready);
  }
  std::vector<std::string> params;
  std::string where = scope_where(scope::ScopeSelector::for_key(scope), params);
  where += " AND id = ?";
  params.push_back(id);

  auto rows = query_items(where, params, "");
  if (!rows.ok()) {
    return common::Result<std::optional<MemoryItem>>::failure(rows.error_info());
  }
  std::optional<MemoryItem> out;
  if (!rows.value().empty()) {
    out = std::move(rows.value().front());
  }
  return common::Result<std::optional<MemoryItem>>::success(std::move(out));
}

common::Result<std::vector<MemoryItem>>
SqliteStore::list_items(const scope::ScopeSelector &selector, const ItemFilter &filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::vector<MemoryItem>>(ready);
  }
  std::vector<std::string> params;
  std::string where = scope_where(selector, params);
  if (!filter.ids.empty()) {
    where += in_clause("id", filter.ids, params);
  }
  if (filter.active_only) {
    where += " AND active = 1";
  }
  if (filter.resource_id.has_value()) {
    where += " AND resource_id = ?";
    params.push_back(*filter.resource_id);
  }
  if (filter.content_hash.has_value()) {
    where += " AND content_hash = ?";
    params.push_back(*filter.content_hash);
  }
  if (filter.subject.has_value()) {
    where += " AND subject = ?";
    params.push_back(*filter.subject);
  }
  if (filter.memory_type.has_value()) {
    where += " AND memory_type = ?";
    params.push_back(*filter.memory_type);
  }
  if (filter.lineage_id.has_value()) {
    where += " AND lineage_id = ?";
    params.push_back(*filter.lineage_id);
  }
  std::vector<std::string> terms;
  for (const auto &term : filter.terms) {
    if (!term.empty()) {
      terms.push_back(common::to_lower(term));
    }
  }
  if (!terms.empty()) {
    where += " AND (";
    for (std::size_t i = 0; i < terms.size(); ++i) {
      where += i == 0 ? "instr(lower(text), ?) > 0" : " OR instr(lower(text), ?) > 0";
      params.push_back(terms[i]);
    }
    where += ")";
  }
  return query_items(where, params,
                     " ORDER BY updated_at DESC, id ASC" + limit_clause(filter.limit));
}

common::Result<std::optional<MemoryCategory>>
SqliteStore::get_category(const scope::ScopeKey &scope, const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::optional<MemoryCategory>>(ready);
  }
  std::vector<std::string> params;
  std::string where = scope_where(scope::ScopeSelector::for_key(scope), params);
  where += " AND id = ?";
  params.push_back(id);

  auto rows = query_categories(where, params, "");
  if (!rows.ok()) {
    return common::Result<std::optional<MemoryCategory>>::failure(rows.error_info());
  }
  std::optional<MemoryCategory> out;
  if (!rows.value().empty()) {
    out = std::move(rows.value().front());
  }
  return common::Result<std::optional<MemoryCategory>>::success(std::move(out));
}

common::Result<std::vector<MemoryCategory>>
SqliteStore::list_categories(const scope::ScopeSelector &selector, const CategoryFilter &filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::vector<MemoryCategory>>(ready);
  }
  std::vector<std::string> params;
  std::string where = scope_where(selector, params);
  if (!filter.ids.empty()) {
    where += in_clause("id", filter.ids, params);
  }
  if (filter.name.has_value()) {
    where += " AND name = ?";
    params.push_back(*filter.name);
  }
  return query_categories(where, params,
                          " ORDER BY name ASC, " + scope_column_list() +
                              limit_clause(filter.limit));
}

common::Result<std::vector<CategoryItem>>
SqliteStore::list_links(const scope::ScopeSelector &selector, const LinkFilter &filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::vector<CategoryItem>>(ready);
  }
  std::vector<std::string> params;
  std::string where = scope_where(selector, params);
  if (!filter.category_ids.empty()) {
    where += in_clause("category_id", filter.category_ids, params);
  }
  if (!filter.item_ids.empty()) {
    where += in_clause("item_id", filter.item_ids, params);
  }

  Statement stmt(db_, "SELECT " + scope_column_list() +
                          ", category_id, item_id, created_at FROM category_items WHERE 1=1" +
                          where + " ORDER BY created_at ASC, item_id ASC");
  if (!stmt.ok()) {
    return failure_from<std::vector<CategoryItem>>(sqlite::error_status(db_, stmt.rc(), "query links"));
  }
  bind_params(stmt.get(), params);

  const int base = static_cast<int>(scope_fields_.size());
  std::vector<CategoryItem> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    out.push_back(CategoryItem{.scope = read_scope(stmt.get()),
                               .category_id = column_text(stmt.get(), base),
                               .item_id = column_text(stmt.get(), base + 1),
                               .created_at = column_text(stmt.get(), base + 2)});
  }
  if (rc != SQLITE_DONE) {
    return failure_from<std::vector<CategoryItem>>(sqlite::error_status(db_, rc, "query links"));
  }
  return common::Result<std::vector<CategoryItem>>::success(std::move(out));
}

common::Result<std::optional<Intention>> SqliteStore::get_intention(const scope::ScopeKey &scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::optional<Intention>>(ready);
  }
  std::vector<std::string> params;
  const std::string where = scope_where(scope::ScopeSelector::for_key(scope), params);
  auto rows = query_intentions(where, params);
  if (!rows.ok()) {
    return common::Result<std::optional<Intention>>::failure(rows.error_info());
  }
  std::optional<Intention> out;
  if (!rows.value().empty()) {
    out = std::move(rows.value().front());
  }
  return common::Result<std::optional<Intention>>::success(std::move(out));
}

common::Result<std::vector<Intention>>
SqliteStore::list_intentions(const scope::ScopeSelector &selector) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::vector<Intention>>(ready);
  }
  std::vector<std::string> params;
  const std::string where = scope_where(selector, params);
  return query_intentions(where, params);
}

common::Status SqliteStore::write_batch(const WriteBatch &batch) {
  const std::string scope_cols = scope_column_list();
  const std::string scope_marks = placeholders(scope_fields_.size());

  const auto run = [this](Statement &stmt, const std::string &context) {
    if (!stmt.ok()) {
      return sqlite::error_status(db_, stmt.rc(), context);
    }
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
      return sqlite::error_status(db_, rc, context);
    }
    return common::Status::success();
  };

  for (const auto &resource : batch.resources()) {
    Statement stmt(db_, "INSERT INTO resources(" + scope_cols +
                            ", id, uri, content, modality, content_hash, created_at, supersedes, "
                            "caption, transcription, segments) VALUES(" +
                            scope_marks +
                            ",?,?,?,?,?,?,?,?,?,?) ON CONFLICT(" + scope_cols +
                            ", id) DO UPDATE SET caption=excluded.caption, "
                            "transcription=excluded.transcription, segments=excluded.segments");
    if (stmt.ok()) {
      int index = bind_scope(stmt.get(), resource.scope);
      bind_text(stmt.get(), index++, resource.id);
      bind_text(stmt.get(), index++, resource.uri);
      bind_text(stmt.get(), index++, resource.content);
      bind_text(stmt.get(), index++, modality_to_string(resource.modality));
      bind_text(stmt.get(), index++, resource.content_hash);
      bind_text(stmt.get(), index++, resource.created_at);
      bind_optional_text(stmt.get(), index++, resource.supersedes);
      bind_text(stmt.get(), index++, resource.caption);
      bind_text(stmt.get(), index++, resource.transcription);
      bind_text(stmt.get(), index++, encode_segments(resource.segments));
    }
    if (auto status = run(stmt, "put resource " + resource.id); !status.ok()) {
      return status;
    }
  }

  for (const auto &category : batch.categories()) {
    Statement stmt(db_, "INSERT INTO categories(" + scope_cols +
                            ", id, name, description, summary, anchors, created_at, updated_at, "
                            "embedding) VALUES(" +
                            scope_marks + ",?,?,?,?,?,?,?,?) ON CONFLICT(" + scope_cols +
                            ", id) DO UPDATE SET name=excluded.name, "
                            "description=excluded.description, summary=excluded.summary, "
                            "anchors=excluded.anchors, updated_at=excluded.updated_at, "
                            "embedding=excluded.embedding");
    if (stmt.ok()) {
      int index = bind_scope(stmt.get(), category.scope);
      bind_text(stmt.get(), index++, category.id);
      bind_text(stmt.get(), index++, category.name);
      bind_text(stmt.get(), index++, category.description);
      bind_text(stmt.get(), index++, category.summary);
      bind_text(stmt.get(), index++, encode_string_list(category.anchors));
      bind_text(stmt.get(), index++, category.created_at);
      bind_text(stmt.get(), index++, category.updated_at);
      bind_vector(stmt.get(), index++, category.embedding);
    }
    if (auto status = run(stmt, "put category " + category.name); !status.ok()) {
      return status;
    }
  }

  for (const auto &item : batch.items()) {
    Statement stmt(db_, "INSERT INTO items(" + scope_cols +
                            ", id, resource_id, lineage_id, memory_type, text, subject, "
                            "content_hash, evidence, confidence, stable, version, active, "
                            "reinforcement_count, superseded_by, created_at, updated_at, "
                            "embedding) VALUES(" +
                            scope_marks +
                            ",?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(" + scope_cols +
                            ", id) DO UPDATE SET text=excluded.text, subject=excluded.subject, "
                            "content_hash=excluded.content_hash, evidence=excluded.evidence, "
                            "confidence=excluded.confidence, stable=excluded.stable, "
                            "version=excluded.version, active=excluded.active, "
                            "reinforcement_count=excluded.reinforcement_count, "
                            "superseded_by=excluded.superseded_by, "
                            "updated_at=excluded.updated_at, embedding=excluded.embedding");
    if (stmt.ok()) {
      int index = bind_scope(stmt.get(), item.scope);
      bind_text(stmt.get(), index++, item.id);
      bind_text(stmt.get(), index++, item.resource_id);
      bind_text(stmt.get(), index++, item.lineage_id);
      bind_text(stmt.get(), index++, item.memory_type);
      bind_text(stmt.get(), index++, item.text);
      bind_text(stmt.get(), index++, item.subject);
      bind_text(stmt.get(), index++, item.content_hash);
      bind_text(stmt.get(), index++, encode_evidence(item.evidence));
      sqlite3_bind_double(stmt.get(), index++, item.confidence);
      sqlite3_bind_int(stmt.get(), index++, item.stable ? 1 : 0);
      sqlite3_bind_int64(stmt.get(), index++, static_cast<sqlite3_int64>(item.version));
      sqlite3_bind_int(stmt.get(), index++, item.active ? 1 : 0);
      sqlite3_bind_int64(stmt.get(), index++,
                         static_cast<sqlite3_int64>(item.reinforcement_count));
      bind_optional_text(stmt.get(), index++, item.superseded_by);
      bind_text(stmt.get(), index++, item.created_at);
      bind_text(stmt.get(), index++, item.updated_at);
      bind_vector(stmt.get(), index++, item.embedding);
    }
    if (auto status = run(stmt, "put item " + item.id); !status.ok()) {
      return status;
    }
  }

  for (const auto &link : batch.links()) {
    Statement stmt(db_, "INSERT INTO category_items(" + scope_cols +
                            ", category_id, item_id, created_at) VALUES(" + scope_marks +
                            ",?,?,?) ON CONFLICT DO NOTHING");
    if (stmt.ok()) {
      int index = bind_scope(stmt.get(), link.scope);
      bind_text(stmt.get(), index++, link.category_id);
      bind_text(stmt.get(), index++, link.item_id);
      bind_text(stmt.get(), index++, link.created_at);
    }
    if (auto status = run(stmt, "link " + link.category_id + "/" + link.item_id); !status.ok()) {
      return status;
    }
  }

  for (const auto &link : batch.unlinks()) {
    std::vector<std::string> params;
    std::string where = scope_where(scope::ScopeSelector::for_key(link.scope), params);
    Statement stmt(db_, "DELETE FROM category_items WHERE 1=1" + where +
                            " AND category_id = ? AND item_id = ?");
    if (stmt.ok()) {
      params.push_back(link.category_id);
      params.push_back(link.item_id);
      bind_params(stmt.get(), params);
    }
    if (auto status = run(stmt, "unlink " + link.category_id + "/" + link.item_id); !status.ok()) {
      return status;
    }
  }

  if (const auto &intention = batch.intention(); intention.has_value()) {
    Statement stmt(db_, "INSERT INTO intentions(" + scope_cols +
                            ", goals, constraints, summary, version, source_items, updated_at) "
                            "VALUES(" +
                            scope_marks + ",?,?,?,?,?,?) ON CONFLICT(" + scope_cols +
                            ") DO UPDATE SET goals=excluded.goals, "
                            "constraints=excluded.constraints, summary=excluded.summary, "
                            "version=excluded.version, source_items=excluded.source_items, "
                            "updated_at=excluded.updated_at");
    if (stmt.ok()) {
      int index = bind_scope(stmt.get(), intention->scope);
      bind_text(stmt.get(), index++, encode_string_list(intention->goals));
      bind_text(stmt.get(), index++, encode_string_list(intention->constraints));
      bind_text(stmt.get(), index++, intention->summary);
      sqlite3_bind_int64(stmt.get(), index++, static_cast<sqlite3_int64>(intention->version));
      bind_text(stmt.get(), index++, encode_string_list(intention->source_items));
      bind_text(stmt.get(), index++, intention->updated_at);
    }
    if (auto status = run(stmt, "put intention"); !status.ok()) {
      return status;
    }
  }

  for (const auto &diff : batch.diffs()) {
    Statement stmt(db_, "INSERT INTO diffs(" + scope_cols +
                            ", id, run_id, summary, changes, created_at) VALUES(" + scope_marks +
                            ",?,?,?,?,?)");
    if (stmt.ok()) {
      int index = bind_scope(stmt.get(), diff.scope);
      bind_text(stmt.get(), index++, diff.id);
      bind_text(stmt.get(), index++, diff.run_id);
      bind_text(stmt.get(), index++, diff.summary);
      bind_text(stmt.get(), index++, encode_changes(diff.changes));
      bind_text(stmt.get(), index++, diff.created_at);
    }
    if (auto status = run(stmt, "put diff " + diff.id); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

common::Status SqliteStore::commit(const WriteBatch &batch) {
  if (batch.empty()) {
    return common::Status::success();
  }
  if (auto scope_result = batch.common_scope(); !scope_result.ok()) {
    return common::Status::error(scope_result.error_info());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return ready;
  }

  auto status = sqlite::exec(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }

  status = write_batch(batch);
  if (!status.ok()) {
    auto rollback = sqlite::exec(db_, "ROLLBACK;");
    if (!rollback.ok()) {
      auto error = status.error_info();
      error.message += " (rollback failed: " + rollback.error() + ")";
      return common::Status::error(std::move(error));
    }
    return status;
  }

  status = sqlite::exec(db_, "COMMIT;");
  if (!status.ok()) {
    auto rollback = sqlite::exec(db_, "ROLLBACK;");
    if (!rollback.ok()) {
      auto error = status.error_info();
      error.message += " (rollback failed: " + rollback.error() + ")";
      return common::Status::error(std::move(error));
    }
  }
  return status;
}

common::Result<PurgeStats> SqliteStore::purge_scope(const scope::ScopeKey &scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<PurgeStats>(ready);
  }

  std::vector<std::string> params;
  const std::string where = scope_where(scope::ScopeSelector::for_key(scope), params);

  auto status = sqlite::exec(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return failure_from<PurgeStats>(status);
  }

  PurgeStats stats;
  const std::vector<std::pair<std::string, std::size_t *>> tables = {
      {"category_items", &stats.links}, {"items", &stats.items},
      {"categories", &stats.categories}, {"resources", &stats.resources},
      {"intentions", nullptr},          {"diffs", nullptr}};
  for (const auto &[table, counter] : tables) {
    Statement stmt(db_, "DELETE FROM " + table + " WHERE 1=1" + where);
    if (!stmt.ok()) {
      status = sqlite::error_status(db_, stmt.rc(), "purge " + table);
      break;
    }
    bind_params(stmt.get(), params);
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
      status = sqlite::error_status(db_, rc, "purge " + table);
      break;
    }
    if (counter != nullptr) {
      *counter = static_cast<std::size_t>(sqlite3_changes(db_));
    }
  }

  if (!status.ok()) {
    auto rollback = sqlite::exec(db_, "ROLLBACK;");
    if (!rollback.ok()) {
      return common::Result<PurgeStats>::failure(
          status.kind(), status.error() + " (rollback failed: " + rollback.error() + ")");
    }
    return failure_from<PurgeStats>(status);
  }

  status = sqlite::exec(db_, "COMMIT;");
  if (!status.ok()) {
    return failure_from<PurgeStats>(status);
  }
  return common::Result<PurgeStats>::success(stats);
}

common::Status SqliteStore::put_run_log(const RunLog &log) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return ready;
  }

  const std::string scope_cols = scope_column_list();
  Statement stmt(db_, "INSERT INTO run_logs(" + scope_cols +
                          ", run_id, workflow, revision, status, input_summary, steps, "
                          "error_kind, error_message, error_step, started_at, finished_at) "
                          "VALUES(" +
                          placeholders(scope_fields_.size()) +
                          ",?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(run_id) DO UPDATE SET "
                          "status=excluded.status, steps=excluded.steps, "
                          "error_kind=excluded.error_kind, error_message=excluded.error_message, "
                          "error_step=excluded.error_step, finished_at=excluded.finished_at");
  if (!stmt.ok()) {
    return sqlite::error_status(db_, stmt.rc(), "put run log");
  }

  // Run logs of cross-scope reads carry the selector label; pad to the schema width.
  std::vector<std::pair<std::string, std::string>> entries = log.scope.entries();
  entries.resize(scope_fields_.size());
  int index = bind_scope(stmt.get(), scope::ScopeKey(std::move(entries)));
  bind_text(stmt.get(), index++, log.run_id);
  bind_text(stmt.get(), index++, log.workflow);
  sqlite3_bind_int64(stmt.get(), index++, static_cast<sqlite3_int64>(log.revision));
  bind_text(stmt.get(), index++, run_status_to_string(log.status));
  bind_text(stmt.get(), index++, log.input_summary);
  bind_text(stmt.get(), index++, encode_steps(log.steps));
  if (log.error.has_value()) {
    bind_text(stmt.get(), index++, std::string(common::error_kind_name(log.error->kind)));
    bind_text(stmt.get(), index++, log.error->message);
    bind_text(stmt.get(), index++, log.error->step_id);
  } else {
    sqlite3_bind_null(stmt.get(), index++);
    sqlite3_bind_null(stmt.get(), index++);
    sqlite3_bind_null(stmt.get(), index++);
  }
  bind_text(stmt.get(), index++, log.started_at);
  bind_text(stmt.get(), index++, log.finished_at);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return sqlite::error_status(db_, rc, "put run log");
  }
  return common::Status::success();
}

common::Result<std::optional<RunLog>> SqliteStore::get_run_log(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::optional<RunLog>>(ready);
  }
  auto rows = query_run_logs(" AND run_id = ?", {run_id}, "");
  if (!rows.ok()) {
    return common::Result<std::optional<RunLog>>::failure(rows.error_info());
  }
  std::optional<RunLog> out;
  if (!rows.value().empty()) {
    out = std::move(rows.value().front());
  }
  return common::Result<std::optional<RunLog>>::success(std::move(out));
}

common::Result<std::vector<RunLog>> SqliteStore::list_run_logs(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::vector<RunLog>>(ready);
  }
  return query_run_logs("", {}, " ORDER BY rowid DESC" + limit_clause(limit));
}

common::Result<std::vector<DiffRecord>> SqliteStore::list_diffs(const scope::ScopeKey &scope,
                                                                const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::vector<DiffRecord>>(ready);
  }

  std::vector<std::string> params;
  const std::string where = scope_where(scope::ScopeSelector::for_key(scope), params);
  Statement stmt(db_, "SELECT " + scope_column_list() +
                          ", id, run_id, summary, changes, created_at FROM diffs WHERE 1=1" +
                          where + " ORDER BY created_at DESC, rowid DESC" + limit_clause(limit));
  if (!stmt.ok()) {
    return failure_from<std::vector<DiffRecord>>(sqlite::error_status(db_, stmt.rc(), "list diffs"));
  }
  bind_params(stmt.get(), params);

  const int base = static_cast<int>(scope_fields_.size());
  std::vector<DiffRecord> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    DiffRecord diff;
    diff.scope = read_scope(stmt.get());
    diff.id = column_text(stmt.get(), base);
    diff.run_id = column_text(stmt.get(), base + 1);
    diff.summary = column_text(stmt.get(), base + 2);
    diff.changes = decode_changes(column_text(stmt.get(), base + 3));
    diff.created_at = column_text(stmt.get(), base + 4);
    out.push_back(std::move(diff));
  }
  if (rc != SQLITE_DONE) {
    return failure_from<std::vector<DiffRecord>>(sqlite::error_status(db_, rc, "list diffs"));
  }
  return common::Result<std::vector<DiffRecord>>::success(std::move(out));
}

common::Status SqliteStore::put_checkpoint(const Checkpoint &checkpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return ready;
  }

  Statement stmt(db_, "INSERT INTO checkpoints(" + scope_column_list() +
                          ", run_id, workflow, revision, completed_steps, status, payload, "
                          "updated_at) VALUES(" +
                          placeholders(scope_fields_.size()) +
                          ",?,?,?,?,?,?,?) ON CONFLICT(run_id) DO UPDATE SET "
                          "completed_steps=excluded.completed_steps, status=excluded.status, "
                          "payload=excluded.payload, updated_at=excluded.updated_at");
  if (!stmt.ok()) {
    return sqlite::error_status(db_, stmt.rc(), "put checkpoint");
  }
  std::vector<std::pair<std::string, std::string>> entries = checkpoint.scope.entries();
  entries.resize(scope_fields_.size());
  int index = bind_scope(stmt.get(), scope::ScopeKey(std::move(entries)));
  bind_text(stmt.get(), index++, checkpoint.run_id);
  bind_text(stmt.get(), index++, checkpoint.workflow);
  sqlite3_bind_int64(stmt.get(), index++, static_cast<sqlite3_int64>(checkpoint.revision));
  bind_text(stmt.get(), index++, encode_string_list(checkpoint.completed_steps));
  bind_text(stmt.get(), index++, checkpoint.status);
  bind_text(stmt.get(), index++, checkpoint.payload);
  bind_text(stmt.get(), index++, checkpoint.updated_at);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return sqlite::error_status(db_, rc, "put checkpoint");
  }
  return common::Status::success();
}

common::Result<std::optional<Checkpoint>> SqliteStore::get_checkpoint(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::optional<Checkpoint>>(ready);
  }
  auto rows = query_checkpoints(" AND run_id = ?", {run_id});
  if (!rows.ok()) {
    return common::Result<std::optional<Checkpoint>>::failure(rows.error_info());
  }
  std::optional<Checkpoint> out;
  if (!rows.value().empty()) {
    out = std::move(rows.value().front());
  }
  return common::Result<std::optional<Checkpoint>>::success(std::move(out));
}

common::Result<std::vector<Checkpoint>> SqliteStore::list_checkpoints(const std::string &status) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return failure_from<std::vector<Checkpoint>>(ready);
  }
  if (status.empty()) {
    return query_checkpoints("", {});
  }
  return query_checkpoints(" AND status = ?", {status});
}

common::Status SqliteStore::delete_checkpoint(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ready = ensure_ready(); !ready.ok()) {
    return ready;
  }
  Statement stmt(db_, "DELETE FROM checkpoints WHERE run_id = ?1");
  if (!stmt.ok()) {
    return sqlite::error_status(db_, stmt.rc(), "delete checkpoint");
  }
  bind_text(stmt.get(), 1, run_id);
  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return sqlite::error_status(db_, rc, "delete checkpoint");
  }
  return common::Status::success();
}

bool SqliteStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return false;
  }
  Statement stmt(db_, "SELECT 1");
  if (!stmt.ok()) {
    return false;
  }
  return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

} // namespace strata::store
