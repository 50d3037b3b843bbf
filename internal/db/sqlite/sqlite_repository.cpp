#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace snapshot::db::sqlite {

using snapshot::db::ErrorCode;
using snapshot::db::Result;

namespace {

constexpr const char* kJobColumns =
    "id,state,project_id,sandbox_id,parent_track,provider_id,short_description,result_track,message,user,workflow,created_at_ms,started_at_ms,finished_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

// Binds every column but id, starting at `first`.
void BindJobFields(sqlite3_stmt* st, int first, const model::JobRecord& r) {
  BindI32(st, first + 0, static_cast<int>(r.state));
  BindText(st, first + 1, r.project_id);
  BindText(st, first + 2, r.sandbox_id);
  BindText(st, first + 3, r.parent_track);
  BindText(st, first + 4, r.provider_id);
  BindText(st, first + 5, r.short_description);
  BindText(st, first + 6, r.result_track);
  BindText(st, first + 7, r.message);
  BindText(st, first + 8, r.user);
  BindText(st, first + 9, r.workflow_json);
  BindU64(st, first + 10, r.created_at_ms);
  BindU64(st, first + 11, r.started_at_ms);
  BindU64(st, first + 12, r.finished_at_ms);
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id                = ColU64(st, 0);
  r.state             = static_cast<snapshot::manager::runtime::v1::JobState>(ColI32(st, 1));
  r.project_id        = ColText(st, 2);
  r.sandbox_id        = ColText(st, 3);
  r.parent_track      = ColText(st, 4);
  r.provider_id       = ColText(st, 5);
  r.short_description = ColText(st, 6);
  r.result_track      = ColText(st, 7);
  r.message           = ColText(st, 8);
  r.user              = ColText(st, 9);
  r.workflow_json     = ColText(st, 10);
  r.created_at_ms     = ColU64(st, 11);
  r.started_at_ms     = ColU64(st, 12);
  r.finished_at_ms    = ColU64(st, 13);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS jobs (id INTEGER PRIMARY KEY, state INTEGER NOT NULL, project_id TEXT NOT NULL, sandbox_id TEXT NOT NULL, "
      "parent_track TEXT NOT NULL, provider_id TEXT NOT NULL, short_description TEXT, result_track TEXT, message TEXT, user TEXT, workflow TEXT, "
      "created_at_ms INTEGER NOT NULL, started_at_ms INTEGER NOT NULL DEFAULT 0, finished_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS jobs_by_sandbox ON jobs(project_id, sandbox_id);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec(std::string("SELECT ") + kJobColumns + " FROM jobs LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO jobs(") + kJobColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.id);
  BindJobFields(st, 2, r);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindU64(st, 1, id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadJob(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs ORDER BY id;";

  std::vector<model::JobRecord> out;
  sqlite3_stmt*                 st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return out;

  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadJob(st));
  }

  sqlite3_finalize(st);
  return out;
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE jobs SET state=?,project_id=?,sandbox_id=?,parent_track=?,provider_id=?,short_description=?,result_track=?,message=?,user=?,workflow=?,"
      "created_at_ms=?,started_at_ms=?,finished_at_ms=? WHERE id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindJobFields(st, 1, r);
  BindU64(st, 14, r.id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "job " + std::to_string(r.id));
  return Translate(db, rc);
}

Result SqliteRepository::DeleteJob(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();

  const char* sql = "DELETE FROM jobs WHERE id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "job " + std::to_string(id));
  return Translate(db, rc);
}

uint64_t SqliteRepository::MaxJobId(Transaction& t) {
  auto* db = TX(t).Handle();

  const char* sql = "SELECT COALESCE(MAX(id), 0) FROM jobs;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }

  uint64_t max_id = 0;
  if (sqlite3_step(st) == SQLITE_ROW) {
    max_id = ColU64(st, 0);
  }
  sqlite3_finalize(st);
  return max_id;
}

} // namespace snapshot::db::sqlite
