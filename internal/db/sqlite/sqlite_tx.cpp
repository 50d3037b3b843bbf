#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace snapshot::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  // destructors must not throw; a failed rollback is only reported
  const int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    SNAPSHOT_LOG_WARN("sqlite.rollback_failed", {observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace snapshot::db::sqlite
