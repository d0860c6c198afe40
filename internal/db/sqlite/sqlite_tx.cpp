#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace framecache::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode) : db_(std::move(db)) {
  db_->Exec(mode == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    // sqlite3_exec directly: a destructor must not throw
    char* err = nullptr;
    if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
      FRAMECACHE_LOG_WARN("rollback failed", {observability::StringField("error", err ? err : "unknown")});
    }
    sqlite3_free(err);
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace framecache::db::sqlite
