#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace framecache::db::sqlite {

/*
  SQLite transaction wrapper.

  kWrite uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  kRead uses BEGIN DEFERRED so every statement in the
  transaction reads the same WAL snapshot.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
