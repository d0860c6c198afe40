#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace framecache::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  The image index opens two of these on the same file: one owned by
  the cache scheduler (the writer), one shared by readers.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, uint32_t busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Brings the image index schema up to date; returns the schema version.
  int EnsureSchema();

  int  UserVersion();
  void SetUserVersion(int version);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  uint32_t    busy_timeout_ms_;
};

} // namespace framecache::db::sqlite
