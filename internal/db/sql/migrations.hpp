#pragma once

#include <string>
#include <vector>

namespace framecache::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and tracks the applied
  version (sqlite: PRAGMA user_version).
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual int  SchemaVersion()            = 0;
  virtual void SetSchemaVersion(int version) = 0;
};

/*
  One schema step. Steps are additive: a store written by an older
  build is brought forward, never rebuilt.
*/
struct Migration {
  int                      version;
  std::vector<std::string> statements;
};

const std::vector<Migration>& ImageIndexMigrations();

// Runs every migration newer than the executor's schema version, in order.
// Returns the resulting version.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace framecache::db::sql
