#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

namespace framecache::db::sql {

const std::vector<Migration>& ImageIndexMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {
           "CREATE TABLE IF NOT EXISTS folder ("
           " folder_id INTEGER NOT NULL PRIMARY KEY,"
           " name TEXT UNIQUE NOT NULL,"
           " last_modified REAL DEFAULT 0 NOT NULL);",

           "CREATE TABLE IF NOT EXISTS file ("
           " file_id INTEGER NOT NULL PRIMARY KEY,"
           " folder_id INTEGER NOT NULL REFERENCES folder(folder_id) ON DELETE CASCADE,"
           " basename TEXT NOT NULL,"
           " extension TEXT NOT NULL,"
           " last_modified REAL DEFAULT 0 NOT NULL,"
           " UNIQUE(folder_id, basename, extension));",

           "CREATE TABLE IF NOT EXISTS meta ("
           " file_id INTEGER NOT NULL PRIMARY KEY REFERENCES file(file_id) ON DELETE CASCADE,"
           " orientation INTEGER DEFAULT 1 NOT NULL,"
           " capture_time REAL DEFAULT 0 NOT NULL,"
           " f_number REAL DEFAULT 0 NOT NULL,"
           " exposure_time TEXT,"
           " iso REAL DEFAULT 0 NOT NULL,"
           " focal_length TEXT,"
           " make TEXT,"
           " model TEXT,"
           " lens TEXT,"
           " rating INTEGER,"
           " latitude REAL,"
           " longitude REAL,"
           " width INTEGER DEFAULT 0 NOT NULL,"
           " height INTEGER DEFAULT 0 NOT NULL);",

           "CREATE INDEX IF NOT EXISTS meta_capture_time ON meta(capture_time);",

           "CREATE INDEX IF NOT EXISTS file_folder ON file(folder_id);",

           "CREATE TABLE IF NOT EXISTS location ("
           " id INTEGER NOT NULL PRIMARY KEY,"
           " latitude REAL,"
           " longitude REAL,"
           " description TEXT,"
           " UNIQUE(latitude, longitude));",

           // file rows without meta report is_portrait = 0 so the pairing pass
           // treats them as standalone slides
           "CREATE VIEW IF NOT EXISTS all_data AS SELECT"
           " file.file_id AS file_id,"
           " folder.folder_id AS folder_id,"
           // rtrim so a filesystem-root folder '/' yields '/x.jpg', not '//x.jpg'
           " rtrim(folder.name, '/') || '/' || file.basename || '.' || file.extension AS fname,"
           " file.last_modified AS last_modified,"
           " meta.orientation AS orientation,"
           " meta.capture_time AS capture_time,"
           " meta.f_number AS f_number,"
           " meta.exposure_time AS exposure_time,"
           " meta.iso AS iso,"
           " meta.focal_length AS focal_length,"
           " meta.make AS make,"
           " meta.model AS model,"
           " meta.lens AS lens,"
           " meta.rating AS rating,"
           " meta.latitude AS latitude,"
           " meta.longitude AS longitude,"
           " meta.width AS width,"
           " meta.height AS height,"
           " IFNULL(meta.height > meta.width, 0) AS is_portrait,"
           " location.description AS location,"
           " meta.file_id IS NOT NULL AS has_meta"
           " FROM file"
           " INNER JOIN folder ON folder.folder_id = file.folder_id"
           " LEFT JOIN meta ON meta.file_id = file.file_id"
           " LEFT JOIN location ON location.latitude = meta.latitude AND location.longitude = meta.longitude;",
       }},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  int current = executor.SchemaVersion();
  for (const auto& migration : ordered) {
    if (migration.version <= current) continue;
    if (migration.version != current + 1) {
      throw std::runtime_error("schema migration gap: store at v" + std::to_string(current) + ", next step v" +
                               std::to_string(migration.version));
    }
    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.SetSchemaVersion(migration.version);
    current = migration.version;
  }
  return current;
}

} // namespace framecache::db::sql
