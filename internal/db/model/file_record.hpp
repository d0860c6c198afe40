#pragma once

#include <cstdint>
#include <string>

namespace framecache::db::model {

/*
  One image file, unique per (folder, basename, extension).
*/
struct FileRecord {
  int64_t     file_id   = 0; // filled by UpsertFile
  int64_t     folder_id = 0;
  std::string basename;
  std::string extension; // without the dot, case as on disk
  double      last_modified = 0.0;
};

} // namespace framecache::db::model
