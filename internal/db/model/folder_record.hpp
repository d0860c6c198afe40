#pragma once

#include <cstdint>
#include <string>

namespace framecache::db::model {

/*
  One watched directory.

  folder_id is stable for the lifetime of the row: the scanner
  refreshes last_modified in place instead of replacing the row.
*/
struct FolderRecord {
  int64_t     folder_id = 0;
  std::string name; // absolute path
  double      last_modified = 0.0;
};

} // namespace framecache::db::model
