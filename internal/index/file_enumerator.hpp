#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace framecache::index {

struct ModifiedFile {
  int64_t     file_id = 0;
  std::string path;
  double      last_modified = 0.0;
};

/*
  Lists the images of modified folders and upserts the File rows of
  those whose mtime advanced (or that are new).
*/
class FileEnumerator {
 public:
  explicit FileEnumerator(std::shared_ptr<db::Repository> repository);

  std::vector<ModifiedFile> Enumerate(db::Transaction& tx, const std::vector<std::string>& folders);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace framecache::index
