#pragma once

#include <cstddef>
#include <memory>

#include "internal/db/api/repository.hpp"

namespace framecache::index {

struct PurgeStats {
  std::size_t folders = 0;
  std::size_t files   = 0;
};

/*
  Deletes Folder and File rows whose path no longer exists on disk.

  Folders go first; their files and metadata follow by cascade, so the
  file sweep only sees files that went missing from surviving folders.
  Location rows are never purged.
*/
class PurgePass {
 public:
  explicit PurgePass(std::shared_ptr<db::Repository> repository);

  PurgeStats Run(db::Transaction& tx);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace framecache::index
