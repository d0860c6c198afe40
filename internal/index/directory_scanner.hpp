#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace framecache::index {

/*
  Walks the watched root and finds directories whose mtime advanced
  since the previous cycle (or that were never seen).

  Every out-of-date folder has its stored mtime refreshed inside the
  caller's transaction.
*/
class DirectoryScanner {
 public:
  DirectoryScanner(std::shared_ptr<db::Repository> repository, std::filesystem::path root);

  // stop_at_first: return after the first out-of-date folder (cold start shortcut)
  std::vector<std::string> Scan(db::Transaction& tx, bool stop_at_first);

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::filesystem::path           root_;
};

} // namespace framecache::index
