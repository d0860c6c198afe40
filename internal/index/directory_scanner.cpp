#include "internal/index/directory_scanner.hpp"

#include <algorithm>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace framecache::index {

namespace fs = std::filesystem;
using observability::StringField;

DirectoryScanner::DirectoryScanner(std::shared_ptr<db::Repository> repository, fs::path root)
    : repository_(std::move(repository)), root_(root.lexically_normal()) {
  // stored paths are built as folder + '/' + name, so no trailing separator
  if (root_.has_relative_path() && !root_.has_filename()) {
    root_ = root_.parent_path();
  }
}

std::vector<std::string> DirectoryScanner::Scan(db::Transaction& tx, bool stop_at_first) {
  std::vector<std::string>           out_of_date;
  std::vector<db::model::FolderRecord> updates;

  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    FRAMECACHE_LOG_WARN("picture directory missing", {StringField("path", root_.string())});
    return out_of_date;
  }

  // pre-order walk, children in name order; an unreadable directory only
  // loses its own subtree
  std::vector<fs::path> folders;
  std::vector<fs::path> pending{root_};
  while (!pending.empty()) {
    auto folder = std::move(pending.back());
    pending.pop_back();
    folders.push_back(folder);

    std::vector<fs::path>  children;
    fs::directory_iterator dir(folder, fs::directory_options::skip_permission_denied, ec);
    for (const fs::directory_iterator end; !ec && dir != end; dir.increment(ec)) {
      std::error_code type_ec;
      if (dir->is_directory(type_ec) && !dir->is_symlink(type_ec)) {
        children.push_back(dir->path());
      }
    }
    if (ec) {
      FRAMECACHE_LOG_WARN("skipping unreadable folder", {StringField("path", folder.string()), StringField("error", ec.message())});
      ec.clear();
    }

    std::sort(children.rbegin(), children.rend());
    for (auto& child : children) pending.push_back(std::move(child));
  }

  for (const auto& folder : folders) {
    const auto modified = util::ModifiedSeconds(folder);
    if (!modified) {
      FRAMECACHE_LOG_WARN("folder vanished during scan", {StringField("path", folder.string())});
      continue;
    }

    const auto name  = folder.string();
    const auto found = repository_->GetFolder(tx, name);
    if (found && found->last_modified >= *modified) {
      continue;
    }

    out_of_date.push_back(name);
    updates.push_back({0, name, *modified});
    if (stop_at_first) {
      break;
    }
  }

  if (auto result = repository_->UpsertFolders(tx, updates); !result) {
    throw util::StoreError("folder upsert failed: " + result.message);
  }

  return out_of_date;
}

} // namespace framecache::index
