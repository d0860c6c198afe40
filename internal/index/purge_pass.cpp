#include "internal/index/purge_pass.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace framecache::index {

namespace fs = std::filesystem;
using observability::IntField;
using observability::StringField;

namespace {

// Only a definite "not found" counts as gone; a permission error keeps the row.
bool Missing(const std::string& path) {
  std::error_code ec;
  const auto      status = fs::status(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
    FRAMECACHE_LOG_WARN("cannot stat indexed path", {StringField("path", path), StringField("error", ec.message())});
    return false;
  }
  return !fs::exists(status);
}

} // namespace

PurgePass::PurgePass(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

PurgeStats PurgePass::Run(db::Transaction& tx) {
  PurgeStats stats;

  std::vector<int64_t> folder_ids;
  for (const auto& folder : repository_->ListFolders(tx)) {
    if (Missing(folder.name)) folder_ids.push_back(folder.folder_id);
  }
  if (!folder_ids.empty()) {
    if (auto result = repository_->DeleteFolders(tx, folder_ids); !result) {
      throw util::StoreError("folder purge failed: " + result.message);
    }
    FRAMECACHE_LOG_DEBUG("purged folders", {IntField("count", static_cast<int64_t>(folder_ids.size()))});
  }
  stats.folders = folder_ids.size();

  std::vector<int64_t> file_ids;
  for (const auto& [file_id, path] : repository_->ListFilePaths(tx)) {
    if (Missing(path)) file_ids.push_back(file_id);
  }
  if (!file_ids.empty()) {
    if (auto result = repository_->DeleteFiles(tx, file_ids); !result) {
      throw util::StoreError("file purge failed: " + result.message);
    }
    FRAMECACHE_LOG_DEBUG("purged files", {IntField("count", static_cast<int64_t>(file_ids.size()))});
  }
  stats.files = file_ids.size();

  return stats;
}

} // namespace framecache::index
