#include "internal/index/file_enumerator.hpp"

#include <filesystem>
#include <system_error>

#include "internal/index/path_filter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace framecache::index {

namespace fs = std::filesystem;
using observability::StringField;

FileEnumerator::FileEnumerator(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<ModifiedFile> FileEnumerator::Enumerate(db::Transaction& tx, const std::vector<std::string>& folders) {
  std::vector<ModifiedFile> modified;

  for (const auto& name : folders) {
    const fs::path folder(name);

    const auto folder_row = repository_->GetFolder(tx, name);
    if (!folder_row) {
      // the scanner upserts every folder it returns
      throw util::StoreError("folder missing from index: " + name);
    }

    std::error_code        ec;
    std::vector<fs::path>  candidates;
    fs::directory_iterator dir(folder, fs::directory_options::skip_permission_denied, ec);
    for (const fs::directory_iterator end; !ec && dir != end; dir.increment(ec)) {
      std::error_code type_ec;
      if (!dir->is_regular_file(type_ec)) continue;
      if (!IsIndexableImage(folder, dir->path().filename())) continue;
      candidates.push_back(dir->path());
    }
    if (ec) {
      FRAMECACHE_LOG_WARN("skipping unreadable folder", {StringField("path", name), StringField("error", ec.message())});
      continue;
    }

    for (const auto& path : candidates) {
      const auto mtime = util::ModifiedSeconds(path);
      if (!mtime) {
        FRAMECACHE_LOG_WARN("file vanished during enumeration", {StringField("path", path.string())});
        continue;
      }

      const auto full_path = path.string();
      const auto stored    = repository_->GetFileModified(tx, full_path);
      if (stored && *stored >= *mtime) {
        continue;
      }

      db::model::FileRecord record{
          .folder_id     = folder_row->folder_id,
          .basename      = path.stem().string(),
          .extension     = ExtensionOf(path),
          .last_modified = *mtime,
      };
      if (auto result = repository_->UpsertFile(tx, record); !result) {
        throw util::StoreError("file upsert failed: " + result.message);
      }

      modified.push_back({record.file_id, full_path, *mtime});
    }
  }

  return modified;
}

} // namespace framecache::index
