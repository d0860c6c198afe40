#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/extract/metadata_extractor.hpp"
#include "internal/index/directory_scanner.hpp"
#include "internal/index/file_enumerator.hpp"
#include "internal/index/metadata_updater.hpp"
#include "internal/index/purge_pass.hpp"

namespace framecache::index {

struct CycleReport {
  std::size_t modified_folders = 0;
  std::size_t modified_files   = 0;
  std::size_t meta_written     = 0;
  std::size_t meta_failed      = 0;
  std::size_t purged_folders   = 0;
  std::size_t purged_files     = 0;

  std::chrono::milliseconds elapsed{0};

  bool Changed() const {
    return modified_folders || modified_files || purged_folders || purged_files;
  }
};

/*
  One full update cycle: scan -> enumerate -> extract -> purge,
  committed as a single write transaction.

  Not thread-safe; owned and driven by the single writer.
*/
class IndexCycle {
 public:
  IndexCycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<extract::MetadataExtractor> extractor,
             std::filesystem::path root, bool fast_first_scan);

  // throws on store failure; the transaction is rolled back
  CycleReport Run();

  bool FirstRunPending() const {
    return first_run_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;

  DirectoryScanner scanner_;
  FileEnumerator   enumerator_;
  MetadataUpdater  updater_;
  PurgePass        purge_;

  bool fast_first_scan_;
  bool first_run_ = true;
};

} // namespace framecache::index
