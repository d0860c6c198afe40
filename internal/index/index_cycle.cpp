#include "internal/index/index_cycle.hpp"

#include "internal/observability/logging.hpp"

namespace framecache::index {

using observability::IntField;

IndexCycle::IndexCycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<extract::MetadataExtractor> extractor,
                       std::filesystem::path root, bool fast_first_scan)
    : repository_(repository),
      scanner_(repository, std::move(root)),
      enumerator_(repository),
      updater_(repository, std::move(extractor)),
      purge_(repository),
      fast_first_scan_(fast_first_scan) {
}

CycleReport IndexCycle::Run() {
  const auto  started = std::chrono::steady_clock::now();
  CycleReport report;

  auto tx = repository_->Begin(db::TxMode::kWrite);

  const auto folders    = scanner_.Scan(*tx, first_run_ && fast_first_scan_);
  const auto files      = enumerator_.Enumerate(*tx, folders);
  const auto meta_stats = updater_.Update(*tx, files);
  const auto purged     = purge_.Run(*tx);

  tx->Commit();
  first_run_ = false;

  report.modified_folders = folders.size();
  report.modified_files   = files.size();
  report.meta_written     = meta_stats.written;
  report.meta_failed      = meta_stats.failed;
  report.purged_folders   = purged.folders;
  report.purged_files     = purged.files;
  report.elapsed          = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

  FRAMECACHE_LOG_DEBUG("cache cycle complete",
                       {IntField("modified_folders", static_cast<int64_t>(report.modified_folders)),
                        IntField("modified_files", static_cast<int64_t>(report.modified_files)),
                        IntField("meta_written", static_cast<int64_t>(report.meta_written)),
                        IntField("meta_failed", static_cast<int64_t>(report.meta_failed)),
                        IntField("purged_folders", static_cast<int64_t>(report.purged_folders)),
                        IntField("purged_files", static_cast<int64_t>(report.purged_files)),
                        IntField("elapsed_ms", report.elapsed.count())});

  return report;
}

} // namespace framecache::index
