#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/extract/metadata_extractor.hpp"
#include "internal/index/file_enumerator.hpp"

namespace framecache::index {

struct UpdateStats {
  std::size_t written = 0;
  std::size_t failed  = 0;
};

// Orientation values whose display is rotated by 90 or 270 degrees.
inline bool IsSideways(int orientation) {
  return orientation >= 5 && orientation <= 8;
}

/*
  Turns raw extracted values into a stored Meta row:
  dimensions corrected for orientation, capture time parsed from
  DateTimeOriginal (falling back to file_mtime) and GPS rounded.
  GPS is kept only when both latitude and longitude are present.
*/
db::model::MetaRecord Normalize(int64_t file_id, const extract::ExtractedMetadata& raw, double file_mtime);

/*
  Extracts and upserts metadata for every modified file. A file whose
  extraction throws is logged and skipped; the rest of the batch goes on.
*/
class MetadataUpdater {
 public:
  MetadataUpdater(std::shared_ptr<db::Repository> repository, std::shared_ptr<extract::MetadataExtractor> extractor);

  UpdateStats Update(db::Transaction& tx, const std::vector<ModifiedFile>& files);

 private:
  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<extract::MetadataExtractor> extractor_;
};

} // namespace framecache::index
