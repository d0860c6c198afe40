#include "internal/index/metadata_updater.hpp"

#include <exception>
#include <utility>

#include "internal/geo/geocoder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace framecache::index {

using observability::StringField;

db::model::MetaRecord Normalize(int64_t file_id, const extract::ExtractedMetadata& raw, double file_mtime) {
  db::model::MetaRecord meta;
  meta.file_id     = file_id;
  meta.orientation = raw.orientation;
  meta.width       = raw.width;
  meta.height      = raw.height;
  if (IsSideways(raw.orientation)) {
    std::swap(meta.width, meta.height);
  }

  meta.capture_time = file_mtime;
  if (raw.date_time_original) {
    if (auto parsed = util::ParseExifDateTime(*raw.date_time_original)) {
      meta.capture_time = *parsed;
    }
  }

  meta.f_number      = raw.f_number.value_or(0.0);
  meta.iso           = raw.iso.value_or(0.0);
  meta.exposure_time = raw.exposure_time;
  meta.focal_length  = raw.focal_length;
  meta.make          = raw.make;
  meta.model         = raw.model;
  meta.lens          = raw.lens;
  meta.rating        = raw.rating;

  if (raw.latitude && raw.longitude) {
    meta.latitude  = geo::RoundCoordinate(*raw.latitude);
    meta.longitude = geo::RoundCoordinate(*raw.longitude);
  }

  return meta;
}

MetadataUpdater::MetadataUpdater(std::shared_ptr<db::Repository> repository, std::shared_ptr<extract::MetadataExtractor> extractor)
    : repository_(std::move(repository)), extractor_(std::move(extractor)) {
}

UpdateStats MetadataUpdater::Update(db::Transaction& tx, const std::vector<ModifiedFile>& files) {
  UpdateStats stats;

  for (const auto& file : files) {
    db::model::MetaRecord meta;
    try {
      meta = Normalize(file.file_id, extractor_->Extract(file.path), file.last_modified);
    } catch (const std::exception& e) {
      FRAMECACHE_LOG_WARN("metadata extraction failed", {StringField("path", file.path), StringField("error", e.what())});
      ++stats.failed;
      continue;
    }

    // store errors are not per-file: let them abort the cycle
    if (auto result = repository_->UpsertMeta(tx, meta); !result) {
      throw util::StoreError("meta upsert failed: " + result.message);
    }
    ++stats.written;
  }

  return stats;
}

} // namespace framecache::index
