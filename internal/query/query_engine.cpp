#include "internal/query/query_engine.hpp"


#include "internal/observability/logging.hpp"
#include "internal/query/filter_guard.hpp"
#include "internal/util/errors.hpp"

namespace framecache::query {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

QueryEngine::QueryEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<geo::Geocoder> geocoder, bool portrait_pairs)
    : repository_(std::move(repository)), geocoder_(std::move(geocoder)), portrait_pairs_(portrait_pairs) {
}

std::vector<std::optional<int64_t>> QueryEngine::Select(db::Transaction& tx, const std::string& where, const std::string& order,
                                                        db::Selection selection) {
  std::vector<std::optional<int64_t>> ids;
  auto                                result = repository_->SelectImageIds(tx, where, order, selection, &ids);
  if (!result) {
    // statement preparation failed: the expression tokenised but is not valid SQL
    if (result.code == db::ErrorCode::InternalError) {
      throw util::InvalidArgument("query rejected: " + result.message);
    }
    throw util::StoreError(std::string("query failed (") + db::ToString(result.code) + "): " + result.message);
  }
  return ids;
}

std::vector<Slot> QueryEngine::Query(std::string_view filter, std::string_view ordering) {
  const auto where = FilterGuard::Filter(filter);
  const auto order = FilterGuard::Ordering(ordering);

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin(db::TxMode::kRead);

  std::vector<Slot> slots;
  if (!portrait_pairs_) {
    for (const auto& id : Select(*tx, where, order, db::Selection::kAll)) {
      if (id) slots.push_back({*id});
    }
  } else {
    const auto full      = Select(*tx, where, order, db::Selection::kLandscapeOrHole);
    const auto portraits = Select(*tx, where, order, db::Selection::kPortraitOnly);
    slots                = PairPortraits(full, portraits);
  }

  tx->Commit();
  return slots;
}

std::optional<db::model::ImageRecord> QueryEngine::ReadImage(int64_t file_id) {
  std::lock_guard lock(mutex_);
  auto            tx    = repository_->Begin(db::TxMode::kRead);
  auto            image = repository_->GetImage(*tx, file_id);
  tx->Commit();
  return image;
}

bool QueryEngine::CacheLocation(const db::model::LocationRecord& record) {
  std::lock_guard lock(mutex_);
  try {
    auto tx = repository_->Begin(db::TxMode::kWrite);
    if (auto result = repository_->InsertLocation(*tx, record); !result) {
      FRAMECACHE_LOG_WARN("location insert failed", {StringField("code", db::ToString(result.code)), StringField("error", result.message)});
      return false;
    }
    tx->Commit();
  } catch (const util::StoreError& e) {
    // typically SQLITE_BUSY while the writer holds the lock past the busy timeout
    FRAMECACHE_LOG_WARN("location insert failed", {StringField("error", e.what())});
    return false;
  }
  return true;
}

db::model::ImageRecord QueryEngine::GetFileInfo(int64_t file_id) {
  auto image = ReadImage(file_id);
  if (!image) {
    throw util::NotFound("file_id " + std::to_string(file_id) + " not in cache");
  }

  if (!geocoder_ || image->location || !image->HasCoordinates()) {
    return *image;
  }

  // geocoder is called without holding the connection lock
  const double latitude    = geo::RoundCoordinate(*image->meta->latitude);
  const double longitude   = geo::RoundCoordinate(*image->meta->longitude);
  const auto   description = geocoder_->Resolve(latitude, longitude);
  if (description.empty()) {
    FRAMECACHE_LOG_DEBUG("no location for coordinates", {DoubleField("latitude", latitude), DoubleField("longitude", longitude)});
    return *image;
  }

  if (!CacheLocation({latitude, longitude, description})) {
    return *image;
  }

  if (auto refreshed = ReadImage(file_id)) {
    return *refreshed;
  }
  // purged between the two reads
  FRAMECACHE_LOG_DEBUG("file purged during geocode", {IntField("file_id", file_id)});
  image->location = description;
  return *image;
}

int64_t QueryEngine::Count() {
  std::lock_guard lock(mutex_);
  auto            tx    = repository_->Begin(db::TxMode::kRead);
  const auto      count = repository_->CountImages(*tx);
  tx->Commit();
  return count;
}

} // namespace framecache::query
