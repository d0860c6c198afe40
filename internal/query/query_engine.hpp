#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/geo/geocoder.hpp"
#include "internal/query/portrait_pairing.hpp"

namespace framecache::query {

/*
  Read side of the cache.

  Owns the read repository (its own connection); calls are serialised
  on that connection and may run concurrently with the writer cycle.
  The geocode cache insert in GetFileInfo is the only write issued here.
*/
class QueryEngine {
 public:
  // geocoder may be null: coordinates are then never resolved
  QueryEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<geo::Geocoder> geocoder, bool portrait_pairs);

  // throws util::InvalidArgument for a rejected expression, util::StoreError otherwise
  std::vector<Slot> Query(std::string_view filter, std::string_view ordering);

  // throws util::NotFound for an unknown id
  db::model::ImageRecord GetFileInfo(int64_t file_id);

  int64_t Count();

  void SetPortraitPairs(bool enabled) {
    portrait_pairs_ = enabled;
  }

  bool PortraitPairs() const {
    return portrait_pairs_;
  }

 private:
  std::vector<std::optional<int64_t>> Select(db::Transaction& tx, const std::string& where, const std::string& order, db::Selection selection);

  std::optional<db::model::ImageRecord> ReadImage(int64_t file_id);
  bool                                  CacheLocation(const db::model::LocationRecord& record);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<geo::Geocoder>  geocoder_;
  std::atomic<bool>               portrait_pairs_;

  std::mutex mutex_;
};

} // namespace framecache::query
