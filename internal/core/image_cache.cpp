#include "internal/core/image_cache.hpp"

#include "internal/observability/logging.hpp"

namespace framecache::core {

using observability::BoolField;

ImageCache::ImageCache(std::shared_ptr<scheduler::CacheScheduler> scheduler, std::shared_ptr<query::QueryEngine> engine)
    : scheduler_(std::move(scheduler)), engine_(std::move(engine)) {
}

void ImageCache::Start(bool paused) {
  scheduler_->Start(paused);
}

index::CycleReport ImageCache::UpdateCache() {
  return scheduler_->RunCycle();
}

std::vector<query::Slot> ImageCache::Query(std::string_view filter, std::string_view sort) {
  return engine_->Query(filter, sort);
}

db::model::ImageRecord ImageCache::GetFileInfo(int64_t file_id) {
  return engine_->GetFileInfo(file_id);
}

void ImageCache::PauseLooping(bool paused) {
  scheduler_->Pause(paused);
}

void ImageCache::Stop() {
  scheduler_->Stop();
}

void ImageCache::SetPortraitPairs(bool enabled) {
  engine_->SetPortraitPairs(enabled);
  FRAMECACHE_LOG_INFO("portrait pairing changed", {BoolField("enabled", enabled)});
}

bool ImageCache::PortraitPairs() const {
  return engine_->PortraitPairs();
}

CacheStatus ImageCache::Status() {
  CacheStatus status;
  status.state          = scheduler_->State();
  status.looping        = scheduler_->Running();
  status.cycles         = scheduler_->CyclesCompleted();
  status.last_cycle     = scheduler_->LastReport();
  status.portrait_pairs = engine_->PortraitPairs();
  status.images         = engine_->Count();
  return status;
}

} // namespace framecache::core
