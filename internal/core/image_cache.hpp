#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/model/image_record.hpp"
#include "internal/index/index_cycle.hpp"
#include "internal/query/query_engine.hpp"
#include "internal/scheduler/cache_scheduler.hpp"

namespace framecache::core {

struct CacheStatus {
  scheduler::SchedulerState         state = scheduler::SchedulerState::kRunning;
  bool                              looping = false;
  uint64_t                          cycles  = 0;
  std::optional<index::CycleReport> last_cycle;
  bool                              portrait_pairs = false;
  int64_t                           images         = 0;
};

/*
  The operations exposed to the control layer.

  Writes go through the scheduler (single writer), reads through the
  query engine (read connection). Both are built by factory::Build.
*/
class ImageCache {
 public:
  ImageCache(std::shared_ptr<scheduler::CacheScheduler> scheduler, std::shared_ptr<query::QueryEngine> engine);

  // starts the background loop; paused = no cycle until PauseLooping(false)
  void Start(bool paused = false);

  index::CycleReport UpdateCache();

  std::vector<query::Slot> Query(std::string_view filter, std::string_view sort);

  db::model::ImageRecord GetFileInfo(int64_t file_id);

  void PauseLooping(bool paused);

  void Stop();

  void SetPortraitPairs(bool enabled);
  bool PortraitPairs() const;

  CacheStatus Status();

 private:
  std::shared_ptr<scheduler::CacheScheduler> scheduler_;
  std::shared_ptr<query::QueryEngine>        engine_;
};

} // namespace framecache::core
