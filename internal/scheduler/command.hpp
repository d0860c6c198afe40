#pragma once

#include <future>
#include <memory>

#include "internal/index/index_cycle.hpp"

namespace framecache::scheduler {

enum class CommandType {
  kRunCycle,
  kPause,
  kResume,
  kStop,
};

/*
  A request for the scheduler thread.

  Only kRunCycle carries a reply; the caller blocks on its future
  for the cycle report (or the exception the cycle threw).
*/
struct Command {
  CommandType type = CommandType::kRunCycle;

  std::shared_ptr<std::promise<index::CycleReport>> reply;
};

} // namespace framecache::scheduler
