#include "internal/scheduler/cache_scheduler.hpp"

#include <exception>
#include <future>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace framecache::scheduler {

using observability::IntField;
using observability::StringField;

const char* ToString(SchedulerState state) {
  switch (state) {
    case SchedulerState::kRunning:
      return "running";
    case SchedulerState::kPaused:
      return "paused";
    case SchedulerState::kStopped:
      return "stopped";
  }
  return "unknown";
}

CacheScheduler::CacheScheduler(std::unique_ptr<index::IndexCycle> cycle, std::chrono::milliseconds interval)
    : cycle_(std::move(cycle)), interval_(interval), queue_(std::make_shared<CommandQueue>()) {
}

CacheScheduler::~CacheScheduler() {
  Stop();
}

void CacheScheduler::Start(bool paused) {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (state_ == SchedulerState::kStopped) {
    throw util::InvalidState("cache scheduler already stopped");
  }
  if (thread_running_) return;

  state_          = paused ? SchedulerState::kPaused : SchedulerState::kRunning;
  thread_running_ = true;
  thread_         = std::thread(&CacheScheduler::Loop, this);

  FRAMECACHE_LOG_INFO("cache scheduler started",
                      {StringField("state", ToString(state_)), IntField("interval_ms", interval_.count())});
}

void CacheScheduler::Stop() {
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (state_ == SchedulerState::kStopped) return;

  if (thread_.joinable()) {
    queue_->Enqueue({CommandType::kStop, nullptr});
    thread_.join();
  }
  thread_running_ = false;

  for (auto pending = queue_->Shutdown(); !pending.empty(); pending.pop()) {
    if (auto& reply = pending.front().reply) {
      reply->set_exception(std::make_exception_ptr(util::InvalidState("cache scheduler stopped")));
    }
  }

  {
    // each cycle commits its own transaction, so releasing the cycle
    // leaves nothing uncommitted behind
    std::lock_guard lock(cycle_mutex_);
    cycle_.reset();
  }
  state_ = SchedulerState::kStopped;

  FRAMECACHE_LOG_INFO("cache scheduler stopped", {IntField("cycles", static_cast<int64_t>(cycles_completed_.load()))});
}

void CacheScheduler::Pause(bool paused) {
  if (state_ == SchedulerState::kStopped) {
    throw util::InvalidState("cache scheduler stopped");
  }

  if (!thread_running_) {
    state_ = paused ? SchedulerState::kPaused : SchedulerState::kRunning;
    return;
  }
  queue_->Enqueue({paused ? CommandType::kPause : CommandType::kResume, nullptr});
}

index::CycleReport CacheScheduler::RunCycle() {
  if (!thread_running_) {
    return Execute();
  }

  auto reply  = std::make_shared<std::promise<index::CycleReport>>();
  auto future = reply->get_future();
  if (!queue_->Enqueue({CommandType::kRunCycle, reply})) {
    throw util::InvalidState("cache scheduler stopped");
  }
  return future.get();
}

std::optional<index::CycleReport> CacheScheduler::LastReport() const {
  std::lock_guard lock(report_mutex_);
  return last_report_;
}

index::CycleReport CacheScheduler::Execute() {
  std::lock_guard lock(cycle_mutex_);
  if (!cycle_) {
    throw util::InvalidState("cache scheduler stopped");
  }

  auto report = cycle_->Run();
  ++cycles_completed_;
  {
    std::lock_guard report_lock(report_mutex_);
    last_report_ = report;
  }
  return report;
}

void CacheScheduler::ExecuteLogged() {
  try {
    Execute();
  } catch (const std::exception& e) {
    FRAMECACHE_LOG_ERROR("cache cycle failed", {StringField("error", e.what())});
  }
}

void CacheScheduler::Loop() {
  auto next_cycle = std::chrono::steady_clock::now();

  while (true) {
    std::optional<Command> command;
    if (state_ == SchedulerState::kRunning) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= next_cycle) {
        ExecuteLogged();
        next_cycle = std::chrono::steady_clock::now() + interval_;
        continue;
      }
      command = queue_->DequeueFor(std::chrono::duration_cast<std::chrono::milliseconds>(next_cycle - now));
    } else {
      command = queue_->Dequeue();
    }

    if (!command) continue;

    switch (command->type) {
      case CommandType::kRunCycle:
        try {
          command->reply->set_value(Execute());
        } catch (const std::exception& e) {
          FRAMECACHE_LOG_ERROR("cache cycle failed", {StringField("error", e.what())});
          command->reply->set_exception(std::current_exception());
        }
        next_cycle = std::chrono::steady_clock::now() + interval_;
        break;
      case CommandType::kPause:
        state_ = SchedulerState::kPaused;
        FRAMECACHE_LOG_INFO("cache scheduler paused");
        break;
      case CommandType::kResume:
        if (state_ == SchedulerState::kPaused) {
          state_     = SchedulerState::kRunning;
          next_cycle = std::chrono::steady_clock::now();
          FRAMECACHE_LOG_INFO("cache scheduler resumed");
        }
        break;
      case CommandType::kStop:
        return;
    }
  }
}

} // namespace framecache::scheduler
