#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "internal/index/index_cycle.hpp"
#include "internal/scheduler/command_queue.hpp"

namespace framecache::scheduler {

enum class SchedulerState {
  kRunning,
  kPaused,
  kStopped,
};

const char* ToString(SchedulerState state);

/*
  The single writer of the index.

  A background thread runs one IndexCycle every interval while
  Running. Pause/resume/stop and on-demand cycles arrive as commands
  through the queue and are observed between cycles only, never
  pre-empting a cycle in progress.

  Stop lets the in-flight cycle finish, then releases the cycle and
  with it the writer connection.
*/
class CacheScheduler {
 public:
  CacheScheduler(std::unique_ptr<index::IndexCycle> cycle, std::chrono::milliseconds interval);
  ~CacheScheduler();

  CacheScheduler(const CacheScheduler&)            = delete;
  CacheScheduler& operator=(const CacheScheduler&) = delete;

  // starts the loop thread; throws util::InvalidState once stopped
  void Start(bool paused = false);

  // idempotent; concurrent callers return once the loop has exited
  void Stop();

  void Pause(bool paused);

  /*
    Runs one cycle now and returns its report. Routed to the loop
    thread when it is running, otherwise executed on the caller's
    thread. Cycle failures propagate to the caller.
  */
  index::CycleReport RunCycle();

  SchedulerState State() const {
    return state_;
  }

  bool Running() const {
    return thread_running_;
  }

  uint64_t CyclesCompleted() const {
    return cycles_completed_;
  }

  std::optional<index::CycleReport> LastReport() const;

 private:
  void Loop();

  // runs the cycle under cycle_mutex_ and records the report
  index::CycleReport Execute();

  // loop-driven cycle: failures are logged and rolled back, never fatal
  void ExecuteLogged();

  std::unique_ptr<index::IndexCycle> cycle_;
  std::chrono::milliseconds          interval_;

  std::shared_ptr<CommandQueue> queue_;

  // serializes Start and Stop; a second Stop waits for the first
  std::mutex                  lifecycle_mutex_;
  std::thread                 thread_;
  std::atomic<bool>           thread_running_{false};
  std::atomic<SchedulerState> state_{SchedulerState::kRunning};
  std::atomic<uint64_t>       cycles_completed_{0};

  std::mutex                        cycle_mutex_;
  mutable std::mutex                report_mutex_;
  std::optional<index::CycleReport> last_report_;
};

} // namespace framecache::scheduler
