#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/scheduler/command.hpp"

namespace framecache::scheduler {

/*
  Thread-safe blocking queue feeding the scheduler thread.
*/
class CommandQueue {
 public:
  // false once the queue is shut down
  bool Enqueue(Command command);

  // blocking wait; nullopt only after Shutdown
  std::optional<Command> Dequeue();

  // nullopt on timeout or after Shutdown
  std::optional<Command> DequeueFor(std::chrono::milliseconds timeout);

  // rejects further commands and returns the ones never dequeued
  std::queue<Command> Shutdown();

 private:
  std::optional<Command> PopLocked();

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Command>     queue_;
  bool                    shutdown_ = false;
};

} // namespace framecache::scheduler
