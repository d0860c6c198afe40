#include "internal/scheduler/command_queue.hpp"

namespace framecache::scheduler {

bool CommandQueue::Enqueue(Command command) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(command));
  }
  cv_.notify_one();
  return true;
}

std::optional<Command> CommandQueue::PopLocked() {
  if (queue_.empty()) return std::nullopt;

  Command command = std::move(queue_.front());
  queue_.pop();
  return command;
}

std::optional<Command> CommandQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;
  return PopLocked();
}

std::optional<Command> CommandQueue::DequeueFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;
  return PopLocked();
}

std::queue<Command> CommandQueue::Shutdown() {
  std::queue<Command> pending;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    std::swap(pending, queue_);
  }
  cv_.notify_all();
  return pending;
}

} // namespace framecache::scheduler
