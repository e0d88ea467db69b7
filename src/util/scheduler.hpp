#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <utility>

namespace dappvault::util {

// Single-threaded timer queue shared by the services for auto-lock, approval
// timeouts and reconciliation ticks. Tasks run on the scheduler thread without
// the scheduler lock held, so a task may Schedule() or Cancel() freely. A task
// that throws is logged and dropped.
class Scheduler {
 public:
  using Clock = std::chrono::steady_clock;
  using TaskId = std::uint64_t;
  using Task = std::function<void()>;

  Scheduler();
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  TaskId Schedule(std::chrono::milliseconds delay, Task task);
  TaskId Post(Task task) { return Schedule(std::chrono::milliseconds(0), std::move(task)); }

  // Returns true if the task was still queued. A task that is already running
  // is not interrupted.
  bool Cancel(TaskId id);

  // Drops every queued task and joins the worker. Idempotent.
  void Stop();

  std::size_t QueuedCount() const;

 private:
  using Key = std::pair<Clock::time_point, TaskId>;

  void Run(std::stop_token stop);

  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  std::map<Key, Task> queue_;
  std::unordered_map<TaskId, Clock::time_point> due_by_id_;
  TaskId next_id_{1};
  bool stopped_{false};
  std::jthread thread_;
};

}  // namespace dappvault::util
