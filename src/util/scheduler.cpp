#include "util/scheduler.hpp"

#include <exception>

#include "util/logging.hpp"

namespace dappvault::util {

Scheduler::Scheduler() {
  thread_ = std::jthread([this](std::stop_token stop) { Run(stop); });
}

Scheduler::~Scheduler() { Stop(); }

Scheduler::TaskId Scheduler::Schedule(std::chrono::milliseconds delay, Task task) {
  std::lock_guard<std::mutex> lock(mutex_);
  const TaskId id = next_id_++;
  if (stopped_) {
    return id;
  }
  const auto due = Clock::now() + delay;
  queue_.emplace(Key{due, id}, std::move(task));
  due_by_id_.emplace(id, due);
  cv_.notify_all();
  return id;
}

bool Scheduler::Cancel(TaskId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = due_by_id_.find(id);
  if (it == due_by_id_.end()) {
    return false;
  }
  queue_.erase(Key{it->second, id});
  due_by_id_.erase(it);
  cv_.notify_all();
  return true;
}

void Scheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    queue_.clear();
    due_by_id_.clear();
  }
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  cv_.notify_all();
  // A task that stops the scheduler cannot join its own thread; the worker
  // exits when that task returns.
  if (thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach();
    return;
  }
  thread_.join();
}

std::size_t Scheduler::QueuedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void Scheduler::Run(std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop.stop_requested()) {
    if (queue_.empty()) {
      cv_.wait(lock, stop, [this] { return !queue_.empty(); });
      continue;
    }
    auto head = queue_.begin();
    const auto due = head->first.first;
    if (Clock::now() < due) {
      cv_.wait_until(lock, stop, due,
                     [this, due] { return queue_.empty() || queue_.begin()->first.first < due; });
      continue;
    }
    Task task = std::move(head->second);
    due_by_id_.erase(head->first.second);
    queue_.erase(head);
    lock.unlock();
    try {
      task();
    } catch (const std::exception& ex) {
      LogError("scheduler", std::string("task failed: ") + ex.what());
    }
    lock.lock();
  }
}

}  // namespace dappvault::util
