#include "core/service/task_queue.hpp"

#include <exception>
#include <utility>

#include "core/util/log.hpp"

namespace gambit {

TaskQueue::TaskQueue(std::size_t workers) {
  if (workers == 0) {
    workers = 1;
  }
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

TaskQueue::~TaskQueue() {
  shutdown();
}

bool TaskQueue::post(std::string label, Task task) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) {
      return false;
    }
    queue_.push_back({std::move(label), std::move(task)});
  }
  work_cv_.notify_one();
  return true;
}

void TaskQueue::drain() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void TaskQueue::shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (stopping_ && workers_.empty()) {
      return;
    }
    stopping_ = true;
  }
  work_cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

std::size_t TaskQueue::pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size() + running_;
}

std::size_t TaskQueue::completed() const {
  std::lock_guard lock(mutex_);
  return completed_;
}

void TaskQueue::worker_loop() {
  while (true) {
    Entry entry;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      entry = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }

    try {
      entry.task();
    } catch (const std::exception& ex) {
      util::log_error("tasks", "Task '" + entry.label + "' threw: " + ex.what());
    }

    {
      std::lock_guard lock(mutex_);
      --running_;
      ++completed_;
    }
    idle_cv_.notify_all();
  }
}

}  // namespace gambit
