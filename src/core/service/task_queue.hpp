#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gambit {

// Worker threads for fire-and-forget network work. Tasks outlive the caller that posted
// them; they only stop when the queue is shut down.
class TaskQueue {
public:
  using Task = std::function<void()>;

  explicit TaskQueue(std::size_t workers = 2);
  ~TaskQueue();

  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  // False once shutdown has begun.
  bool post(std::string label, Task task);
  // Blocks until the queue is empty and no task is running.
  void drain();
  // Runs what is already queued, then joins the workers.
  void shutdown();

  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] std::size_t completed() const;

private:
  struct Entry {
    std::string label;
    Task task;
  };

  void worker_loop();

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Entry> queue_;
  std::vector<std::thread> workers_;
  std::size_t running_ = 0;
  std::size_t completed_ = 0;
  bool stopping_ = false;
};

}  // namespace gambit
