#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace gambit::util {

class CancellationToken;

class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {}

  void cancel() {
    {
      std::lock_guard lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  [[nodiscard]] bool cancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

  [[nodiscard]] CancellationToken token() const;

private:
  friend class CancellationToken;

  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
  };

  std::shared_ptr<State> state_;
};

// Copyable view of a CancellationSource. A default-constructed token is never cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] bool cancelled() const {
    if (!state_) {
      return false;
    }
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

  // Sleeps up to `duration`; returns true as soon as cancellation is requested.
  bool wait_for(std::chrono::milliseconds duration) const {
    if (!state_) {
      std::this_thread::sleep_for(duration);
      return false;
    }
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
  }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state) : state_(std::move(state)) {}

  std::shared_ptr<CancellationSource::State> state_;
};

inline CancellationToken CancellationSource::token() const {
  return CancellationToken{state_};
}

}  // namespace gambit::util
