#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>

namespace pw::platform {

class CancellationSource;

// Cooperative cancellation flag shared between a source and any number of
// tokens. A default-constructed token is never cancelled.
class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancellationRequested() const noexcept {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  // Returns true when cancellation was requested before the timeout elapsed.
  bool WaitFor(std::chrono::milliseconds timeout) const {
    if (!state_) {
      return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this]() {
      return state_->cancelled.load(std::memory_order_acquire);
    });
  }

 private:
  friend class CancellationSource;

  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> cancelled{false};
  };

  explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
};

class CancellationSource {
 public:
  CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

  void Cancel() {
    {
      std::lock_guard<std::mutex> guard(state_->mutex);
      state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
  }

  bool IsCancellationRequested() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
  }

  CancellationToken Token() const { return CancellationToken(state_); }

 private:
  std::shared_ptr<CancellationToken::State> state_;
};

} // namespace pw::platform
