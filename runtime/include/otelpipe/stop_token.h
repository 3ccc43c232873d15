#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace otelpipe {

namespace detail {

struct StopState {
  std::mutex mu;
  std::condition_variable cv;
  bool stopped = false;
  uint64_t next_callback_id = 0;
  std::unordered_map<uint64_t, std::function<void()>> callbacks;
};

}  // namespace detail

/**
 * Cooperative cancellation token.
 *
 * The orchestrator owns the StopSource.
 * Pipelines observe it via this token and sleep on it, so a stop request
 * wakes every waiter immediately instead of being noticed on the next poll.
 */
class StopToken {
 public:
  StopToken() noexcept = default;

  explicit StopToken(std::shared_ptr<detail::StopState> state) noexcept
      : state_(std::move(state)) {}

  // False for a default-constructed token, which can never be stopped
  bool stop_possible() const noexcept {
    return state_ != nullptr;
  }

  // Returns true if stop has been requested
  bool stop_requested() const noexcept {
    if (!state_) {
      return false;
    }
    std::lock_guard lock(state_->mu);
    return state_->stopped;
  }

  // Sleep until `deadline` or until stop is requested.
  // Returns true if stop was requested.
  template <typename Clock, typename Duration>
  bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) const {
    if (!state_) {
      std::this_thread::sleep_until(deadline);
      return false;
    }
    std::unique_lock lock(state_->mu);
    return state_->cv.wait_until(lock, deadline, [this] { return state_->stopped; });
  }

  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
    return wait_until(std::chrono::steady_clock::now() + timeout);
  }

  // Block until stop is requested.
  void wait() const {
    if (!state_) {
      return;
    }
    std::unique_lock lock(state_->mu);
    state_->cv.wait(lock, [this] { return state_->stopped; });
  }

 private:
  friend class StopCallback;

  std::shared_ptr<detail::StopState> state_;
};

class StopSource {
 public:
  StopSource() : state_(std::make_shared<detail::StopState>()) {}

  StopToken token() const noexcept {
    return StopToken{state_};
  }

  bool stop_requested() const noexcept {
    std::lock_guard lock(state_->mu);
    return state_->stopped;
  }

  // Broadcast stop to every waiter and run registered callbacks once.
  void request_stop() const {
    std::unordered_map<uint64_t, std::function<void()>> callbacks;
    {
      std::lock_guard lock(state_->mu);
      if (state_->stopped) {
        return;
      }
      state_->stopped = true;
      callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();
    for (auto& [id, cb] : callbacks) {
      cb();
    }
  }

 private:
  std::shared_ptr<detail::StopState> state_;
};

/**
 * Registers `cb` to run when stop is requested.
 * Runs immediately if stop was already requested.
 * Deregistered on destruction. A callback that already started may still be
 * running after the destructor returns, so it must only touch state it owns.
 */
class StopCallback {
 public:
  StopCallback(const StopToken& token, std::function<void()> cb) : state_(token.state_) {
    if (!state_) {
      return;
    }
    {
      std::lock_guard lock(state_->mu);
      if (!state_->stopped) {
        id_ = state_->next_callback_id++;
        state_->callbacks.emplace(id_, std::move(cb));
        registered_ = true;
        return;
      }
    }
    cb();
  }

  ~StopCallback() {
    if (registered_) {
      std::lock_guard lock(state_->mu);
      state_->callbacks.erase(id_);
    }
  }

  StopCallback(const StopCallback&) = delete;
  StopCallback& operator=(const StopCallback&) = delete;

 private:
  std::shared_ptr<detail::StopState> state_;
  uint64_t id_ = 0;
  bool registered_ = false;
};

}  // namespace otelpipe
