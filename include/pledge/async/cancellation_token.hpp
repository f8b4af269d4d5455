#pragma once

#include <memory>
#include <mutex>
#include <utility>

namespace pledge::async {

namespace _cancellation_detail {

// Anything a cancellation_token can point at: a future state or a timer.
class _cancellable {
 public:
  virtual ~_cancellable() = default;

  // Returns true if the request reached a pending target.
  virtual bool request_cancel() = 0;
};

}  // namespace _cancellation_detail

// Consumer-side handle returned by future::observe and timer_queue::schedule_after.
// Dropping a token does not cancel anything.
class cancellation_token {
 public:
  cancellation_token() noexcept = default;

  explicit cancellation_token(std::shared_ptr<_cancellation_detail::_cancellable> target) noexcept
      : target_(std::move(target)) {}

  // Best-effort. Returns false if the target already completed or there is no target.
  bool cancel() const {
    return target_ != nullptr && target_->request_cancel();
  }

  [[nodiscard]] bool empty() const noexcept {
    return target_ == nullptr;
  }

 private:
  std::shared_ptr<_cancellation_detail::_cancellable> target_;
};

// Holds the token of whichever stage of a composed computation is currently
// outstanding. Once cancel() was called every later assign() cancels the
// incoming token right away, the way a stop callback registered on a stopped
// source runs immediately.
class cancellation_slot {
 public:
  cancellation_slot() = default;

  cancellation_slot(const cancellation_slot&)            = delete;
  cancellation_slot& operator=(const cancellation_slot&) = delete;

  // Returns false if cancellation was already requested.
  bool assign(cancellation_token token) {
    std::unique_lock lock(mutex_);
    if (cancelled_) {
      lock.unlock();
      token.cancel();
      return false;
    }
    // The previous token is released outside the lock.
    std::swap(token_, token);
    lock.unlock();
    return true;
  }

  // Returns true if an outstanding stage received the request.
  bool cancel() {
    cancellation_token token;
    {
      std::scoped_lock lock(mutex_);
      if (cancelled_) {
        return false;
      }
      cancelled_ = true;
      std::swap(token_, token);
    }
    return token.cancel();
  }

  [[nodiscard]] bool is_cancelled() const {
    std::scoped_lock lock(mutex_);
    return cancelled_;
  }

 private:
  mutable std::mutex mutex_;
  bool               cancelled_ = false;
  cancellation_token token_;
};

}  // namespace pledge::async
