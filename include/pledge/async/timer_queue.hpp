#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "cancellation_token.hpp"

namespace pledge::async {

// deadline timers measure monotonic time; wall_clock timers follow the system
// clock, so time spent with the device asleep counts towards them.
enum class timer_kind {
  deadline,
  wall_clock,
};

struct timer_queue_options {
  // Upper bound on how long a wall-clock timer goes without re-reading the clock.
  std::chrono::milliseconds wall_clock_poll_interval{1000};
};

namespace _timer_detail {

using _cancel_counter = std::atomic<std::size_t>;

class _timer final : public _cancellation_detail::_cancellable {
 public:
  enum : int { pending, fired, cancelled };

  _timer(std::function<void()> callback, std::shared_ptr<_cancel_counter> cancelled_count)
      : callback_(std::move(callback)), cancelled_count_(std::move(cancelled_count)) {}

  bool request_cancel() override {
    int expected = pending;
    if (!state_.compare_exchange_strong(expected, cancelled, std::memory_order_acq_rel)) {
      return false;
    }
    // Only the winner of the exchange touches callback_.
    callback_ = nullptr;
    cancelled_count_->fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  void fire() {
    int expected = pending;
    if (!state_.compare_exchange_strong(expected, fired, std::memory_order_acq_rel)) {
      return;
    }
    auto callback = std::exchange(callback_, nullptr);
    callback();
  }

  [[nodiscard]] bool is_cancelled() const noexcept {
    return state_.load(std::memory_order_acquire) == cancelled;
  }

 private:
  std::atomic<int>                 state_{pending};
  std::function<void()>            callback_;
  std::shared_ptr<_cancel_counter> cancelled_count_;
};

template <class Clock>
struct _entry {
  typename Clock::time_point deadline;
  std::uint64_t              sequence;
  std::shared_ptr<_timer>    timer;
};

// Earliest deadline on top; equal deadlines fire in scheduling order.
template <class Clock>
struct _later {
  bool operator()(const _entry<Clock>& lhs, const _entry<Clock>& rhs) const noexcept {
    if (lhs.deadline != rhs.deadline) {
      return lhs.deadline > rhs.deadline;
    }
    return lhs.sequence > rhs.sequence;
  }
};

template <class Clock>
using _heap = std::priority_queue<_entry<Clock>, std::vector<_entry<Clock>>, _later<Clock>>;

template <class Clock>
void _drop_cancelled(_heap<Clock>& heap) {
  std::vector<_entry<Clock>> live;
  live.reserve(heap.size());
  while (!heap.empty()) {
    if (!heap.top().timer->is_cancelled()) {
      live.push_back(heap.top());
    }
    heap.pop();
  }
  heap = _heap<Clock>(_later<Clock>{}, std::move(live));
}

}  // namespace _timer_detail

// A single timer thread serving deadline and wall-clock timers. Callbacks run
// on the timer thread, outside the queue lock.
class timer_queue {
 public:
  explicit timer_queue(timer_queue_options options = {})
      : options_(options), thread_([this] -> void { run(); }) {}

  ~timer_queue() {
    {
      std::scoped_lock lock(mutex_);
      stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  timer_queue(const timer_queue&)                    = delete;
  auto operator=(const timer_queue&) -> timer_queue& = delete;

  // Schedules callback to run once after delay. The returned token cancels the
  // timer up to the moment it fires.
  template <class Rep, class Period>
  auto schedule_after(timer_kind kind, std::chrono::duration<Rep, Period> delay,
                      std::function<void()> callback) -> cancellation_token {
    auto timer = std::make_shared<_timer_detail::_timer>(std::move(callback), cancelled_count_);
    {
      std::scoped_lock lock(mutex_);
      drop_cancelled();
      if (kind == timer_kind::deadline) {
        deadline_timers_.push({std::chrono::steady_clock::now()
                                   + std::chrono::ceil<std::chrono::steady_clock::duration>(delay),
                               next_sequence_++, timer});
      } else {
        wall_clock_timers_.push({std::chrono::system_clock::now()
                                     + std::chrono::ceil<std::chrono::system_clock::duration>(delay),
                                 next_sequence_++, timer});
      }
    }
    cv_.notify_one();
    return cancellation_token{timer};
  }

  // Timers still held by the queue. Cancelled timers are released lazily, at the
  // latest once they make up half of the queue.
  [[nodiscard]] auto pending_count() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return deadline_timers_.size() + wall_clock_timers_.size();
  }

 private:
  template <class Clock>
  static void _collect_due(_timer_detail::_heap<Clock>& heap, typename Clock::time_point now,
                           std::vector<std::shared_ptr<_timer_detail::_timer>>& due) {
    while (!heap.empty() && (heap.top().deadline <= now || heap.top().timer->is_cancelled())) {
      due.push_back(heap.top().timer);
      heap.pop();
    }
  }

  // Called with mutex_ held. Rebuilds the heaps once more than half of their
  // entries were cancelled, so a far-off timer on top does not pin them.
  void drop_cancelled() {
    auto size = deadline_timers_.size() + wall_clock_timers_.size();
    if (cancelled_count_->load(std::memory_order_relaxed) * 2 <= size) {
      return;
    }
    cancelled_count_->store(0, std::memory_order_relaxed);
    _timer_detail::_drop_cancelled(deadline_timers_);
    _timer_detail::_drop_cancelled(wall_clock_timers_);
  }

  void run() {
    spdlog::trace("timer_queue thread started");

    std::unique_lock lock(mutex_);
    while (!stop_) {
      std::vector<std::shared_ptr<_timer_detail::_timer>> due;
      _collect_due<std::chrono::steady_clock>(deadline_timers_, std::chrono::steady_clock::now(),
                                              due);
      _collect_due<std::chrono::system_clock>(wall_clock_timers_, std::chrono::system_clock::now(),
                                              due);

      if (!due.empty()) {
        lock.unlock();
        for (auto& timer : due) {
          timer->fire();
        }
        due.clear();
        lock.lock();
        continue;
      }

      if (deadline_timers_.empty() && wall_clock_timers_.empty()) {
        cv_.wait(lock, [this] -> bool {
          return stop_ || !deadline_timers_.empty() || !wall_clock_timers_.empty();
        });
        continue;
      }

      auto wake_up = std::chrono::steady_clock::time_point::max();
      if (!deadline_timers_.empty()) {
        wake_up = deadline_timers_.top().deadline;
      }
      if (!wall_clock_timers_.empty()) {
        auto remaining = std::chrono::ceil<std::chrono::steady_clock::duration>(
            wall_clock_timers_.top().deadline - std::chrono::system_clock::now());
        remaining = std::min<std::chrono::steady_clock::duration>(
            remaining, options_.wall_clock_poll_interval);
        wake_up = std::min(wake_up, std::chrono::steady_clock::now() + remaining);
      }

      cv_.wait_until(lock, wake_up);
    }

    spdlog::trace("timer_queue thread stopped, {} timers discarded",
                  deadline_timers_.size() + wall_clock_timers_.size());
  }

  timer_queue_options                             options_;
  mutable std::mutex                              mutex_;
  std::condition_variable                         cv_;
  _timer_detail::_heap<std::chrono::steady_clock> deadline_timers_;
  _timer_detail::_heap<std::chrono::system_clock> wall_clock_timers_;
  std::shared_ptr<_timer_detail::_cancel_counter> cancelled_count_ =
      std::make_shared<_timer_detail::_cancel_counter>(0);
  std::uint64_t                                   next_sequence_ = 0;
  bool                                            stop_          = false;
  std::thread                                     thread_;
};

}  // namespace pledge::async
