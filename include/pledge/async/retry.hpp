#pragma once

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "cancellation_token.hpp"
#include "completion.hpp"
#include "future.hpp"
#include "then.hpp"
#include "timer_queue.hpp"
#include "utils.hpp"

namespace pledge::async {

// ============================================================================
// wait_policy - spacing between retry attempts
// ============================================================================

class wait_policy {
 public:
  using duration = std::chrono::milliseconds;

  enum class kind {
    immediate,
    constant,
    exponential,
  };

  // Always yields zero.
  [[nodiscard]] static auto immediate() noexcept -> wait_policy {
    return wait_policy{kind::immediate, duration::zero(), 1.0, duration::zero()};
  }

  // Always yields delay.
  [[nodiscard]] static auto constant(duration delay) noexcept -> wait_policy {
    return wait_policy{kind::constant, delay, 1.0, delay};
  }

  // Yields initial, initial * multiplier, ... capped at max_delay.
  [[nodiscard]] static auto exponential(duration initial, double multiplier,
                                        duration max_delay) noexcept -> wait_policy {
    return wait_policy{kind::exponential, initial, multiplier, max_delay};
  }

  [[nodiscard]] auto type() const noexcept -> kind {
    return kind_;
  }

  // Infinite sequence of waits described by a policy.
  class sequence;

  [[nodiscard]] auto make_sequence() const noexcept -> sequence;

 private:
  wait_policy(kind k, duration initial, double multiplier, duration max_delay) noexcept
      : kind_(k), initial_(initial), multiplier_(multiplier), max_delay_(max_delay) {}

  kind     kind_;
  duration initial_;
  double   multiplier_;
  duration max_delay_;
};

class wait_policy::sequence {
 public:
  explicit sequence(const wait_policy& policy) noexcept
      : policy_(policy), current_(policy.initial_) {}

  auto next() noexcept -> duration {
    switch (policy_.kind_) {
      case kind::immediate:
        return duration::zero();
      case kind::constant:
        return policy_.initial_;
      case kind::exponential:
        break;
    }

    auto delay = std::min(current_, policy_.max_delay_);
    auto grown = std::chrono::duration_cast<duration>(
        std::chrono::duration<double, std::milli>(current_.count() * policy_.multiplier_));
    current_ = std::min(grown, policy_.max_delay_);
    return delay;
  }

 private:
  wait_policy policy_;
  duration    current_;
};

inline auto wait_policy::make_sequence() const noexcept -> sequence {
  return sequence{*this};
}

struct retry_strategy {
  // Total number of attempts, the first one included. Zero counts as one.
  std::size_t max_attempts = 1;
  wait_policy wait         = wait_policy::immediate();
  timer_kind  timer        = timer_kind::deadline;
};

// ============================================================================
// retry - re-runs a future producer until it succeeds or runs out of attempts
// ============================================================================

namespace _retry_detail {

template <class T, class E>
class _retry_state : public std::enable_shared_from_this<_retry_state<T, E>> {
 public:
  using completion_type = completion<T, E>;
  using producer_type   = std::function<future<T, E>()>;

  _retry_state(retry_strategy strategy, timer_queue& timers, producer_type producer,
               resolver<T, E> r)
      : max_attempts_(std::max<std::size_t>(strategy.max_attempts, 1)),
        timer_kind_(strategy.timer),
        waits_(strategy.wait.make_sequence()),
        timers_(&timers),
        producer_(std::move(producer)),
        resolver_(std::move(r)) {}

  // Runs attempts back to back while they fail synchronously with a zero wait,
  // so a producer that completes inline does not grow the stack.
  void attempt() {
    std::unique_lock lock(mutex_);
    while (true) {
      if (cancelled_) {
        return;
      }
      ++attempts_;
      attempting_ = true;
      next_wait_.reset();
      lock.unlock();

      auto self  = this->shared_from_this();
      auto token = producer_().observe(
          [self = std::move(self)](const completion_type& c) { self->on_attempt_completed(c); });
      // Nobody else assigns the slot while attempting_ is set.
      slot_.assign(std::move(token));

      lock.lock();
      attempting_ = false;
      if (!next_wait_) {
        return;
      }

      auto wait = *next_wait_;
      next_wait_.reset();
      if (wait > wait_policy::duration::zero()) {
        schedule_wait(lock, wait);
        return;
      }
    }
  }

  void cancel() {
    {
      std::scoped_lock lock(mutex_);
      cancelled_ = true;
    }
    slot_.cancel();
    resolver_.set_cancelled();
  }

 private:
  void on_attempt_completed(const completion_type& c) {
    if (!c.has_error()) {
      resolver_.resolve(c);
      return;
    }

    std::unique_lock lock(mutex_);
    if (cancelled_) {
      return;
    }
    if (attempts_ >= max_attempts_) {
      auto attempts = attempts_;
      lock.unlock();
      spdlog::warn("retry: giving up after {} failed attempt(s)", attempts);
      resolver_.resolve(c);
      return;
    }

    auto wait = waits_.next();
    spdlog::debug("retry: attempt {} of {} failed, next attempt in {}ms", attempts_, max_attempts_,
                  wait.count());

    if (attempting_) {
      // attempt() is still on the stack and picks this up.
      next_wait_ = wait;
      return;
    }
    if (wait > wait_policy::duration::zero()) {
      schedule_wait(lock, wait);
      return;
    }
    lock.unlock();
    attempt();
  }

  // Called with mutex_ held so the timer cannot start the next attempt before
  // its token is in the slot.
  void schedule_wait(std::unique_lock<std::mutex>& lock, wait_policy::duration wait) {
    auto token = timers_->schedule_after(timer_kind_, wait,
                                         [self = this->shared_from_this()] { self->attempt(); });
    slot_.assign(std::move(token));
    lock.unlock();
  }

  std::mutex                           mutex_;
  std::size_t                          max_attempts_;
  timer_kind                           timer_kind_;
  wait_policy::sequence                waits_;
  timer_queue*                         timers_;
  producer_type                        producer_;
  resolver<T, E>                       resolver_;
  cancellation_slot                    slot_;
  std::size_t                          attempts_   = 0;
  bool                                 attempting_ = false;
  bool                                 cancelled_  = false;
  std::optional<wait_policy::duration> next_wait_;
};

}  // namespace _retry_detail

// Runs producer() and re-runs it after each failure, waiting as the strategy
// says, until it succeeds or max_attempts is used up. Gives up with the last
// failure as is.
template <class F>
  requires std::invocable<__decay_t<F>&> && is_future_v<std::invoke_result_t<__decay_t<F>&>>
auto retry(retry_strategy strategy, timer_queue& timers, F&& producer) {
  using future_type = __decay_t<std::invoke_result_t<__decay_t<F>&>>;
  using T           = typename future_type::value_type;
  using E           = typename future_type::error_type;

  return future<T, E>([strategy, timers = &timers,
                       producer = __decay_t<F>(std::forward<F>(producer))](resolver<T, E> r) {
    auto state = std::make_shared<_retry_detail::_retry_state<T, E>>(
        strategy, *timers, typename _retry_detail::_retry_state<T, E>::producer_type(producer), r);
    r.set_cancel_handler([state] { state->cancel(); });
    state->attempt();
  });
}

// [adaptors.then_retry], retries producer(value) once the upstream succeeded
template <class F>
struct _pipeable_then_retry;

struct then_retry_t {
  template <class T, class E, class F>
  auto operator()(future<T, E> upstream, retry_strategy strategy, timer_queue& timers,
                  F&& producer) const {
    return then_t{}(std::move(upstream),
                    [strategy, timers = &timers, producer = __decay_t<F>(std::forward<F>(producer))](
                        const auto&... value) {
                      return retry(strategy, *timers, [producer, value...] {
                        return std::invoke(producer, value...);
                      });
                    });
  }

  template <class F>
  constexpr auto operator()(retry_strategy strategy, timer_queue& timers, F&& producer) const {
    return _pipeable_then_retry<__decay_t<F>>{strategy, &timers, std::forward<F>(producer)};
  }
};

inline constexpr then_retry_t then_retry{};

template <class F>
struct _pipeable_then_retry {
  retry_strategy strategy_;
  timer_queue*   timers_;
  F              producer_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_then_retry& p) {
    return then_retry_t{}(std::move(upstream), p.strategy_, *p.timers_, p.producer_);
  }
};

}  // namespace pledge::async
