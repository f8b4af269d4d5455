#pragma once

#include <chrono>
#include <memory>
#include <utility>

#include "cancellation_token.hpp"
#include "completion.hpp"
#include "future.hpp"
#include "timer_queue.hpp"

namespace pledge::async {

// [adaptors.delay], holds an upstream success back for a duration. Failures and
// cancellation are forwarded without waiting.
template <class Rep, class Period>
struct _pipeable_delay;

struct delay_t {
  template <class T, class E, class Rep, class Period>
  auto operator()(future<T, E> upstream, timer_queue& timers,
                  std::chrono::duration<Rep, Period> duration,
                  timer_kind kind = timer_kind::deadline) const -> future<T, E> {
    return future<T, E>([upstream = std::move(upstream), timers = &timers, duration,
                         kind](resolver<T, E> r) {
      auto slot       = std::make_shared<cancellation_slot>();
      auto timer_slot = std::make_shared<cancellation_slot>();
      r.set_cancel_handler([slot, timer_slot, r] {
        slot->cancel();
        timer_slot->cancel();
        r.set_cancelled();
      });

      slot->assign(
          upstream.observe([timers, duration, kind, timer_slot, r](const completion<T, E>& c) {
            if (!c.has_value()) {
              r.resolve(c);
              return;
            }
            if (r.is_cancellation_requested()) {
              return;
            }
            timer_slot->assign(timers->schedule_after(kind, duration, [r, c] { r.resolve(c); }));
          }));
    });
  }

  template <class Rep, class Period>
  constexpr auto operator()(timer_queue& timers, std::chrono::duration<Rep, Period> duration,
                            timer_kind kind = timer_kind::deadline) const {
    return _pipeable_delay<Rep, Period>{&timers, duration, kind};
  }
};

inline constexpr delay_t delay{};

template <class Rep, class Period>
struct _pipeable_delay {
  timer_queue*                       timers_;
  std::chrono::duration<Rep, Period> duration_;
  timer_kind                         kind_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_delay& p) {
    return delay_t{}(std::move(upstream), *p.timers_, p.duration_, p.kind_);
  }
};

}  // namespace pledge::async
