#pragma once

#include <memory>
#include <utility>

#include "cancellation_token.hpp"
#include "completion.hpp"
#include "executor.hpp"
#include "future.hpp"
#include "utils.hpp"

namespace pledge::async {

// [adaptors.schedule_on], starts the upstream from a work item on ex
template <executor Ex>
struct _pipeable_schedule_on;

struct schedule_on_t {
  template <class T, class E, executor Ex>
  auto operator()(future<T, E> upstream, Ex&& ex) const -> future<T, E> {
    return future<T, E>([upstream = std::move(upstream),
                         ex       = __decay_t<Ex>(std::forward<Ex>(ex))](resolver<T, E> r) {
      auto slot = std::make_shared<cancellation_slot>();
      r.set_cancel_handler([slot, r] {
        slot->cancel();
        r.set_cancelled();
      });

      ex.execute([upstream, slot, r] {
        // Cancelled before the context got to it: never start the upstream.
        if (slot->is_cancelled()) {
          return;
        }
        slot->assign(upstream.observe([r](const completion<T, E>& c) { r.resolve(c); }));
      });
    });
  }

  template <executor Ex>
  constexpr auto operator()(Ex&& ex) const {
    return _pipeable_schedule_on<__decay_t<Ex>>{std::forward<Ex>(ex)};
  }
};

inline constexpr schedule_on_t schedule_on{};

template <executor Ex>
struct _pipeable_schedule_on {
  Ex executor_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_schedule_on& p) {
    return schedule_on_t{}(std::move(upstream), p.executor_);
  }
};

// [adaptors.receive_on], delivers the completion from a work item on ex.
// A cancellation is delivered on ex as well.
template <executor Ex>
struct _pipeable_receive_on;

struct receive_on_t {
  template <class T, class E, executor Ex>
  auto operator()(future<T, E> upstream, Ex&& ex) const -> future<T, E> {
    return future<T, E>([upstream = std::move(upstream),
                         ex       = __decay_t<Ex>(std::forward<Ex>(ex))](resolver<T, E> r) {
      auto slot = std::make_shared<cancellation_slot>();
      r.set_cancel_handler([slot, r, ex] {
        slot->cancel();
        ex.execute([r] { r.set_cancelled(); });
      });

      slot->assign(upstream.observe([r, ex](const completion<T, E>& c) {
        ex.execute([r, c] { r.resolve(c); });
      }));
    });
  }

  template <executor Ex>
  constexpr auto operator()(Ex&& ex) const {
    return _pipeable_receive_on<__decay_t<Ex>>{std::forward<Ex>(ex)};
  }
};

inline constexpr receive_on_t receive_on{};

template <executor Ex>
struct _pipeable_receive_on {
  Ex executor_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_receive_on& p) {
    return receive_on_t{}(std::move(upstream), p.executor_);
  }
};

}  // namespace pledge::async
