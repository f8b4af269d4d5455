#pragma once

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "cancellation_token.hpp"
#include "completion.hpp"
#include "future.hpp"
#include "utils.hpp"

namespace pledge::async {

// Side-effect taps. Each one sees the completion the upstream delivered and
// forwards it unchanged.
namespace _upon_detail {

template <class T, class E, class Tap>
auto _tap(future<T, E> upstream, Tap tap) -> future<T, E> {
  return future<T, E>([upstream = std::move(upstream), tap = std::move(tap)](resolver<T, E> r) {
    auto slot = std::make_shared<cancellation_slot>();
    r.set_cancel_handler([slot, r] {
      // Nothing outstanding to carry the request upstream.
      if (!slot->cancel()) {
        r.set_cancelled();
      }
    });

    slot->assign(upstream.observe([tap, r](const completion<T, E>& c) mutable {
      tap(c);
      r.resolve(c);
    }));
  });
}

}  // namespace _upon_detail

// [adaptors.on_success]
template <class F>
struct _pipeable_on_success;

struct on_success_t {
  template <class T, class E, class F>
  auto operator()(future<T, E> upstream, F&& f) const -> future<T, E> {
    return _upon_detail::_tap(std::move(upstream),
                              [fun = __decay_t<F>(std::forward<F>(f))](
                                  const completion<T, E>& c) mutable {
                                if (!c.has_value()) {
                                  return;
                                }
                                if constexpr (std::is_void_v<T>) {
                                  std::invoke(fun);
                                } else {
                                  std::invoke(fun, c.value());
                                }
                              });
  }

  template <class F>
  constexpr auto operator()(F&& f) const {
    return _pipeable_on_success<__decay_t<F>>{std::forward<F>(f)};
  }
};

inline constexpr on_success_t on_success{};

template <class F>
struct _pipeable_on_success {
  F fun_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_on_success& p) {
    return on_success_t{}(std::move(upstream), p.fun_);
  }
};

// [adaptors.on_failure]
template <class F>
struct _pipeable_on_failure;

struct on_failure_t {
  template <class T, class E, class F>
  auto operator()(future<T, E> upstream, F&& f) const -> future<T, E> {
    return _upon_detail::_tap(std::move(upstream),
                              [fun = __decay_t<F>(std::forward<F>(f))](
                                  const completion<T, E>& c) mutable {
                                if (c.has_error()) {
                                  std::invoke(fun, c.error());
                                }
                              });
  }

  template <class F>
  constexpr auto operator()(F&& f) const {
    return _pipeable_on_failure<__decay_t<F>>{std::forward<F>(f)};
  }
};

inline constexpr on_failure_t on_failure{};

template <class F>
struct _pipeable_on_failure {
  F fun_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_on_failure& p) {
    return on_failure_t{}(std::move(upstream), p.fun_);
  }
};

// [adaptors.on_cancelled]
template <class F>
struct _pipeable_on_cancelled;

struct on_cancelled_t {
  template <class T, class E, class F>
  auto operator()(future<T, E> upstream, F&& f) const -> future<T, E> {
    return _upon_detail::_tap(std::move(upstream),
                              [fun = __decay_t<F>(std::forward<F>(f))](
                                  const completion<T, E>& c) mutable {
                                if (c.is_cancelled()) {
                                  std::invoke(fun);
                                }
                              });
  }

  template <class F>
  constexpr auto operator()(F&& f) const {
    return _pipeable_on_cancelled<__decay_t<F>>{std::forward<F>(f)};
  }
};

inline constexpr on_cancelled_t on_cancelled{};

template <class F>
struct _pipeable_on_cancelled {
  F fun_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_on_cancelled& p) {
    return on_cancelled_t{}(std::move(upstream), p.fun_);
  }
};

}  // namespace pledge::async
