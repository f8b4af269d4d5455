#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "cancellation_token.hpp"
#include "completion.hpp"
#include "future.hpp"
#include "utils.hpp"

namespace pledge::async {

namespace _then_detail {

// Result of invoking F with the value of a future<T, E> (no argument for void).
template <class F, class T>
struct _value_invoke_result {
  using type = std::invoke_result_t<F&, const T&>;
};

template <class F>
struct _value_invoke_result<F, void> {
  using type = std::invoke_result_t<F&>;
};

template <class F, class T>
using value_invoke_result_t = __decay_t<typename _value_invoke_result<F, T>::type>;

template <class F, class T, class E>
decltype(auto) _invoke_with_value(F& fun, const completion<T, E>& c) {
  if constexpr (std::is_void_v<T>) {
    return std::invoke(fun);
  } else {
    return std::invoke(fun, c.value());
  }
}

// Runs body. With E = std::exception_ptr an escaping exception becomes the failure.
template <class U, class E, class Body>
void _guarded(const resolver<U, E>& r, Body&& body) {
  if constexpr (std::is_same_v<E, std::exception_ptr>) {
    try {
      std::forward<Body>(body)();
    } catch (...) {
      r.set_error(std::current_exception());
    }
  } else {
    std::forward<Body>(body)();
  }
}

// Cancel handler shared by the transforming combinators: forward the request to
// every outstanding stage and settle this one as cancelled right away. One slot
// per stage.
template <class U, class E, class... Slots>
auto _cancel_stage(resolver<U, E> r, Slots... slots) {
  return [r = std::move(r), slots...] {
    (slots->cancel(), ...);
    r.set_cancelled();
  };
}

}  // namespace _then_detail

// [adaptors.map], transforms the success value
template <class F>
struct _pipeable_map;

struct map_t {
  template <class T, class E, class F>
  auto operator()(future<T, E> upstream, F&& f) const {
    using U = _then_detail::value_invoke_result_t<__decay_t<F>, T>;

    return future<U, E>([upstream = std::move(upstream),
                         fun      = __decay_t<F>(std::forward<F>(f))](resolver<U, E> r) mutable {
      auto slot = std::make_shared<cancellation_slot>();
      r.set_cancel_handler(_then_detail::_cancel_stage(r, slot));

      slot->assign(upstream.observe([fun, r](const completion<T, E>& c) mutable {
        if (c.is_cancelled()) {
          r.set_cancelled();
          return;
        }
        if (c.has_error()) {
          r.set_error(c.error());
          return;
        }
        if (r.is_cancellation_requested()) {
          return;
        }
        _then_detail::_guarded(r, [&] {
          if constexpr (std::is_void_v<U>) {
            _then_detail::_invoke_with_value(fun, c);
            r.set_value();
          } else {
            r.set_value(_then_detail::_invoke_with_value(fun, c));
          }
        });
      }));
    });
  }

  template <class F>
  constexpr auto operator()(F&& f) const {
    return _pipeable_map<__decay_t<F>>{std::forward<F>(f)};
  }
};

inline constexpr map_t map{};

template <class F>
struct _pipeable_map {
  F fun_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_map& p) {
    return map_t{}(std::move(upstream), p.fun_);
  }
};

// [adaptors.map_error], transforms the failure
template <class F>
struct _pipeable_map_error;

struct map_error_t {
  template <class T, class E, class F>
  auto operator()(future<T, E> upstream, F&& f) const {
    using E2 = __decay_t<std::invoke_result_t<__decay_t<F>&, const E&>>;

    return future<T, E2>([upstream = std::move(upstream),
                          fun = __decay_t<F>(std::forward<F>(f))](resolver<T, E2> r) mutable {
      auto slot = std::make_shared<cancellation_slot>();
      r.set_cancel_handler(_then_detail::_cancel_stage(r, slot));

      slot->assign(upstream.observe([fun, r](const completion<T, E>& c) mutable {
        if (c.is_cancelled()) {
          r.set_cancelled();
          return;
        }
        if (c.has_value()) {
          if constexpr (std::is_void_v<T>) {
            r.set_value();
          } else {
            r.set_value(c.value());
          }
          return;
        }
        if (r.is_cancellation_requested()) {
          return;
        }
        _then_detail::_guarded(r, [&] { r.set_error(std::invoke(fun, c.error())); });
      }));
    });
  }

  template <class F>
  constexpr auto operator()(F&& f) const {
    return _pipeable_map_error<__decay_t<F>>{std::forward<F>(f)};
  }
};

inline constexpr map_error_t map_error{};

template <class F>
struct _pipeable_map_error {
  F fun_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_map_error& p) {
    return map_error_t{}(std::move(upstream), p.fun_);
  }
};

// [adaptors.then], chains a future-returning continuation on success.
// Cancellation reaches whichever of the two futures is outstanding.
template <class F>
struct _pipeable_then;

struct then_t {
  template <class T, class E, class F>
  auto operator()(future<T, E> upstream, F&& f) const {
    using inner_type = _then_detail::value_invoke_result_t<__decay_t<F>, T>;
    static_assert(is_future_v<inner_type>, "then() continuation must return a future");
    static_assert(std::is_same_v<typename inner_type::error_type, E>,
                  "then() continuation must keep the error type; use map_error first");
    using U = typename inner_type::value_type;

    return future<U, E>([upstream = std::move(upstream),
                         fun      = __decay_t<F>(std::forward<F>(f))](resolver<U, E> r) mutable {
      auto slot       = std::make_shared<cancellation_slot>();
      auto inner_slot = std::make_shared<cancellation_slot>();
      r.set_cancel_handler(_then_detail::_cancel_stage(r, slot, inner_slot));

      slot->assign(upstream.observe([fun, r, inner_slot](const completion<T, E>& c) mutable {
        if (c.is_cancelled()) {
          r.set_cancelled();
          return;
        }
        if (c.has_error()) {
          r.set_error(c.error());
          return;
        }
        if (r.is_cancellation_requested()) {
          return;
        }
        _then_detail::_guarded(r, [&] {
          inner_type inner = _then_detail::_invoke_with_value(fun, c);
          inner_slot->assign(inner.observe([r](const completion<U, E>& inner_completion) {
            r.resolve(inner_completion);
          }));
        });
      }));
    });
  }

  template <class F>
  constexpr auto operator()(F&& f) const {
    return _pipeable_then<__decay_t<F>>{std::forward<F>(f)};
  }
};

inline constexpr then_t then{};
inline constexpr then_t flat_map{};

template <class F>
struct _pipeable_then {
  F fun_;

  template <class T, class E>
  friend auto operator|(future<T, E> upstream, const _pipeable_then& p) {
    return then_t{}(std::move(upstream), p.fun_);
  }
};

}  // namespace pledge::async
