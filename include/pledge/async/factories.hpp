#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <type_traits>
#include <utility>

#include "completion.hpp"
#include "future.hpp"
#include "utils.hpp"

namespace pledge::async {

// [factories.just], a future already holding a value
template <class E, class T>
auto just(T&& value) -> future<__decay_t<T>, E> {
  using value_type = __decay_t<T>;
  return future<value_type, E>([value = std::forward<T>(value)](resolver<value_type, E> r) {
    r.set_value(value);
  });
}

template <class E>
auto just() -> future<void, E> {
  return future<void, E>([](resolver<void, E> r) { r.set_value(); });
}

// [factories.just_error]
template <class T, class E>
auto just_error(E error) -> future<T, E> {
  return future<T, E>([error = std::move(error)](resolver<T, E> r) { r.set_error(error); });
}

// [factories.just_cancelled]
template <class T, class E>
auto just_cancelled() -> future<T, E> {
  return future<T, E>([](resolver<T, E> r) { r.set_cancelled(); });
}

namespace _deferred_detail {

template <class R>
struct _expected_traits;

template <class T, class E>
struct _expected_traits<std::expected<T, E>> {
  using value_type = T;
  using error_type = E;
};

}  // namespace _deferred_detail

// [factories.deferred], evaluates fun when the future is first observed
template <class F>
  requires std::invocable<__decay_t<F>&>
auto deferred(F&& fun) {
  using result_t = __decay_t<std::invoke_result_t<__decay_t<F>&>>;
  using T        = typename _deferred_detail::_expected_traits<result_t>::value_type;
  using E        = typename _deferred_detail::_expected_traits<result_t>::error_type;

  return future<T, E>([fun = std::forward<F>(fun)](resolver<T, E> r) mutable {
    r.resolve(completion<T, E>{std::invoke(fun)});
  });
}

}  // namespace pledge::async
