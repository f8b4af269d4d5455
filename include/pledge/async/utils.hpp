#pragma once

#include <type_traits>

namespace pledge::async {

template <class T, class E>
class future;

template <class T>
using __decay_t = std::decay_t<T>;

template <class T>
using __remove_cvref_t = std::remove_cvref_t<T>;

// is_future trait
template <class T>
struct is_future : std::false_type {};

template <class T, class E>
struct is_future<future<T, E>> : std::true_type {};

template <class T>
inline constexpr bool is_future_v = is_future<__remove_cvref_t<T>>::value;

}  // namespace pledge::async
