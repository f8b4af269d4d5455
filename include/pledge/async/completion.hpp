#pragma once

#include <expected>
#include <utility>
#include <variant>

namespace pledge::async {

// Tag for the cancelled completion. Cancellation is a terminal state of its
// own, not an error.
struct cancelled_t {
  auto operator==(const cancelled_t&) const noexcept -> bool = default;
};

inline constexpr cancelled_t cancelled{};

// completion<T, E>: the terminal state of a future, either
// Finished(std::expected<T, E>) or Cancelled.
template <class T, class E>
class completion {
 public:
  using value_type  = T;
  using error_type  = E;
  using result_type = std::expected<T, E>;

  completion(result_type result) : storage_(std::in_place_index<0>, std::move(result)) {}

  completion(cancelled_t /*unused*/) noexcept : storage_(std::in_place_index<1>) {}

  [[nodiscard]] bool is_finished() const noexcept {
    return storage_.index() == 0;
  }

  [[nodiscard]] bool is_cancelled() const noexcept {
    return storage_.index() == 1;
  }

  // Finished with a value.
  [[nodiscard]] bool has_value() const noexcept {
    return is_finished() && std::get<0>(storage_).has_value();
  }

  // Finished with a failure.
  [[nodiscard]] bool has_error() const noexcept {
    return is_finished() && !std::get<0>(storage_).has_value();
  }

  // Precondition: is_finished().
  [[nodiscard]] const result_type& result() const& noexcept {
    return *std::get_if<0>(&storage_);
  }

  [[nodiscard]] result_type&& result() && noexcept {
    return std::move(*std::get_if<0>(&storage_));
  }

  // Precondition: has_value().
  [[nodiscard]] decltype(auto) value() const& {
    return *result();
  }

  // Precondition: has_error().
  [[nodiscard]] const E& error() const& noexcept {
    return result().error();
  }

  friend bool operator==(const completion&, const completion&) = default;

 private:
  std::variant<result_type, cancelled_t> storage_;
};

}  // namespace pledge::async
