#pragma once

#include <concepts>
#include <functional>
#include <memory>
#include <utility>

#include "utils.hpp"

namespace pledge::async {

// [exec.executor], execution contexts
struct executor_t {};

// A copyable handle to an execution context that accepts work items.
template <class Ex>
concept executor =
    std::copy_constructible<__remove_cvref_t<Ex>> && requires {
      typename __remove_cvref_t<Ex>::executor_concept;
      requires std::same_as<typename __remove_cvref_t<Ex>::executor_concept, executor_t>;
    } && requires(const __remove_cvref_t<Ex>& ex, std::function<void()> work) {
      ex.execute(std::move(work));
    };

// [exec.inline], runs work on the calling thread
class inline_executor {
 public:
  using executor_concept = executor_t;

  inline_executor() = default;

  static void execute(std::function<void()> work) {
    work();
  }

  auto operator==(const inline_executor&) const noexcept -> bool = default;
};

// Type-erased executor handle.
class any_executor {
 public:
  using executor_concept = executor_t;

  template <class Ex>
    requires(!std::same_as<__remove_cvref_t<Ex>, any_executor>) && executor<Ex>
  any_executor(Ex&& ex)  // NOLINT(google-explicit-constructor)
      : execute_(std::make_shared<std::function<void(std::function<void()>)>>(
            [ex = __decay_t<Ex>(std::forward<Ex>(ex))](std::function<void()> work) {
              ex.execute(std::move(work));
            })) {}

  void execute(std::function<void()> work) const {
    (*execute_)(std::move(work));
  }

  auto operator==(const any_executor& other) const noexcept -> bool {
    return execute_ == other.execute_;
  }

 private:
  std::shared_ptr<const std::function<void(std::function<void()>)>> execute_;
};

}  // namespace pledge::async
