#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "cancellation_token.hpp"
#include "completion.hpp"
#include "utils.hpp"

namespace pledge::async {

template <class T, class E>
class resolver;

namespace _future_detail {

// Shared state of a future. Pending -> Resolved happens at most once; every
// callback (setup, observers, cancel handler) runs outside mutex_.
template <class T, class E>
class _state final : public _cancellation_detail::_cancellable,
                     public std::enable_shared_from_this<_state<T, E>> {
 public:
  using completion_type = completion<T, E>;
  using observer_type   = std::function<void(const completion_type&)>;
  using setup_type      = std::function<void(resolver<T, E>)>;
  using handler_type    = std::function<void()>;

  explicit _state(setup_type setup) : setup_(std::move(setup)) {}

  _state(const _state&)            = delete;
  _state& operator=(const _state&) = delete;

  // The first observer starts the setup function on the calling thread.
  void observe(observer_type observer) {
    std::unique_lock lock(mutex_);
    if (completion_) {
      lock.unlock();
      // completion_ is never written again once set.
      observer(*completion_);
      return;
    }

    observers_.push_back(std::move(observer));
    if (started_) {
      return;
    }
    started_   = true;
    auto setup = std::exchange(setup_, nullptr);
    lock.unlock();

    setup(resolver<T, E>{this->shared_from_this()});
  }

  bool resolve(completion_type c) {
    std::vector<observer_type> observers;
    handler_type               handler;
    {
      std::scoped_lock lock(mutex_);
      if (completion_) {
        return false;
      }
      completion_.emplace(std::move(c));
      observers = std::exchange(observers_, {});
      // Drops the references the handler holds (usually the resolver itself).
      handler = std::exchange(cancel_handler_, nullptr);
    }

    for (auto& observer : observers) {
      observer(*completion_);
    }
    return true;
  }

  bool request_cancel() override {
    handler_type handler;
    {
      std::scoped_lock lock(mutex_);
      if (completion_ || cancel_requested_) {
        return false;
      }
      cancel_requested_ = true;
      handler           = std::exchange(cancel_handler_, nullptr);
    }

    if (handler) {
      handler();
    } else {
      resolve(completion_type{cancelled});
    }
    return true;
  }

  void set_cancel_handler(handler_type handler) {
    {
      std::scoped_lock lock(mutex_);
      if (completion_) {
        return;
      }
      if (!cancel_requested_) {
        cancel_handler_ = std::move(handler);
        return;
      }
    }
    // Cancellation was requested before the handler got installed.
    handler();
  }

  [[nodiscard]] bool cancel_requested() const {
    std::scoped_lock lock(mutex_);
    return cancel_requested_;
  }

  [[nodiscard]] bool is_resolved() const {
    std::scoped_lock lock(mutex_);
    return completion_.has_value();
  }

 private:
  mutable std::mutex             mutex_;
  std::optional<completion_type> completion_;
  std::vector<observer_type>     observers_;
  setup_type                     setup_;
  handler_type                   cancel_handler_;
  bool                           started_          = false;
  bool                           cancel_requested_ = false;
};

}  // namespace _future_detail

// resolver<T, E>: the only capability to resolve a future. Copies share the
// same future; the first resolution wins and every later call returns false.
template <class T, class E>
class resolver {
 public:
  using completion_type = completion<T, E>;
  using result_type     = std::expected<T, E>;

  explicit resolver(std::shared_ptr<_future_detail::_state<T, E>> state) noexcept
      : state_(std::move(state)) {}

  bool resolve(completion_type c) const {
    return state_->resolve(std::move(c));
  }

  template <class... Args>
  bool set_value(Args&&... args) const {
    return resolve(completion_type{result_type(std::in_place, std::forward<Args>(args)...)});
  }

  bool set_error(E error) const {
    return resolve(completion_type{result_type(std::unexpect, std::move(error))});
  }

  bool set_cancelled() const {
    return resolve(completion_type{cancelled});
  }

  // Replaces the handler run when cancellation is requested before resolution.
  // The handler is responsible for eventually resolving the future.
  template <class F>
    requires std::invocable<F&>
  void set_cancel_handler(F&& f) const {
    state_->set_cancel_handler(std::function<void()>(std::forward<F>(f)));
  }

  [[nodiscard]] bool is_cancellation_requested() const {
    return state_->cancel_requested();
  }

  [[nodiscard]] bool is_resolved() const {
    return state_->is_resolved();
  }

 private:
  std::shared_ptr<_future_detail::_state<T, E>> state_;
};

// future<T, E>: a push-only, single-resolution container for an eventual
// completion<T, E>. The setup function runs once, when the future is first
// observed. Copies refer to the same computation.
template <class T, class E>
class future {
  using _state_type = _future_detail::_state<T, E>;

 public:
  using value_type      = T;
  using error_type      = E;
  using result_type     = std::expected<T, E>;
  using completion_type = completion<T, E>;
  using resolver_type   = resolver<T, E>;

  template <class Setup>
    requires(!std::same_as<__remove_cvref_t<Setup>, future>)
            && std::invocable<__decay_t<Setup>&, resolver<T, E>>
  explicit future(Setup&& setup)
      : state_(std::make_shared<_state_type>(
            typename _state_type::setup_type(std::forward<Setup>(setup)))) {}

  // Observers registered before resolution run in registration order on the
  // resolving thread. Later observers run synchronously with the stored completion.
  template <class F>
    requires std::invocable<__decay_t<F>&, const completion_type&>
  cancellation_token observe(F&& f) const {
    state_->observe(typename _state_type::observer_type(std::forward<F>(f)));
    return cancellation_token{state_};
  }

 private:
  std::shared_ptr<_state_type> state_;
};

}  // namespace pledge::async
