#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../async/cancellation_token.hpp"
#include "../async/completion.hpp"
#include "../async/future.hpp"
#include "exclusivity_controller.hpp"
#include "operation.hpp"
#include "operation_queue.hpp"

namespace pledge::operations {

// Observes a future while executing and finishes once it completed, handing
// the completion to a resolver.
template <class T, class E>
class future_operation final : public operation {
 public:
  using completion_type = async::completion<T, E>;

  future_operation(async::future<T, E> upstream, async::resolver<T, E> r,
                   std::string name = "future_operation")
      : operation(std::move(name)), upstream_(std::move(upstream)), resolver_(std::move(r)) {}

 protected:
  void execute() override {
    auto self = std::static_pointer_cast<future_operation>(shared_from_this());
    slot_.assign(upstream_.observe([self](const completion_type& c) {
      self->resolver_.resolve(c);
      self->finish();
    }));
  }

  void on_cancel() override {
    // Not executing yet: settle now, the operation finishes once it is started.
    if (!slot_.cancel()) {
      resolver_.set_cancelled();
    }
  }

 private:
  async::future<T, E>      upstream_;
  async::resolver<T, E>    resolver_;
  async::cancellation_slot slot_;
};

// [operations.run_on], runs the upstream as an operation on a queue, optionally
// serialized against other operations through exclusivity categories. The
// operation is submitted when the returned future is first observed.
// Cancelling the returned future cancels the operation.
struct _pipeable_run_on;

struct run_on_t {
  template <class T, class E>
  auto operator()(async::future<T, E> upstream, operation_queue& queue) const
      -> async::future<T, E> {
    return run(std::move(upstream), queue, nullptr, {});
  }

  template <class T, class E>
  auto operator()(async::future<T, E> upstream, operation_queue& queue,
                  exclusivity_controller& controller, std::vector<std::string> categories) const
      -> async::future<T, E> {
    return run(std::move(upstream), queue, &controller, std::move(categories));
  }

  auto operator()(operation_queue& queue) const -> _pipeable_run_on;

  auto operator()(operation_queue& queue, exclusivity_controller& controller,
                  std::vector<std::string> categories) const -> _pipeable_run_on;

 private:
  template <class T, class E>
  static auto run(async::future<T, E> upstream, operation_queue& queue,
                  exclusivity_controller* controller, std::vector<std::string> categories)
      -> async::future<T, E> {
    return async::future<T, E>([upstream = std::move(upstream), queue = &queue, controller,
                                categories = std::move(categories)](async::resolver<T, E> r) {
      auto op = std::make_shared<future_operation<T, E>>(upstream, r, "run_on");
      r.set_cancel_handler([op] { op->cancel(); });

      if (controller != nullptr && !categories.empty()) {
        controller->add_operation(op, categories);
        op->add_completion_block([controller, op_ptr = std::weak_ptr<operation>(op), categories] {
          if (auto finished = op_ptr.lock()) {
            controller->remove_operation(finished, categories);
          }
        });
      }
      queue->add_operation(op);
    });
  }
};

inline constexpr run_on_t run_on{};

struct _pipeable_run_on {
  operation_queue*         queue_;
  exclusivity_controller*  controller_;
  std::vector<std::string> categories_;

  template <class T, class E>
  friend auto operator|(async::future<T, E> upstream, const _pipeable_run_on& p) {
    if (p.controller_ == nullptr) {
      return run_on_t{}(std::move(upstream), *p.queue_);
    }
    return run_on_t{}(std::move(upstream), *p.queue_, *p.controller_, p.categories_);
  }
};

inline auto run_on_t::operator()(operation_queue& queue) const -> _pipeable_run_on {
  return _pipeable_run_on{&queue, nullptr, {}};
}

inline auto run_on_t::operator()(operation_queue& queue, exclusivity_controller& controller,
                                 std::vector<std::string> categories) const -> _pipeable_run_on {
  return _pipeable_run_on{&queue, &controller, std::move(categories)};
}

}  // namespace pledge::operations
