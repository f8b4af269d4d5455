#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "../async/executor.hpp"
#include "operation.hpp"

namespace pledge::operations {

struct operation_queue_options {
  std::string name = "operation_queue";
  // Zero means unbounded.
  std::size_t max_concurrent_operations = 0;
};

namespace _queue_detail {

// Outlives the queue for as long as one of its operations is unfinished.
class _queue_state : public std::enable_shared_from_this<_queue_state> {
 public:
  _queue_state(async::any_executor executor, operation_queue_options options)
      : executor_(std::move(executor)), options_(std::move(options)) {}

  void add(const std::shared_ptr<operation>& op) {
    bool inserted = false;
    {
      std::scoped_lock lock(mutex_);
      inserted = operations_.insert(op).second;
    }

    auto on_ready    = [self = shared_from_this()](std::shared_ptr<operation> ready_op) {
      self->operation_ready(std::move(ready_op));
    };
    auto on_finished = [self = shared_from_this()](std::shared_ptr<operation> finished_op) {
      self->operation_finished(finished_op);
    };

    if (!op->enqueue(std::move(on_ready), std::move(on_finished))) {
      spdlog::warn("{}: operation '{}' was already enqueued, ignored", options_.name, op->name());
      if (inserted) {
        std::scoped_lock lock(mutex_);
        operations_.erase(op);
      }
      return;
    }
    spdlog::debug("{}: enqueued '{}'", options_.name, op->name());
  }

  void cancel_all() {
    std::vector<std::shared_ptr<operation>> operations;
    {
      std::scoped_lock lock(mutex_);
      operations.assign(operations_.begin(), operations_.end());
    }
    for (auto& op : operations) {
      op->cancel();
    }
  }

  [[nodiscard]] auto count() const -> std::size_t {
    std::scoped_lock lock(mutex_);
    return operations_.size();
  }

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return options_.name;
  }

 private:
  void operation_ready(std::shared_ptr<operation> op) {
    std::unique_lock lock(mutex_);
    ready_.push_back(std::move(op));
    drain(lock);
  }

  void operation_finished(const std::shared_ptr<operation>& op) {
    spdlog::debug("{}: finished '{}'{}", options_.name, op->name(),
                  op->is_cancelled() ? " (cancelled)" : "");

    std::unique_lock lock(mutex_);
    operations_.erase(op);
    if (running_ > 0) {
      --running_;
    }
    drain(lock);
  }

  // Called with mutex_ held. Only the outermost caller hands operations to the
  // executor; a call made from inside a synchronous executor leaves its work to
  // that loop, so a chain of dependents runs at constant stack depth.
  void drain(std::unique_lock<std::mutex>& lock) {
    if (dispatching_) {
      return;
    }
    dispatching_ = true;

    std::vector<std::shared_ptr<operation>> runnable;
    take_runnable(runnable);
    while (!runnable.empty()) {
      lock.unlock();
      dispatch(runnable);
      runnable.clear();
      lock.lock();
      take_runnable(runnable);
    }
    dispatching_ = false;
  }

  // Called with mutex_ held.
  void take_runnable(std::vector<std::shared_ptr<operation>>& runnable) {
    while (!ready_.empty()
           && (options_.max_concurrent_operations == 0
               || running_ < options_.max_concurrent_operations)) {
      runnable.push_back(std::move(ready_.front()));
      ready_.pop_front();
      ++running_;
    }
  }

  void dispatch(std::vector<std::shared_ptr<operation>>& runnable) {
    for (auto& op : runnable) {
      executor_.execute([op = std::move(op)] { op->start(); });
    }
  }

  async::any_executor                            executor_;
  operation_queue_options                        options_;
  mutable std::mutex                             mutex_;
  std::unordered_set<std::shared_ptr<operation>> operations_;
  std::deque<std::shared_ptr<operation>>         ready_;
  std::size_t                                    running_     = 0;
  bool                                           dispatching_ = false;
};

}  // namespace _queue_detail

// Starts operations on an executor once their dependencies finished, in the
// order they became ready, at most max_concurrent_operations at a time.
// Destroying the queue cancels the operations still in it; they keep running
// to completion without it.
class operation_queue {
 public:
  explicit operation_queue(async::any_executor executor, operation_queue_options options = {})
      : state_(std::make_shared<_queue_detail::_queue_state>(std::move(executor),
                                                             std::move(options))) {}

  ~operation_queue() {
    state_->cancel_all();
  }

  operation_queue(const operation_queue&)                    = delete;
  auto operator=(const operation_queue&) -> operation_queue& = delete;

  void add_operation(const std::shared_ptr<operation>& op) {
    state_->add(op);
  }

  void cancel_all_operations() {
    state_->cancel_all();
  }

  // Operations added and not finished yet.
  [[nodiscard]] auto operation_count() const -> std::size_t {
    return state_->count();
  }

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return state_->name();
  }

 private:
  std::shared_ptr<_queue_detail::_queue_state> state_;
};

}  // namespace pledge::operations
