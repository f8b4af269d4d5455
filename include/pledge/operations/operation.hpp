#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace pledge::operations {

enum class operation_state {
  created,    // not handed to a queue yet
  pending,    // enqueued, waiting for dependencies
  ready,      // waiting for the queue to start it
  executing,  // execute() was called
  finished,
};

namespace _queue_detail {
class _queue_state;
}  // namespace _queue_detail

// A unit of schedulable work. Operations are shared-owned (create them with
// std::make_shared) and run at most once. An operation becomes ready once all
// of its dependencies finished; a cancelled operation still waits for them and
// then finishes without executing.
class operation : public std::enable_shared_from_this<operation> {
 public:
  explicit operation(std::string name = "operation") : name_(std::move(name)) {}

  virtual ~operation() = default;

  operation(const operation&)                    = delete;
  auto operator=(const operation&) -> operation& = delete;

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }

  // Only legal before the operation is enqueued. A dependency that already
  // finished is ignored.
  void add_dependency(const std::shared_ptr<operation>& dependency) {
    if (!dependency || dependency.get() == this) {
      return;
    }

    std::scoped_lock lock(mutex_, dependency->mutex_);
    if (state_ != operation_state::created) {
      spdlog::warn("operation '{}': dependency on '{}' added after enqueue, ignored", name_,
                   dependency->name_);
      return;
    }
    if (dependency->state_ == operation_state::finished) {
      return;
    }
    dependency->dependents_.push_back(shared_from_this());
    ++remaining_dependencies_;
  }

  // Marks the operation cancelled and runs on_cancel() once. Has no effect on a
  // finished operation.
  void cancel() {
    {
      std::scoped_lock lock(mutex_);
      if (cancelled_ || state_ == operation_state::finished) {
        return;
      }
      cancelled_ = true;
    }
    on_cancel();
  }

  [[nodiscard]] bool is_cancelled() const {
    std::scoped_lock lock(mutex_);
    return cancelled_;
  }

  [[nodiscard]] auto state() const -> operation_state {
    std::scoped_lock lock(mutex_);
    return state_;
  }

  [[nodiscard]] bool is_finished() const {
    return state() == operation_state::finished;
  }

  // Blocks run in the order they were added, on the finishing thread. A block
  // added after the operation finished runs immediately.
  void add_completion_block(std::function<void()> block) {
    {
      std::scoped_lock lock(mutex_);
      if (state_ != operation_state::finished) {
        completion_blocks_.push_back(std::move(block));
        return;
      }
    }
    block();
  }

 protected:
  // The work. Implementations call finish() once they are done, possibly later
  // and from another thread.
  virtual void execute() = 0;

  // Runs on the thread that called cancel().
  virtual void on_cancel() {}

  // Idempotent.
  void finish() {
    std::vector<std::function<void()>>      blocks;
    std::vector<std::shared_ptr<operation>> dependents;
    handler_type                            finished;
    {
      std::scoped_lock lock(mutex_);
      if (state_ == operation_state::finished) {
        return;
      }
      state_         = operation_state::finished;
      blocks         = std::exchange(completion_blocks_, {});
      dependents     = std::exchange(dependents_, {});
      finished       = std::exchange(finish_handler_, nullptr);
      ready_handler_ = nullptr;
    }

    for (auto& block : blocks) {
      block();
    }
    for (auto& dependent : dependents) {
      dependent->dependency_finished();
    }
    if (finished) {
      finished(shared_from_this());
    }
  }

 private:
  friend class _queue_detail::_queue_state;

  using handler_type = std::function<void(std::shared_ptr<operation>)>;

  // Returns false if the operation was already enqueued.
  bool enqueue(handler_type on_ready, handler_type on_finished) {
    bool is_ready = false;
    {
      std::scoped_lock lock(mutex_);
      if (state_ != operation_state::created) {
        return false;
      }
      ready_handler_  = std::move(on_ready);
      finish_handler_ = std::move(on_finished);
      state_          = operation_state::pending;
      if (remaining_dependencies_ == 0) {
        state_   = operation_state::ready;
        is_ready = true;
      }
    }

    if (is_ready) {
      notify_ready();
    }
    return true;
  }

  // Called by the queue once it picked the operation up.
  void start() {
    bool skip = false;
    {
      std::scoped_lock lock(mutex_);
      if (state_ != operation_state::ready) {
        return;
      }
      state_ = operation_state::executing;
      skip   = cancelled_;
    }

    if (skip) {
      finish();
    } else {
      execute();
    }
  }

  void dependency_finished() {
    {
      std::scoped_lock lock(mutex_);
      --remaining_dependencies_;
      if (remaining_dependencies_ != 0 || state_ != operation_state::pending) {
        return;
      }
      state_ = operation_state::ready;
    }
    notify_ready();
  }

  void notify_ready() {
    handler_type on_ready;
    {
      std::scoped_lock lock(mutex_);
      on_ready = std::exchange(ready_handler_, nullptr);
    }
    if (on_ready) {
      on_ready(shared_from_this());
    }
  }

  std::string                             name_;
  mutable std::mutex                      mutex_;
  operation_state                         state_                  = operation_state::created;
  bool                                    cancelled_              = false;
  std::size_t                             remaining_dependencies_ = 0;
  std::vector<std::shared_ptr<operation>> dependents_;
  std::vector<std::function<void()>>      completion_blocks_;
  handler_type                            ready_handler_;
  handler_type                            finish_handler_;
};

// Runs a function and finishes.
class block_operation final : public operation {
 public:
  explicit block_operation(std::function<void()> block, std::string name = "block_operation")
      : operation(std::move(name)), block_(std::move(block)) {}

 protected:
  void execute() override {
    auto block = std::exchange(block_, nullptr);
    block();
    finish();
  }

 private:
  std::function<void()> block_;
};

// Hands the function a callback that finishes the operation. The callback may
// be called from any thread, more than once.
class async_block_operation final : public operation {
 public:
  using finish_callback = std::function<void()>;

  explicit async_block_operation(std::function<void(finish_callback)> block,
                                 std::string name = "async_block_operation")
      : operation(std::move(name)), block_(std::move(block)) {}

 protected:
  void execute() override {
    auto self  = std::static_pointer_cast<async_block_operation>(shared_from_this());
    auto block = std::exchange(block_, nullptr);
    block([self = std::move(self)] { self->finish(); });
  }

 private:
  std::function<void(finish_callback)> block_;
};

}  // namespace pledge::operations
