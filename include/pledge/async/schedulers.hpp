#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "executor.hpp"

namespace pledge::async {

// [exec.run_loop], runs work on whichever thread calls run()
class run_loop {
 public:
  run_loop() : stop_(false) {}

  ~run_loop() {
    finish();
  }

  run_loop(const run_loop&)                    = delete;
  auto operator=(const run_loop&) -> run_loop& = delete;

  class executor_type {
   public:
    using executor_concept = executor_t;

    explicit executor_type(run_loop* loop) noexcept : loop_(loop) {}

    void execute(std::function<void()> work) const {
      loop_->push_back(std::move(work));
    }

    auto operator==(const executor_type& other) const noexcept -> bool {
      return loop_ == other.loop_;
    }

   private:
    run_loop* loop_;
  };

  auto get_executor() noexcept -> executor_type {
    return executor_type{this};
  }

  // Runs queued work until finish() is called and the queue is drained.
  void run() {
    while (true) {
      std::unique_lock lock(mutex_);
      cv_.wait(lock,
               [this] -> bool { return !queue_.empty() || stop_.load(std::memory_order_relaxed); });

      if (queue_.empty()) {
        break;
      }

      auto work = std::move(queue_.front());
      queue_.pop();
      lock.unlock();
      work();
    }
  }

  // Runs the work queued so far without waiting. Returns the number of items run.
  auto run_pending() -> std::size_t {
    std::queue<std::function<void()>> pending;
    {
      std::scoped_lock lock(mutex_);
      std::swap(pending, queue_);
    }

    std::size_t count = 0;
    while (!pending.empty()) {
      auto work = std::move(pending.front());
      pending.pop();
      work();
      ++count;
    }
    return count;
  }

  void finish() {
    {
      std::scoped_lock lock(mutex_);
      stop_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

 private:
  friend class executor_type;

  void push_back(std::function<void()> work) {
    {
      std::scoped_lock lock(mutex_);
      queue_.push(std::move(work));
    }
    cv_.notify_one();
  }

  std::queue<std::function<void()>> queue_;
  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::atomic<bool>                 stop_;
};

// [exec.serial_queue], a run_loop driven by a dedicated thread. Work items run
// one at a time in submission order.
class serial_queue {
 public:
  serial_queue() : thread_([this] -> void { loop_.run(); }) {}

  ~serial_queue() {
    loop_.finish();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  serial_queue(const serial_queue&)                    = delete;
  auto operator=(const serial_queue&) -> serial_queue& = delete;

  using executor_type = run_loop::executor_type;

  auto get_executor() noexcept -> executor_type {
    return loop_.get_executor();
  }

  [[nodiscard]] auto thread_id() const noexcept -> std::thread::id {
    return thread_.get_id();
  }

 private:
  run_loop    loop_;
  std::thread thread_;
};

// [exec.thread_pool], runs work on a fixed set of worker threads
class thread_pool {
 public:
  explicit thread_pool(std::size_t num_threads = std::thread::hardware_concurrency()) {
    if (num_threads == 0) {
      num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
      workers_.emplace_back([this] -> void { worker_thread(); });
    }
    spdlog::trace("thread_pool started with {} workers", num_threads);
  }

  ~thread_pool() {
    {
      std::scoped_lock lock(mutex_);
      stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  thread_pool(const thread_pool&)                    = delete;
  auto operator=(const thread_pool&) -> thread_pool& = delete;

  class executor_type {
   public:
    using executor_concept = executor_t;

    explicit executor_type(thread_pool* pool) noexcept : pool_(pool) {}

    void execute(std::function<void()> work) const {
      pool_->submit(std::move(work));
    }

    auto operator==(const executor_type& other) const noexcept -> bool {
      return pool_ == other.pool_;
    }

   private:
    thread_pool* pool_;
  };

  auto get_executor() noexcept -> executor_type {
    return executor_type{this};
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return workers_.size();
  }

 private:
  friend class executor_type;

  void submit(std::function<void()> work) {
    {
      std::scoped_lock lock(mutex_);
      if (stop_) {
        spdlog::warn("thread_pool is shutting down, dropping work item");
        return;
      }
      queue_.push(std::move(work));
    }
    cv_.notify_one();
  }

  void worker_thread() {
    while (true) {
      std::function<void()> work;

      {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] -> bool { return stop_ || !queue_.empty(); });

        // Drain what was queued before shutdown.
        if (stop_ && queue_.empty()) {
          return;
        }

        work = std::move(queue_.front());
        queue_.pop();
      }

      work();
    }
  }

  std::vector<std::thread>          workers_;
  std::queue<std::function<void()>> queue_;
  std::condition_variable           cv_;
  std::mutex                        mutex_;
  bool                              stop_{false};
};

}  // namespace pledge::async
