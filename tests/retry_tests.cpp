#include <atomic>
#include <boost/ut.hpp>
#include <chrono>
#include <exception>
#include <pledge/async.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"

using namespace boost::ut;
using namespace pledge::async;
using namespace std::chrono_literals;
using pledge::testing::completion_latch;
using pledge::testing::error;
using pledge::testing::sync_wait;

// ============================================================================
// Test Helpers
// ============================================================================

namespace {

// Producer that fails fail_times times, then succeeds with success_value.
struct failing_producer {
  std::atomic<int>& attempt_count;
  int               fail_times;
  int               success_value;

  auto operator()() const -> future<int, error> {
    int current = ++attempt_count;
    if (current <= fail_times) {
      return just_error<int>(error("attempt " + std::to_string(current)));
    }
    return just<error>(success_value);
  }
};

// Same, but every attempt completes on another thread.
struct async_failing_producer {
  std::atomic<int>& attempt_count;
  int               fail_times;
  int               success_value;

  auto operator()() const -> future<int, error> {
    return future<int, error>([*this](resolver<int, error> r) {
      std::thread([*this, r] {
        int current = ++attempt_count;
        if (current <= fail_times) {
          r.set_error("attempt " + std::to_string(current));
        } else {
          r.set_value(success_value);
        }
      }).detach();
    });
  }
};

}  // namespace

int main() {
  // ==========================================================================
  // Attempt counting
  // ==========================================================================

  "retry - succeeds after failures with immediate waits"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto start  = std::chrono::steady_clock::now();
    auto result = sync_wait(retry(retry_strategy{.max_attempts = 3}, timers,
                                  failing_producer{attempts, 2, 42}));
    auto took   = std::chrono::steady_clock::now() - start;

    expect(result.has_value());
    expect(result->has_value());
    expect(result->value() == 42_i);
    expect(eq(attempts.load(), 3));
    expect(took < 1s);
    expect(eq(timers.pending_count(), 0u));
  };

  "retry - gives up with the last failure"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto result = sync_wait(retry(retry_strategy{.max_attempts = 2}, timers,
                                  failing_producer{attempts, 100, 0}));

    expect(result.has_value());
    expect(result->has_error());
    expect(result->error() == std::string("attempt 2"));
    expect(eq(attempts.load(), 2));
  };

  "retry - success on the first attempt runs the producer once"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto result = sync_wait(retry(retry_strategy{.max_attempts = 5}, timers,
                                  failing_producer{attempts, 0, 7}));

    expect(result->value() == 7_i);
    expect(eq(attempts.load(), 1));
  };

  "retry - zero max_attempts counts as one"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto result = sync_wait(retry(retry_strategy{.max_attempts = 0}, timers,
                                  failing_producer{attempts, 100, 0}));

    expect(result->has_error());
    expect(eq(attempts.load(), 1));
  };

  "retry - many synchronous failures do not grow the stack"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto result = sync_wait(retry(retry_strategy{.max_attempts = 100000}, timers,
                                  failing_producer{attempts, 99999, 1}));

    expect(result->value() == 1_i);
    expect(eq(attempts.load(), 100000));
  };

  "retry - attempts completing on other threads"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto result = sync_wait(retry(retry_strategy{.max_attempts = 4}, timers,
                                  async_failing_producer{attempts, 3, 9}));

    expect(result->value() == 9_i);
    expect(eq(attempts.load(), 4));
  };

  "retry - cancelled producer result is final"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto result = sync_wait(retry(retry_strategy{.max_attempts = 3}, timers, [&] {
      ++attempts;
      return just_cancelled<int, error>();
    }));

    expect(result->is_cancelled());
    expect(eq(attempts.load(), 1));
  };

  // ==========================================================================
  // Wait policies
  // ==========================================================================

  "wait_policy - immediate"_test = [] {
    auto waits = wait_policy::immediate().make_sequence();

    expect(waits.next() == 0ms);
    expect(waits.next() == 0ms);
  };

  "wait_policy - constant"_test = [] {
    auto waits = wait_policy::constant(15ms).make_sequence();

    expect(waits.next() == 15ms);
    expect(waits.next() == 15ms);
    expect(waits.next() == 15ms);
  };

  "wait_policy - exponential is capped"_test = [] {
    auto waits = wait_policy::exponential(10ms, 2.0, 50ms).make_sequence();

    std::vector<std::chrono::milliseconds> seen;
    for (int i = 0; i < 5; ++i) {
      seen.push_back(waits.next());
    }
    expect(seen == std::vector<std::chrono::milliseconds>{10ms, 20ms, 40ms, 50ms, 50ms});
  };

  "retry - constant wait spaces the attempts"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto strategy = retry_strategy{.max_attempts = 3, .wait = wait_policy::constant(20ms)};
    auto start    = std::chrono::steady_clock::now();
    auto result   = sync_wait(retry(strategy, timers, failing_producer{attempts, 2, 5}));
    auto took     = std::chrono::steady_clock::now() - start;

    expect(result->value() == 5_i);
    expect(eq(attempts.load(), 3));
    expect(took >= 40ms);
  };

  "retry - wall clock waits"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto strategy = retry_strategy{.max_attempts = 2,
                                   .wait         = wait_policy::constant(10ms),
                                   .timer        = timer_kind::wall_clock};
    auto result   = sync_wait(retry(strategy, timers, failing_producer{attempts, 1, 8}));

    expect(result->value() == 8_i);
    expect(eq(attempts.load(), 2));
  };

  // ==========================================================================
  // Cancellation
  // ==========================================================================

  "retry - cancel during the wait stops further attempts"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto strategy = retry_strategy{.max_attempts = 5, .wait = wait_policy::constant(100ms)};
    auto fut      = retry(strategy, timers, failing_producer{attempts, 100, 0});

    completion_latch<int, error> latch;
    auto token = fut.observe([&](const completion<int, error>& c) { latch.set(c); });

    std::this_thread::sleep_for(20ms);
    expect(token.cancel());

    auto result = latch.wait_for(1s);
    expect(result.has_value());
    expect(result->is_cancelled());

    std::this_thread::sleep_for(200ms);
    expect(eq(attempts.load(), 1));
    expect(eq(latch.count(), 1));
  };

  "retry - cancel reaches the in-flight attempt"_test = [] {
    timer_queue timers;
    bool        attempt_cancelled = false;

    auto fut = retry(retry_strategy{.max_attempts = 3}, timers, [&] {
      return future<int, error>([&](resolver<int, error> r) {
        r.set_cancel_handler([&attempt_cancelled, r] {
          attempt_cancelled = true;
          r.set_cancelled();
        });
      });
    });

    completion_latch<int, error> latch;
    auto token = fut.observe([&](const completion<int, error>& c) { latch.set(c); });
    expect(token.cancel());

    auto result = latch.wait_for(1s);
    expect(result->is_cancelled());
    expect(attempt_cancelled);
  };

  // ==========================================================================
  // then_retry
  // ==========================================================================

  "then_retry - retries with the upstream value"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto fut = just<error>(10) | then_retry(retry_strategy{.max_attempts = 3}, timers, [&](int v) {
                 if (++attempts < 3) {
                   return just_error<int>(error("not yet"));
                 }
                 return just<error>(v + attempts.load());
               });
    auto result = sync_wait(fut);

    expect(result->value() == 13_i);
    expect(eq(attempts.load(), 3));
  };

  "then_retry - upstream failure skips the producer"_test = [] {
    timer_queue timers;
    bool        called = false;

    auto fut = just_error<int>(error("upstream"))
               | then_retry(retry_strategy{.max_attempts = 3}, timers, [&](int v) {
                   called = true;
                   return just<error>(v);
                 });
    auto result = sync_wait(fut);

    expect(result->has_error());
    expect(result->error() == std::string("upstream"));
    expect(!called);
  };

  "then_retry - void upstream"_test = [] {
    timer_queue      timers;
    std::atomic<int> attempts{0};

    auto fut = just<error>()
               | then_retry(retry_strategy{.max_attempts = 2}, timers,
                            failing_producer{attempts, 1, 4});
    auto result = sync_wait(fut);

    expect(result->value() == 4_i);
    expect(eq(attempts.load(), 2));
  };
}
