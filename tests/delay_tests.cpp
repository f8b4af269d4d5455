#include <atomic>
#include <boost/ut.hpp>
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <pledge/async.hpp>
#include <thread>
#include <vector>

#include "test_support.hpp"

using namespace std::chrono_literals;

int main() {
  using namespace boost::ut;
  using namespace pledge::async;
  using pledge::testing::completion_latch;
  using pledge::testing::error;
  using pledge::testing::sync_wait;

  "timer_queue - fires after the delay"_test = [] {
    timer_queue timers;
    auto        start = std::chrono::steady_clock::now();

    completion_latch<std::chrono::steady_clock::duration, error> latch;
    timers.schedule_after(timer_kind::deadline, 30ms, [&] {
      latch.set(std::expected<std::chrono::steady_clock::duration, error>(
          std::chrono::steady_clock::now() - start));
    });

    auto fired = latch.wait_for(2s);
    expect(fired.has_value());
    expect(fired->value() >= 30ms);
  };

  "timer_queue - fires in deadline order"_test = [] {
    timer_queue      timers;
    std::mutex       mutex;
    std::vector<int> order;
    std::atomic<int> fired{0};

    auto record = [&](int id) {
      return [&, id] {
        std::scoped_lock lock(mutex);
        order.push_back(id);
        ++fired;
      };
    };
    timers.schedule_after(timer_kind::deadline, 40ms, record(3));
    timers.schedule_after(timer_kind::deadline, 10ms, record(1));
    timers.schedule_after(timer_kind::wall_clock, 25ms, record(2));

    for (int i = 0; i < 200 && fired.load() < 3; ++i) {
      std::this_thread::sleep_for(5ms);
    }
    std::scoped_lock lock(mutex);
    expect(order == std::vector<int>{1, 2, 3});
  };

  "timer_queue - a cancelled timer never fires"_test = [] {
    timer_queue       timers;
    std::atomic<bool> fired{false};

    auto token = timers.schedule_after(timer_kind::deadline, 20ms, [&] { fired = true; });
    expect(token.cancel());
    expect(!token.cancel());

    std::this_thread::sleep_for(60ms);
    expect(!fired.load());
  };

  "timer_queue - cancelled timers behind a far-off timer are released"_test = [] {
    timer_queue       timers;
    std::atomic<bool> fired{false};

    timers.schedule_after(timer_kind::deadline, 1h, [] {});
    for (int i = 0; i < 1000; ++i) {
      auto token = timers.schedule_after(timer_kind::deadline, 2h, [] {});
      expect(token.cancel());
    }
    expect(timers.pending_count() <= 3u);

    timers.schedule_after(timer_kind::deadline, 10ms, [&] { fired = true; });
    for (int i = 0; i < 200 && !fired; ++i) {
      std::this_thread::sleep_for(5ms);
    }
    expect(fired.load());
  };

  "timer_queue - cancel after firing returns false"_test = [] {
    timer_queue       timers;
    std::atomic<bool> fired{false};

    auto token = timers.schedule_after(timer_kind::deadline, 0ms, [&] { fired = true; });
    for (int i = 0; i < 200 && !fired; ++i) {
      std::this_thread::sleep_for(1ms);
    }
    expect(fired.load());
    expect(!token.cancel());
  };

  "timer_queue - discards pending timers on destruction"_test = [] {
    std::atomic<bool> fired{false};
    {
      timer_queue timers;
      timers.schedule_after(timer_kind::deadline, 10s, [&] { fired = true; });
      expect(eq(timers.pending_count(), 1u));
    }
    expect(!fired.load());
  };

  "delay - success is held back for the duration"_test = [] {
    timer_queue timers;
    auto        start  = std::chrono::steady_clock::now();
    auto        result = sync_wait(just<error>(1) | delay(timers, 50ms));
    auto        took   = std::chrono::steady_clock::now() - start;

    expect(result.has_value());
    expect(result->value() == 1_i);
    expect(took >= 50ms);
  };

  "delay - wall clock timer"_test = [] {
    timer_queue timers;
    auto        start  = std::chrono::steady_clock::now();
    auto        result = sync_wait(delay(just<error>(2), timers, 30ms, timer_kind::wall_clock));
    auto        took   = std::chrono::steady_clock::now() - start;

    expect(result->value() == 2_i);
    expect(took >= 25ms);
  };

  "delay - failure is not delayed"_test = [] {
    timer_queue timers;
    auto        start  = std::chrono::steady_clock::now();
    auto        result = sync_wait(just_error<int>(error("fast")) | delay(timers, 5s));
    auto        took   = std::chrono::steady_clock::now() - start;

    expect(result->has_error());
    expect(took < 1s);
  };

  "delay - cancelled during the wait never continues"_test = [] {
    timer_queue timers;
    bool        continued = false;

    auto chain = just<error>(1) | delay(timers, 100ms) | map([&](int v) {
                   continued = true;
                   return v;
                 });

    completion_latch<int, error> latch;
    auto token = chain.observe([&](const completion<int, error>& c) { latch.set(c); });

    std::this_thread::sleep_for(20ms);
    expect(token.cancel());

    auto result = latch.wait_for(1s);
    expect(result.has_value());
    expect(result->is_cancelled());

    std::this_thread::sleep_for(150ms);
    expect(!continued);
    expect(eq(latch.count(), 1));
  };
}
