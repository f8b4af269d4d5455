#include <chrono>
#include <future>
#include <pledge/async.hpp>
#include <pledge/operations.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

using namespace pledge::async;
using namespace pledge::operations;
using namespace std::chrono_literals;

// Pretends to talk to a server: completes after latency on the timer thread.
auto fake_request(timer_queue& timers, std::string name, std::chrono::milliseconds latency)
    -> future<std::string, std::string> {
  return future<std::string, std::string>(
      [&timers, name, latency](resolver<std::string, std::string> r) {
        spdlog::info("{}: started", name);
        auto token = timers.schedule_after(timer_kind::deadline, latency, [name, r] {
          spdlog::info("{}: done", name);
          r.set_value(name);
        });
        r.set_cancel_handler([token, r] {
          token.cancel();
          r.set_cancelled();
        });
      });
}

auto main() -> int {
  spdlog::set_default_logger(spdlog::stdout_color_mt("operations"));
  spdlog::set_level(spdlog::level::debug);

  timer_queue            timers;
  exclusivity_controller controller;
  thread_pool            pool{4};
  operation_queue        queue(pool.get_executor(), {.name = "api"});

  // Account requests run one after another; the tunnel request is independent.
  std::vector<future<std::string, std::string>> requests{
      fake_request(timers, "update account", 100ms) | run_on(queue, controller, {"account"}),
      fake_request(timers, "fetch account", 50ms) | run_on(queue, controller, {"account"}),
      fake_request(timers, "reconnect tunnel", 30ms) | run_on(queue, controller, {"tunnel"}),
  };

  std::vector<std::promise<void>> done(requests.size());
  for (std::size_t i = 0; i < requests.size(); ++i) {
    requests[i].observe([&done, i](const completion<std::string, std::string>& c) {
      if (c.has_value()) {
        spdlog::info("completed: {}", c.value());
      }
      done[i].set_value();
    });
  }
  for (auto& d : done) {
    d.get_future().wait();
  }

  return 0;
}
