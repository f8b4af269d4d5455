#include <chrono>
#include <future>
#include <pledge/async.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

using namespace pledge::async;
using namespace std::chrono_literals;

auto main() -> int {
  spdlog::set_default_logger(spdlog::stdout_color_mt("retry"));
  spdlog::set_level(spdlog::level::debug);

  timer_queue timers;
  int         attempts = 0;

  // Fails twice before the server "comes back"
  auto flaky = [&attempts]() -> future<int, std::string> {
    if (++attempts < 3) {
      return just_error<int>(std::string("server unavailable"));
    }
    return just<std::string>(200);
  };

  retry_strategy strategy{
      .max_attempts = 5,
      .wait         = wait_policy::exponential(50ms, 2.0, 1s),
  };

  std::promise<completion<int, std::string>> done;
  retry(strategy, timers, flaky).observe([&done](const completion<int, std::string>& c) {
    done.set_value(c);
  });

  auto result = done.get_future().get();
  if (result.has_value()) {
    spdlog::info("status {} after {} attempts", result.value(), attempts);
  } else if (result.has_error()) {
    spdlog::error("gave up: {}", result.error());
  }

  return 0;
}
