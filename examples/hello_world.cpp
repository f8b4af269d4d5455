#include <future>
#include <pledge/async.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

using namespace pledge::async;

auto main() -> int {
  spdlog::set_default_logger(spdlog::stdout_color_mt("hello"));

  // Create a thread pool with 4 threads and a serial queue to deliver results on
  thread_pool  pool{4};
  serial_queue main_queue;

  // Build the pipeline, nothing runs until it is observed
  auto work = just<std::string>(21) | schedule_on(pool.get_executor()) | map([](int x) -> int {
                spdlog::info("Hello from thread pool!");
                return x;
              })
              | then([](int x) { return just<std::string>(x * 2); })
              | receive_on(main_queue.get_executor());

  std::promise<completion<int, std::string>> done;
  work.observe([&done](const completion<int, std::string>& c) { done.set_value(c); });

  auto result = done.get_future().get();
  if (result.has_value()) {
    spdlog::info("Final result: {}", result.value());
  }

  return 0;
}
