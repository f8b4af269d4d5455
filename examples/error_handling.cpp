#include <exception>
#include <future>
#include <pledge/async.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

using namespace pledge::async;

auto risky_computation(int x) {
  return just<std::exception_ptr>(x) | map([](int val) -> int {
           spdlog::info("Processing value: {}", val);
           if (val < 0) {
             throw std::runtime_error("Negative value not allowed!");
           }
           return val * 2;
         })
         | map_error([](const std::exception_ptr& ep) -> std::string {
             try {
               std::rethrow_exception(ep);
             } catch (const std::exception& e) {
               return e.what();
             }
           })
         | on_failure(
             [](const std::string& message) { spdlog::warn("Error caught: {}", message); });
}

void report(const char* label, const future<int, std::string>& fut) {
  std::promise<completion<int, std::string>> done;
  fut.observe([&done](const completion<int, std::string>& c) { done.set_value(c); });

  auto result = done.get_future().get();
  if (result.has_value()) {
    spdlog::info("{}: {}", label, result.value());
  } else if (result.has_error()) {
    spdlog::info("{} failed: {}", label, result.error());
  }
}

auto main() -> int {
  spdlog::set_default_logger(spdlog::stdout_color_mt("errors"));

  spdlog::info("=== Success case ===");
  report("Result 1", risky_computation(5));

  spdlog::info("=== Error case ===");
  report("Result 2", risky_computation(-5));

  return 0;
}
