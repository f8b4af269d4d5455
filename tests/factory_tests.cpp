#include <boost/ut.hpp>
#include <expected>
#include <pledge/async.hpp>
#include <string>

#include "test_support.hpp"

int main() {
  using namespace boost::ut;
  using namespace pledge::async;
  using pledge::testing::error;
  using pledge::testing::sync_wait;

  "just - value"_test = [] {
    auto result = sync_wait(just<error>(42));

    expect(result.has_value());
    expect(result->has_value());
    expect(result->value() == 42_i);
  };

  "just - void"_test = [] {
    auto result = sync_wait(just<error>());

    expect(result.has_value());
    expect(result->has_value());
  };

  "just - string value"_test = [] {
    auto result = sync_wait(just<error>(std::string("hello")));

    expect(result.has_value());
    expect(result->value() == std::string("hello"));
  };

  "just_error - failure"_test = [] {
    auto result = sync_wait(just_error<int>(error("bad")));

    expect(result.has_value());
    expect(result->has_error());
    expect(result->error() == std::string("bad"));
  };

  "just_cancelled - cancellation"_test = [] {
    auto result = sync_wait(just_cancelled<int, error>());

    expect(result.has_value());
    expect(result->is_cancelled());
    expect(!result->is_finished());
  };

  "deferred - evaluated on first observe only"_test = [] {
    int  calls = 0;
    auto fut   = deferred([&]() -> std::expected<int, error> {
      ++calls;
      return 5;
    });

    expect(eq(calls, 0));
    auto first  = sync_wait(fut);
    auto second = sync_wait(fut);

    expect(eq(calls, 1));
    expect(first->value() == 5_i);
    expect(second->value() == 5_i);
  };

  "deferred - failure"_test = [] {
    auto fut = deferred([]() -> std::expected<int, error> { return std::unexpected(error("no")); });
    auto result = sync_wait(fut);

    expect(result.has_value());
    expect(result->has_error());
    expect(result->error() == std::string("no"));
  };

  "completion - equality"_test = [] {
    completion<int, error> a{std::expected<int, error>(1)};
    completion<int, error> b{std::expected<int, error>(1)};
    completion<int, error> c{cancelled};

    expect(a == b);
    expect(!(a == c));
    expect(c == completion<int, error>{cancelled});
  };
}
