#include "msgrpc/async/deferred-result.hpp"

#include <catch2/catch.hpp>

#include <future>
#include <stdexcept>
#include <string>

namespace msgrpc::async::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("DeferredResult", "[deferred-result]") {
  auto loop = std::make_shared<EventLoop>();

  CATCH_SECTION("set-value") {
    Promise<int> promise{loop};
    auto future = promise.get_future();
    CATCH_REQUIRE(future.valid());
    CATCH_REQUIRE(!future.is_ready());
    promise.set_value(42);
    CATCH_REQUIRE(future.is_ready());
    CATCH_REQUIRE(!future.has_exception());
    CATCH_REQUIRE(future.get() == 42);
    CATCH_REQUIRE(future.get() == 42); // may be called more than once
  }

  CATCH_SECTION("set-exception") {
    Promise<int> promise{loop};
    auto future = promise.get_future();
    promise.set_exception(std::make_exception_ptr(std::runtime_error{"bad"}));
    CATCH_REQUIRE(future.has_exception());
    CATCH_REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }

  CATCH_SECTION("single-assignment") {
    Promise<int> promise{loop};
    auto future = promise.get_future();
    promise.set_value(1);
    try {
      promise.set_value(2);
      CATCH_REQUIRE(false); // should have thrown
    } catch (std::future_error& e) {
      CATCH_REQUIRE(e.code() == std::future_errc::promise_already_satisfied);
    }
    CATCH_REQUIRE_THROWS_AS(promise.set_exception(std::make_exception_ptr(std::runtime_error{""})),
                            std::future_error);
    CATCH_REQUIRE(future.get() == 1);
  }

  CATCH_SECTION("future-retrieved-once") {
    Promise<int> promise{loop};
    auto future = promise.get_future();
    CATCH_REQUIRE_THROWS_AS(promise.get_future(), std::future_error);
  }

  CATCH_SECTION("no-state") {
    Future<int> future;
    CATCH_REQUIRE(!future.valid());
    CATCH_REQUIRE(!future.is_ready());
    CATCH_REQUIRE_THROWS_AS(future.get(), std::future_error);
    CATCH_REQUIRE_THROWS_AS(Promise<int>{nullptr}, std::invalid_argument);
  }

  CATCH_SECTION("step-timeout") {
    const auto now = tick();
    Promise<int> never{loop};
    Promise<int> promise{loop, now + std::chrono::seconds{1}};
    CATCH_REQUIRE(!never.step_timeout(now + std::chrono::hours{1000}));
    CATCH_REQUIRE(!promise.step_timeout(now));
    CATCH_REQUIRE(promise.step_timeout(now + std::chrono::seconds{1}));
    promise.set_value(1);
    CATCH_REQUIRE(!promise.step_timeout(now + std::chrono::seconds{2})); // already set
  }

  CATCH_SECTION("callbacks") {
    Promise<std::string> promise{loop};
    auto future = promise.get_future();

    int counter = 0;
    future.attach_callback([&](const Future<std::string>& f) {
      CATCH_REQUIRE(f.is_ready());
      CATCH_REQUIRE(f.get() == "done");
      ++counter;
    });
    CATCH_REQUIRE(counter == 0);
    promise.set_value("done");
    CATCH_REQUIRE(counter == 1);

    // Already set, so runs immediately
    future.attach_callback([&](const Future<std::string>&) { ++counter; });
    CATCH_REQUIRE(counter == 2);
  }

  CATCH_SECTION("result-and-error-handlers") {
    Promise<int> p1{loop};
    auto f1 = p1.get_future();
    f1.attach_result_handler([](int x) { return x * 2; });
    p1.set_value(21);
    CATCH_REQUIRE(f1.get() == 42);

    Promise<int> p2{loop};
    auto f2 = p2.get_future();
    f2.attach_error_handler([](std::exception_ptr) { return -1; });
    p2.set_exception(std::make_exception_ptr(std::runtime_error{"bad"}));
    CATCH_REQUIRE(f2.get() == -1);
  }

  CATCH_SECTION("join-drives-the-loop") {
    Promise<int> promise{loop};
    auto future = promise.get_future();
    loop->post([&]() {
      promise.set_value(7);
      loop->stop();
    });
    CATCH_REQUIRE(future.get() == 7);
  }

  CATCH_SECTION("join-returns-without-a-stop") {
    Promise<int> promise{loop};
    auto future = promise.get_future();
    bool later = false;
    loop->post([&]() { promise.set_value(8); });
    loop->post([&]() { later = true; });
    CATCH_REQUIRE(future.get() == 8);
    CATCH_REQUIRE(!later); // returned as soon as the value was set
  }

  CATCH_SECTION("join-inside-the-loop") {
    Promise<int> promise{loop};
    auto future = promise.get_future();
    bool threw = false;
    loop->post([&]() {
      try {
        future.join();
      } catch (std::logic_error&) {
        threw = true;
      }
      loop->stop();
    });
    loop->start();
    CATCH_REQUIRE(threw);
  }

  CATCH_SECTION("wait-for") {
    Promise<int> promise{loop};
    auto future = promise.get_future();
    CATCH_REQUIRE(future.wait_for(std::chrono::milliseconds{20}) == std::future_status::timeout);
    loop->post([&]() {
      promise.set_value(1);
      loop->stop();
    });
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
  }

  CATCH_SECTION("wait-for-zero-polls") {
    Promise<int> promise{loop};
    auto future = promise.get_future();
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{0}) == std::future_status::timeout);
    promise.set_value(1);
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{0}) == std::future_status::ready);
  }
}

} // namespace msgrpc::async::test
