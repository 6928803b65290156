#include "msgrpc/async/event-loop.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <stdexcept>

namespace msgrpc::async::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("EventLoop", "[event-loop]") {
  EventLoop loop;

  CATCH_SECTION("start-until-stop") {
    int counter = 0;
    loop.post([&]() { ++counter; });
    loop.post([&]() {
      ++counter;
      CATCH_REQUIRE(loop.is_running());
      loop.stop();
    });
    loop.post([&]() { ++counter; }); // runs on the next `start`
    loop.start();
    CATCH_REQUIRE(counter == 2);
    CATCH_REQUIRE(!loop.is_running());
    CATCH_REQUIRE(!loop.is_stop_requested());

    loop.post([&]() { loop.stop(); });
    loop.start();
    CATCH_REQUIRE(counter == 3);
  }

  CATCH_SECTION("stop-before-start") {
    bool executed = false;
    loop.post([&]() { executed = true; });
    loop.stop();
    CATCH_REQUIRE(loop.is_stop_requested());
    loop.start(); // consumes the stop, and returns at once
    CATCH_REQUIRE(!executed);
    CATCH_REQUIRE(!loop.is_stop_requested());
  }

  CATCH_SECTION("nested-start-is-a-no-op") {
    int depth = 0;
    loop.post([&]() {
      ++depth;
      loop.start(); // already running
      loop.stop();
    });
    loop.start();
    CATCH_REQUIRE(depth == 1);
  }

  CATCH_SECTION("run-for") {
    CATCH_REQUIRE(loop.run_for(std::chrono::milliseconds{20}) == false);
    loop.post([&]() { loop.stop(); });
    CATCH_REQUIRE(loop.run_for(std::chrono::seconds{5}) == true);
  }

  CATCH_SECTION("run-until") {
    int counter = 0;
    for (int i = 0; i < 4; ++i)
      loop.post([&]() { ++counter; });
    CATCH_REQUIRE(loop.run_until([&]() { return counter == 3; }));
    CATCH_REQUIRE(counter == 3);
    CATCH_REQUIRE(!loop.is_running());

    // A stop neither ends the wait, nor survives it
    loop.post([&]() { loop.stop(); });
    loop.post([&]() { ++counter; });
    CATCH_REQUIRE(loop.run_until([&]() { return counter == 5; }));
    CATCH_REQUIRE(!loop.is_stop_requested());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds{20};
    CATCH_REQUIRE(!loop.run_until([]() { return false; }, deadline));
    CATCH_REQUIRE(std::chrono::steady_clock::now() >= deadline);
  }

  CATCH_SECTION("run-until-inside-the-loop") {
    bool threw = false;
    loop.post([&]() {
      try {
        loop.run_until([]() { return true; });
      } catch (std::logic_error&) {
        threw = true;
      }
      loop.stop();
    });
    loop.start();
    CATCH_REQUIRE(threw);
  }

  CATCH_SECTION("handler-exceptions-propagate") {
    loop.post([]() { throw std::runtime_error{"oops"}; });
    CATCH_REQUIRE_THROWS_AS(loop.start(), std::runtime_error);
    CATCH_REQUIRE(!loop.is_running());
  }

  CATCH_SECTION("periodic-callback") {
    int counter = 0;
    auto periodic = loop.attach_periodic_callback(
        [&]() {
          if (++counter == 3)
            loop.stop();
        },
        std::chrono::milliseconds{5});
    CATCH_REQUIRE(periodic.is_attached());
    CATCH_REQUIRE(periodic.interval() == std::chrono::milliseconds{5});
    loop.start();
    CATCH_REQUIRE(counter == 3);

    periodic.cancel();
    CATCH_REQUIRE(!periodic.is_attached());
    loop.run_for(std::chrono::milliseconds{30});
    CATCH_REQUIRE(counter == 3);
  }

  CATCH_SECTION("periodic-callback-detaches-on-destruction") {
    int counter = 0;
    {
      auto periodic =
          loop.attach_periodic_callback([&]() { ++counter; }, std::chrono::milliseconds{5});
    }
    loop.run_for(std::chrono::milliseconds{30});
    CATCH_REQUIRE(counter == 0);
  }

  CATCH_SECTION("periodic-callback-arguments") {
    CATCH_REQUIRE_THROWS_AS((loop.attach_periodic_callback({}, std::chrono::milliseconds{5})),
                            std::invalid_argument);
    CATCH_REQUIRE_THROWS_AS((loop.attach_periodic_callback([]() {}, std::chrono::milliseconds{0})),
                            std::invalid_argument);
  }
}

CATCH_TEST_CASE("EventLoop over a host io_context", "[event-loop]") {
  boost::asio::io_context io_context;
  EventLoop loop{io_context};
  CATCH_REQUIRE(&loop.io_context() == &io_context);

  bool executed = false;
  loop.post([&]() { executed = true; });
  io_context.run(); // the host drives the loop
  CATCH_REQUIRE(executed);
}

} // namespace msgrpc::async::test
