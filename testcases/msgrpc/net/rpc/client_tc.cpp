#include "scripted-transport.hpp"

#include "msgrpc/net/rpc/client.hpp"
#include "msgrpc/net/transport/in-process-transport.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

namespace msgrpc::net::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("Client", "[client]") {
  Script script;
  Client::Config config;
  config.address = Address{"127.0.0.1", 18800};
  config.transport_builder = script.builder();

  CATCH_SECTION("attaches-a-timeout-sweep") {
    Client client{config};
    CATCH_REQUIRE(client.timeout() == std::chrono::seconds{10});
    CATCH_REQUIRE(client.has_timeout_sweep());
  }

  CATCH_SECTION("no-sweep-without-a-timeout") {
    config.timeout = std::chrono::seconds{0};
    Client client{config};
    CATCH_REQUIRE(!client.has_timeout_sweep());
  }

  CATCH_SECTION("context-closes-the-client") {
    {
      auto client = Client::open(config);
      CATCH_REQUIRE(client.get() != nullptr);
      CATCH_REQUIRE((*client).address() == config.address);
      client->call_with_callback("ping", [](std::optional<Value>) {});
      CATCH_REQUIRE(!script.is_closed);
    }
    CATCH_REQUIRE(script.is_closed);
  }

  CATCH_SECTION("context-closes-the-client-when-an-exception-propagates") {
    try {
      auto client = Client::open(config);
      client->call_async("ping");
      throw std::runtime_error{"application error"};
    } catch (std::runtime_error& e) {
      CATCH_REQUIRE(std::string{e.what()} == "application error"); // not swallowed
    }
    CATCH_REQUIRE(script.is_closed);
  }
}

CATCH_TEST_CASE("Client timeouts", "[client]") {
  auto service = InProcessService::make();
  service->add_deferred_method("slow", [](const Array&, InProcessService::Responder) {});
  service->add_method("echo", [](const Array& args) { return args.at(0); });

  Client::Config config;
  config.timeout = std::chrono::seconds{1};
  config.transport_builder = service->builder();
  Client client{config};

  CATCH_SECTION("async-call-times-out") {
    auto future = client.call_async("slow");
    CATCH_REQUIRE_THROWS_AS(future.get(), TimeoutError);
    CATCH_REQUIRE(client.pending_count() == 0);
  }

  CATCH_SECTION("sync-call") {
    CATCH_REQUIRE(client.call("echo", "hello") == Value{"hello"});
    CATCH_REQUIRE_THROWS_AS(client.call("slow"), TimeoutError);
    CATCH_REQUIRE(client.has_timeout_sweep());
  }
}

} // namespace msgrpc::net::test
