#include "msgrpc/net/rpc/session.hpp"
#include "msgrpc/net/transport/in-process-transport.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace msgrpc::net::test {

/// Records what a transport tells its session
struct RecordingHandler final : public TransportHandler {
  std::vector<ResponseEnvelope> responses;
  std::vector<std::string> failures;

  void on_response(MessageId msgid, Value error, Value result) override {
    responses.push_back(ResponseEnvelope{msgid, std::move(error), std::move(result)});
  }
  void on_connect_failed(std::string_view reason) override {
    failures.push_back(std::string{reason});
  }
};

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("InProcessTransport", "[in-process-transport]") {
  auto loop = std::make_shared<async::EventLoop>();
  auto service = InProcessService::make();
  RecordingHandler handler;

  TransportOptions options;
  options.address = Address{"in-process", 0};
  options.loop = loop;
  auto transport = service->builder()(handler, options);
  auto& in_process = dynamic_cast<InProcessTransport&>(*transport);

  std::vector<std::string> log;
  service->add_method("echo", [](const Array& args) { return Value{args}; });
  service->add_method("throws", [](const Array&) -> Value { throw std::runtime_error{"bad"}; });
  service->add_method("remote-error", [](const Array&) -> Value {
    throw RemoteError{Value{make_array("code", 42)}};
  });
  service->add_method("log", [&](const Array& args) {
    log.emplace_back(*args.at(0).as_string());
    return Value{};
  });

  InProcessService::Responder saved;
  service->add_deferred_method("later", [&](const Array&, InProcessService::Responder respond) {
    saved = std::move(respond);
  });

  auto drain = [&]() { loop->run_for(std::chrono::milliseconds{20}); };

  CATCH_SECTION("registry") {
    CATCH_REQUIRE(service->has_method("echo"));
    CATCH_REQUIRE(!service->has_method("nope"));
    CATCH_REQUIRE(service->connection_count() == 1);
    CATCH_REQUIRE_THROWS_AS((service->add_method("x", {})), std::invalid_argument);
  }

  CATCH_SECTION("request") {
    bool is_sent = false;
    transport->send_message(make_request(3, "echo", make_array(1, "a")), [&]() { is_sent = true; });
    CATCH_REQUIRE(!is_sent); // everything happens on the loop
    CATCH_REQUIRE(handler.responses.empty());
    drain();
    CATCH_REQUIRE(is_sent);
    CATCH_REQUIRE(service->request_count() == 1);
    CATCH_REQUIRE(handler.responses.size() == 1);
    CATCH_REQUIRE(handler.responses[0].msgid == 3);
    CATCH_REQUIRE(handler.responses[0].error.is_nil());
    CATCH_REQUIRE(handler.responses[0].result == Value{make_array(1, "a")});
  }

  CATCH_SECTION("errors") {
    transport->send_message(make_request(1, "nope", {}), {});
    transport->send_message(make_request(2, "throws", {}), {});
    transport->send_message(make_request(3, "remote-error", {}), {});
    drain();
    CATCH_REQUIRE(handler.responses.size() == 3);
    CATCH_REQUIRE(handler.responses[0].error == Value{"method not found: nope"});
    CATCH_REQUIRE(handler.responses[1].error == Value{"bad"});
    CATCH_REQUIRE(handler.responses[2].error == Value{make_array("code", 42)});
  }

  CATCH_SECTION("deferred-response") {
    transport->send_message(make_request(5, "later", {}), {});
    drain();
    CATCH_REQUIRE(handler.responses.empty());
    CATCH_REQUIRE(saved);

    saved(Value{}, Value{"done"});
    saved(Value{}, Value{"again"}); // only the first answer counts
    drain();
    CATCH_REQUIRE(handler.responses.size() == 1);
    CATCH_REQUIRE(handler.responses[0].result == Value{"done"});
  }

  CATCH_SECTION("notify") {
    bool is_sent = false;
    transport->send_message(make_notify("log", make_array("hello")), [&]() { is_sent = true; });
    transport->send_message(make_notify("nope", {}), {});
    drain();
    CATCH_REQUIRE(is_sent);
    CATCH_REQUIRE(service->notify_count() == 2);
    CATCH_REQUIRE(log == std::vector<std::string>{"hello"});
    CATCH_REQUIRE(handler.responses.empty());
  }

  CATCH_SECTION("invalid-messages") {
    CATCH_REQUIRE_THROWS_AS((transport->send_message(Value{1}, {})), RpcError);
    CATCH_REQUIRE_THROWS_AS((transport->send_message(make_response(1, Value{}, Value{}), {})),
                            RpcError);
  }

  CATCH_SECTION("close") {
    transport->send_message(make_request(1, "echo", {}), {});
    transport->close();
    drain();
    CATCH_REQUIRE(handler.responses.empty()); // nothing is delivered after close
    CATCH_REQUIRE(in_process.is_closed());
    CATCH_REQUIRE(service->connection_count() == 0);
    CATCH_REQUIRE_THROWS_AS((transport->send_message(make_request(2, "echo", {}), {})), RpcError);
  }

  CATCH_SECTION("destroyed-with-queued-work") {
    transport->send_message(make_request(1, "later", {}), {});
    drain();
    transport.reset();
    CATCH_REQUIRE(service->connection_count() == 0);
    saved(Value{}, Value{1}); // the connection is gone
    drain();
    CATCH_REQUIRE(handler.responses.empty());
  }

  CATCH_SECTION("fail") {
    in_process.fail("reset by peer");
    CATCH_REQUIRE(handler.failures.empty());
    drain();
    CATCH_REQUIRE(handler.failures == std::vector<std::string>{"reset by peer"});
    CATCH_REQUIRE(in_process.is_closed());
  }

  CATCH_SECTION("service-fails-every-connection") {
    RecordingHandler other;
    auto second = service->builder()(other, options);
    CATCH_REQUIRE(service->connection_count() == 2);
    service->fail("shutting down");
    drain();
    CATCH_REQUIRE(handler.failures.size() == 1);
    CATCH_REQUIRE(other.failures.size() == 1);
    CATCH_REQUIRE(service->connection_count() == 0);
  }
}

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("InProcessTransport drives a session", "[in-process-transport]") {
  auto service = InProcessService::make();
  service->add_method("add", [](const Array& args) {
    return Value{*args.at(0).as_int() + *args.at(1).as_int()};
  });
  std::vector<Value> notified;
  service->add_method("log", [&](const Array& args) {
    notified.push_back(Value{args});
    return Value{};
  });

  Session::Config config;
  config.transport_builder = service->builder();
  Session session{std::move(config)};

  CATCH_SECTION("notify-is-flushed") {
    session.notify("log", "hello");
    CATCH_REQUIRE(service->notify_count() == 1);
    CATCH_REQUIRE(notified.size() == 1);
    CATCH_REQUIRE(notified[0] == Value{make_array("hello")});
  }

  CATCH_SECTION("connection-failure") {
    auto future = session.call_async("add", 1, 2);
    service->fail("gone");
    CATCH_REQUIRE_THROWS_AS(future.get(), ConnectionError);
    CATCH_REQUIRE(session.is_closed());
    CATCH_REQUIRE(service->connection_count() == 0);
  }
}

} // namespace msgrpc::net::test
