#include "scripted-transport.hpp"

#include "msgrpc/net/rpc/session.hpp"
#include "msgrpc/net/transport/in-process-transport.hpp"

#include <catch2/catch.hpp>

#include <future>
#include <optional>
#include <set>
#include <stdexcept>

namespace msgrpc::net::test {

static Session::Config make_config(Script& script, std::chrono::seconds timeout) {
  Session::Config config;
  config.address = Address{"localhost", 18800};
  config.timeout = timeout;
  config.transport_builder = script.builder();
  return config;
}

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("Session", "[session]") {
  Script script;
  Session session{make_config(script, std::chrono::seconds{10})};

  CATCH_SECTION("construction") {
    CATCH_REQUIRE(session.address().to_string() == "localhost:18800");
    CATCH_REQUIRE(session.timeout() == std::chrono::seconds{10});
    CATCH_REQUIRE(session.loop() != nullptr);
    CATCH_REQUIRE(script.loop == session.loop());
    CATCH_REQUIRE(script.options.address == session.address());
    CATCH_REQUIRE(script.options.reconnect_limit == 5);
    CATCH_REQUIRE(script.options.pack_encoding == "utf-8");
    CATCH_REQUIRE(script.options.unpack_encoding.empty());
    CATCH_REQUIRE(!session.is_closed());
    CATCH_REQUIRE(!session.has_timeout_sweep());
  }

  CATCH_SECTION("call") {
    script.on_request = [&](const RequestEnvelope& request) {
      const auto sum = *request.args.at(0).as_int() + *request.args.at(1).as_int();
      script.post_response(request.msgid, Value{}, Value{sum});
    };
    CATCH_REQUIRE(session.call("add", 2, 3) == Value{5});
    CATCH_REQUIRE(script.sent.at(0) == Value{make_array(0, 0, "add", make_array(2, 3))});
    CATCH_REQUIRE(session.pending_count() == 0);
    CATCH_REQUIRE(!session.has_timeout_sweep()); // the temporary sweep is gone
  }

  CATCH_SECTION("call-remote-error") {
    script.on_request = [&](const RequestEnvelope& request) {
      script.post_response(request.msgid, Value{"no such thing"}, Value{});
    };
    try {
      session.call("lookup", "x");
      CATCH_REQUIRE(false); // should have thrown
    } catch (RemoteError& e) {
      CATCH_REQUIRE(e.code() == make_error_code(ecode::remote_error));
      CATCH_REQUIRE(e.error() == Value{"no such thing"});
      CATCH_REQUIRE(e.message() == "no such thing");
    }
    CATCH_REQUIRE(session.pending_count() == 0);
  }

  CATCH_SECTION("distinct-ids") {
    std::vector<Session::FutureType> futures;
    for (auto i = 0; i < 100; ++i)
      futures.push_back(session.call_async("noop"));
    std::set<MessageId> msgids;
    for (std::size_t i = 0; i < script.sent.size(); ++i)
      msgids.insert(script.sent_msgid(i));
    CATCH_REQUIRE(msgids.size() == 100);
    CATCH_REQUIRE(session.awaiting_count() == 100);
  }

  CATCH_SECTION("out-of-order-responses") {
    auto f0 = session.call_async("first");
    auto f1 = session.call_async("second");
    CATCH_REQUIRE(script.sent_msgid(0) == 0);
    CATCH_REQUIRE(script.sent_msgid(1) == 1);

    script.respond(1, Value{}, Value{"second"});
    CATCH_REQUIRE(!f0.is_ready());
    CATCH_REQUIRE(f1.is_ready());
    CATCH_REQUIRE(f1.get() == Value{"second"});
    CATCH_REQUIRE(session.pending_count() == 1);

    script.respond(0, Value{}, Value{"first"});
    CATCH_REQUIRE(f0.get() == Value{"first"});
    CATCH_REQUIRE(session.pending_count() == 0);
  }

  CATCH_SECTION("exactly-once-delivery") {
    auto future = session.call_async("once");
    int delivered = 0;
    future.attach_callback([&](const auto&) { ++delivered; });
    script.respond(0, Value{}, Value{1});
    script.respond(0, Value{}, Value{2}); // duplicate, discarded
    CATCH_REQUIRE(delivered == 1);
    CATCH_REQUIRE(future.get() == Value{1});
  }

  CATCH_SECTION("unknown-id-is-discarded") {
    CATCH_REQUIRE_NOTHROW(script.respond(99, Value{}, Value{1}));
    CATCH_REQUIRE_NOTHROW(script.respond(98, Value{"error"}, Value{}));
    CATCH_REQUIRE(session.pending_count() == 0);
  }

  CATCH_SECTION("callbacks") {
    std::vector<std::optional<Value>> results;
    auto callback = [&](std::optional<Value> result) { results.push_back(std::move(result)); };

    session.call_with_callback("ok", callback, 1);
    session.call_with_callback("bad", callback);
    CATCH_REQUIRE(session.callback_count() == 2);
    CATCH_REQUIRE(script.sent.at(0) == Value{make_array(0, 0, "ok", make_array(1))});

    script.respond(0, Value{}, Value{"fine"});
    script.respond(1, Value{"broken"}, Value{"ignored"});
    CATCH_REQUIRE(results.size() == 2);
    CATCH_REQUIRE(results[0] == Value{"fine"});
    CATCH_REQUIRE(!results[1].has_value()); // the error detail is not passed on
    CATCH_REQUIRE(session.pending_count() == 0);
  }

  CATCH_SECTION("timeout-sweep") {
    auto future = session.call_async("slow");
    const auto deadline = future.deadline();
    CATCH_REQUIRE(deadline != ticktock_type::max());

    session.step_timeout(deadline - std::chrono::milliseconds{1});
    CATCH_REQUIRE(!future.is_ready());

    session.step_timeout(deadline);
    CATCH_REQUIRE(future.is_ready());
    CATCH_REQUIRE(session.pending_count() == 0);
    try {
      future.get();
      CATCH_REQUIRE(false); // should have thrown
    } catch (TimeoutError& e) {
      CATCH_REQUIRE(e.code() == make_error_code(ecode::timed_out));
      CATCH_REQUIRE(e.message() == "Request timed out");
    }

    // A late response is discarded, and the outcome does not change
    script.respond(0, Value{}, Value{5});
    CATCH_REQUIRE_THROWS_AS(future.get(), TimeoutError);
  }

  CATCH_SECTION("callbacks-never-time-out") {
    bool called = false;
    session.call_with_callback("slow", [&](std::optional<Value>) { called = true; });
    session.step_timeout(tick() + std::chrono::hours{24});
    CATCH_REQUIRE(!called);
    CATCH_REQUIRE(session.callback_count() == 1);
  }

  CATCH_SECTION("connection-failure") {
    auto f0 = session.call_async("a");
    auto f1 = session.call_async("b");
    auto f2 = session.call_async("c");
    bool callback_called = false;
    session.call_with_callback("d", [&](std::optional<Value>) { callback_called = true; });

    script.fail("connection refused");

    for (auto* future : {&f0, &f1, &f2}) {
      CATCH_REQUIRE(future->is_ready());
      try {
        future->get();
        CATCH_REQUIRE(false); // should have thrown
      } catch (ConnectionError& e) {
        CATCH_REQUIRE(e.code() == make_error_code(ecode::connection_failed));
        CATCH_REQUIRE(e.message() == "connection refused");
      }
    }

    // Callback-style calls are not told about the failure
    CATCH_REQUIRE(!callback_called);
    CATCH_REQUIRE(session.pending_count() == 0);
    CATCH_REQUIRE(session.is_closed());
    CATCH_REQUIRE(script.is_closed);
  }

  CATCH_SECTION("failed-send-unregisters") {
    script.fail_next_send = true;
    CATCH_REQUIRE_THROWS_AS(session.call_async("x"), RpcError);
    CATCH_REQUIRE(session.pending_count() == 0);

    script.fail_next_send = true;
    CATCH_REQUIRE_THROWS_AS((session.call_with_callback("x", [](std::optional<Value>) {})),
                            RpcError);
    CATCH_REQUIRE(session.pending_count() == 0);
  }

  CATCH_SECTION("notify") {
    session.notify("log", "hello", 1);
    CATCH_REQUIRE(script.sent.size() == 1);
    CATCH_REQUIRE(script.sent[0] == Value{make_array(2, "log", make_array("hello", 1))});
    CATCH_REQUIRE(session.pending_count() == 0);
  }

  CATCH_SECTION("close") {
    auto future = session.call_async("a");
    session.call_with_callback("b", [](std::optional<Value>) {});
    session.close();
    CATCH_REQUIRE(session.is_closed());
    CATCH_REQUIRE(script.is_closed);
    CATCH_REQUIRE(session.pending_count() == 0);
    CATCH_REQUIRE(!future.is_ready()); // abandoned

    try {
      session.call_async("c");
      CATCH_REQUIRE(false); // should have thrown
    } catch (RpcError& e) {
      CATCH_REQUIRE(e.code() == make_error_code(ecode::session_closed));
    }
    CATCH_REQUIRE_THROWS_AS(session.notify("d"), RpcError);
    CATCH_REQUIRE_NOTHROW(session.close());
  }

  CATCH_SECTION("throwing-callback") {
    session.call_with_callback("boom", [](std::optional<Value>) {
      throw std::runtime_error{"callback failed"};
    });
    CATCH_REQUIRE_THROWS_AS(script.respond(0, Value{}, Value{1}), std::runtime_error);
    CATCH_REQUIRE(session.loop()->is_stop_requested()); // stopped before delivery
    CATCH_REQUIRE(session.pending_count() == 0);
  }

  CATCH_SECTION("blocking-call-inside-the-loop") {
    bool threw = false;
    session.loop()->post([&]() {
      try {
        session.call("add", 1, 2);
      } catch (std::logic_error&) {
        threw = true;
      }
      session.loop()->stop();
    });
    session.loop()->start();
    CATCH_REQUIRE(threw);
    CATCH_REQUIRE(script.sent.empty());
  }
}

CATCH_TEST_CASE("Session configuration", "[session]") {
  Script script;

  CATCH_SECTION("no-transport-builder") {
    try {
      Session session{Session::Config{}};
      CATCH_REQUIRE(false); // should have thrown
    } catch (RpcError& e) {
      CATCH_REQUIRE(e.code() == make_error_code(ecode::no_transport));
    }
  }

  CATCH_SECTION("negative-timeout") {
    try {
      Session session{make_config(script, std::chrono::seconds{-1})};
      CATCH_REQUIRE(false); // should have thrown
    } catch (RpcError& e) {
      CATCH_REQUIRE(e.code() == make_error_code(ecode::argument_error));
    }
  }

  CATCH_SECTION("builder-returns-null") {
    Session::Config config;
    config.transport_builder = [](TransportHandler&, const TransportOptions&) {
      return std::unique_ptr<Transport>{};
    };
    CATCH_REQUIRE_THROWS_AS(Session{std::move(config)}, RpcError);
  }

  CATCH_SECTION("shared-loop-and-encodings") {
    auto loop = std::make_shared<async::EventLoop>();
    auto config = make_config(script, std::chrono::seconds{3});
    config.loop = loop;
    config.reconnect_limit = 2;
    config.pack_encoding = "latin-1";
    config.unpack_encoding = "utf-8";
    Session session{std::move(config)};
    CATCH_REQUIRE(session.loop() == loop);
    CATCH_REQUIRE(script.options.loop == loop);
    CATCH_REQUIRE(script.options.reconnect_limit == 2);
    CATCH_REQUIRE(script.options.pack_encoding == "latin-1");
    CATCH_REQUIRE(script.options.unpack_encoding == "utf-8");
  }

  CATCH_SECTION("zero-timeout-means-no-deadline") {
    Session session{make_config(script, std::chrono::seconds{0})};
    auto future = session.call_async("forever");
    CATCH_REQUIRE(future.deadline() == ticktock_type::max());
    session.step_timeout(tick() + std::chrono::hours{24 * 365});
    CATCH_REQUIRE(!future.is_ready());
    CATCH_REQUIRE(session.pending_count() == 1);
  }

  CATCH_SECTION("external-loop-notify-does-not-block") {
    auto config = make_config(script, std::chrono::seconds{1});
    config.external_loop = true;
    Session session{std::move(config)};
    session.notify("log", "x");
    CATCH_REQUIRE(script.sent.size() == 1);
    CATCH_REQUIRE(!session.loop()->is_stop_requested());
  }

  CATCH_SECTION("external-loop-call") {
    auto config = make_config(script, std::chrono::seconds{1});
    config.external_loop = true;
    Session session{std::move(config)};
    script.on_request = [&](const RequestEnvelope& request) {
      const auto sum = *request.args.at(0).as_int() + *request.args.at(1).as_int();
      script.post_response(request.msgid, Value{}, Value{sum});
    };
    CATCH_REQUIRE(session.call("add", 2, 3) == Value{5});
    CATCH_REQUIRE(session.pending_count() == 0);
    CATCH_REQUIRE(!session.loop()->is_running());

    auto future = session.call_async("add", 4, 5);
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
    CATCH_REQUIRE(future.get() == Value{9});
  }
}

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("Session over an in-process service", "[session]") {
  auto service = InProcessService::make();
  service->add_method("add", [](const Array& args) {
    return Value{*args.at(0).as_int() + *args.at(1).as_int()};
  });
  service->add_deferred_method("slow", [](const Array&, InProcessService::Responder) {});

  Session::Config config;
  config.timeout = std::chrono::seconds{1};
  config.transport_builder = service->builder();
  Session session{std::move(config)};

  CATCH_SECTION("call") {
    CATCH_REQUIRE(session.call("add", 2, 3) == Value{5});
    CATCH_REQUIRE(session.pending_count() == 0);
  }

  CATCH_SECTION("call-times-out") {
    const auto start = tick();
    CATCH_REQUIRE_THROWS_AS(session.call("slow"), TimeoutError);
    CATCH_REQUIRE(tock(start) >= 1.0);
    CATCH_REQUIRE(session.pending_count() == 0);

    // The session is still usable
    CATCH_REQUIRE(session.call("add", 1, 1) == Value{2});
  }

  CATCH_SECTION("external-loop-call") {
    Session::Config external;
    external.timeout = std::chrono::seconds{1};
    external.transport_builder = service->builder();
    external.loop = session.loop();
    external.external_loop = true;
    Session hosted{std::move(external)};
    CATCH_REQUIRE(hosted.call("add", 2, 3) == Value{5});
    CATCH_REQUIRE_THROWS_AS(hosted.call("slow"), TimeoutError);
  }

  CATCH_SECTION("concurrent-calls") {
    auto f0 = session.call_async("add", 1, 2);
    auto f1 = session.call_async("add", 3, 4);
    CATCH_REQUIRE(f1.get() == Value{7});
    CATCH_REQUIRE(f0.get() == Value{3});
  }
}

} // namespace msgrpc::net::test
