#include "msgrpc/net/rpc/message.hpp"

#include <catch2/catch.hpp>

namespace msgrpc::net::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("Message", "[message]") {
  CATCH_SECTION("request") {
    const auto message = make_request(7, "add", make_array(2, 3));
    CATCH_REQUIRE(message == Value{make_array(0, 7, "add", make_array(2, 3))});
    CATCH_REQUIRE(message_type(message).value() == MessageType::REQUEST);

    const auto request = decode_request(message);
    CATCH_REQUIRE(request.has_value());
    CATCH_REQUIRE(request->msgid == 7);
    CATCH_REQUIRE(request->method == "add");
    CATCH_REQUIRE(Value{request->args} == Value{make_array(2, 3)});
  }

  CATCH_SECTION("notify") {
    const auto message = make_notify("log", make_array("hello"));
    CATCH_REQUIRE(message == Value{make_array(2, "log", make_array("hello"))});
    CATCH_REQUIRE(message_type(message).value() == MessageType::NOTIFY);

    const auto notify = decode_notify(message);
    CATCH_REQUIRE(notify.has_value());
    CATCH_REQUIRE(notify->method == "log");
    CATCH_REQUIRE(notify->args.size() == 1);
  }

  CATCH_SECTION("response") {
    const auto message = make_response(9, Value{}, Value{5});
    CATCH_REQUIRE(message == Value{make_array(1, 9, Value{}, 5)});

    const auto response = decode_response(message);
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->msgid == 9);
    CATCH_REQUIRE(response->error.is_nil());
    CATCH_REQUIRE(response->result == Value{5});
  }

  CATCH_SECTION("invalid-data") {
    const auto invalid = make_error_code(ecode::invalid_data);

    CATCH_REQUIRE(message_type(Value{3}).error() == invalid);
    CATCH_REQUIRE(message_type(Value{make_array()}).error() == invalid);
    CATCH_REQUIRE(message_type(Value{make_array(5, 1)}).error() == invalid);

    // Wrong tag
    CATCH_REQUIRE(decode_request(make_notify("m", {})).error() == invalid);
    CATCH_REQUIRE(decode_notify(make_request(1, "m", {})).error() == invalid);
    CATCH_REQUIRE(decode_response(make_request(1, "m", {})).error() == invalid);

    // Wrong arity
    CATCH_REQUIRE(!decode_request(Value{make_array(0, 1, "m")}));
    CATCH_REQUIRE(!decode_response(Value{make_array(1, 1, Value{})}));

    // Wrong field types
    CATCH_REQUIRE(!decode_request(Value{make_array(0, -1, "m", make_array())}));
    CATCH_REQUIRE(!decode_request(Value{make_array(0, 1, 2, make_array())}));
    CATCH_REQUIRE(!decode_request(Value{make_array(0, 1, "m", "args")}));
    CATCH_REQUIRE(!decode_notify(Value{make_array(2, "m", 3)}));
    CATCH_REQUIRE(!decode_response(Value{make_array(1, "id", Value{}, 5)}));
    CATCH_REQUIRE(!decode_response(Value{make_array(1, uint64_t(1) << 40, Value{}, 5)}));
  }
}

} // namespace msgrpc::net::test
