#include "msgrpc/net/rpc/address.hpp"
#include "msgrpc/utils/error-codes.hpp"

#include <catch2/catch.hpp>

namespace msgrpc::net::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("Address", "[address]") {
  CATCH_SECTION("parse") {
    const auto a = Address::parse("localhost:18800");
    CATCH_REQUIRE(a.has_value());
    CATCH_REQUIRE(a->host == "localhost");
    CATCH_REQUIRE(a->port == 18800);

    const auto b = Address::parse("[::1]:18800");
    CATCH_REQUIRE(b.has_value());
    CATCH_REQUIRE(b->host == "::1");
    CATCH_REQUIRE(b->port == 18800);
  }

  CATCH_SECTION("parse-errors") {
    const auto argument_error = make_error_code(ecode::argument_error);
    CATCH_REQUIRE(Address::parse("localhost").error() == argument_error);
    CATCH_REQUIRE(Address::parse(":80").error() == argument_error);
    CATCH_REQUIRE(Address::parse("host:").error() == argument_error);
    CATCH_REQUIRE(Address::parse("host:http").error() == argument_error);
    CATCH_REQUIRE(Address::parse("host:65536").error() == argument_error);
    CATCH_REQUIRE(Address::parse("host:80x").error() == argument_error);
    CATCH_REQUIRE(Address::parse("::1:80").error() == argument_error);
    CATCH_REQUIRE(Address::parse("[::1]80").error() == argument_error);
  }

  CATCH_SECTION("to-string") {
    for (const auto text : {"127.0.0.1:18800", "[::1]:1", "example.com:0"}) {
      const auto address = Address::parse(text);
      CATCH_REQUIRE(address.has_value());
      CATCH_REQUIRE(address->to_string() == text);
    }
    CATCH_REQUIRE(fmt::format("{}", Address{"h", 2}) == "h:2");
  }
}

} // namespace msgrpc::net::test
