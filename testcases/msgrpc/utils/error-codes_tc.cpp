#include "msgrpc/utils.hpp"

#include <catch2/catch.hpp>

namespace msgrpc::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("ErrorCodes", "[error-codes]") {
  CATCH_SECTION("category") {
    const error_code ec = ecode::timed_out; // implicit, via is_error_code_enum
    CATCH_REQUIRE(ec.category() == ecode_category());
    CATCH_REQUIRE(std::string{ec.category().name()} == "msgrpc");
    CATCH_REQUIRE(ec.message() == "request timed out");
    CATCH_REQUIRE(ec == make_error_code(ecode::timed_out));
    CATCH_REQUIRE(ec != make_error_code(ecode::connection_failed));
    CATCH_REQUIRE(!make_error_code(ecode::okay));
  }
}

CATCH_TEST_CASE("LogLevel", "[logging]") {
  using namespace msgrpc::logging;

  CATCH_SECTION("parse") {
    CATCH_REQUIRE(parse_log_level("trace").value() == LogLevel::TRACE);
    CATCH_REQUIRE(parse_log_level("debug").value() == LogLevel::DEBUG);
    CATCH_REQUIRE(parse_log_level("info").value() == LogLevel::INFO);
    CATCH_REQUIRE(parse_log_level("warning").value() == LogLevel::WARN);
    CATCH_REQUIRE(parse_log_level("error").value() == LogLevel::ERROR);
    CATCH_REQUIRE(parse_log_level("critical").value() == LogLevel::FATAL);
    CATCH_REQUIRE(parse_log_level("off").value() == LogLevel::OFF);

    const auto bad = parse_log_level("chatty");
    CATCH_REQUIRE(!bad);
    CATCH_REQUIRE(bad.error() == make_error_code(ecode::argument_error));
  }

  CATCH_SECTION("set-log-level") {
    const auto previous = log_level();
    set_log_level(LogLevel::ERROR);
    CATCH_REQUIRE(log_level() == LogLevel::ERROR);
    set_log_level(previous);
    CATCH_REQUIRE(log_level() == previous);
  }
}

} // namespace msgrpc::test
