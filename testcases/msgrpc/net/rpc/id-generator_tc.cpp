#include "msgrpc/net/rpc/id-generator.hpp"

#include <catch2/catch.hpp>

#include <unordered_set>

namespace msgrpc::net::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("IdGenerator", "[id-generator]") {
  CATCH_SECTION("sequential-from-zero") {
    IdGenerator generator;
    CATCH_REQUIRE(generator.next() == 0);
    CATCH_REQUIRE(generator.next() == 1);
    CATCH_REQUIRE(generator.next() == 2);
    CATCH_REQUIRE(generator.peek() == 3);
  }

  CATCH_SECTION("wraps-after-max-id") {
    static_assert(IdGenerator::k_max_id == (1u << 30));
    IdGenerator generator{IdGenerator::k_max_id - 1};
    CATCH_REQUIRE(generator.next() == IdGenerator::k_max_id - 1);
    CATCH_REQUIRE(generator.next() == IdGenerator::k_max_id); // inclusive
    CATCH_REQUIRE(generator.next() == 0);
    CATCH_REQUIRE(generator.next() == 1);
  }

  CATCH_SECTION("out-of-range-start") {
    IdGenerator generator{IdGenerator::k_max_id + 1};
    CATCH_REQUIRE(generator.next() == 0);
  }

  CATCH_SECTION("distinct") {
    IdGenerator generator;
    std::unordered_set<MessageId> ids;
    for (auto i = 0; i < 10000; ++i)
      ids.insert(generator.next());
    CATCH_REQUIRE(ids.size() == 10000);
  }
}

} // namespace msgrpc::net::test
