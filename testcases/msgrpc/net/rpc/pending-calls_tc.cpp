#include "msgrpc/net/rpc/pending-calls.hpp"
#include "msgrpc/net/rpc/rpc-error.hpp"

#include <catch2/catch.hpp>

namespace msgrpc::net::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("PendingCalls", "[pending-calls]") {
  auto loop = std::make_shared<async::EventLoop>();
  const auto now = tick();
  PendingCalls pending;

  auto awaiting = [&](ticktock_type deadline) { return PendingCalls::Awaiting{loop, deadline}; };
  auto callback = [](std::optional<Value>) {};

  CATCH_SECTION("insert-and-take") {
    pending.insert(0, awaiting(ticktock_type::max()));
    pending.insert(1, callback);
    CATCH_REQUIRE(pending.size() == 2);
    CATCH_REQUIRE(pending.awaiting_count() == 1);
    CATCH_REQUIRE(pending.callback_count() == 1);
    CATCH_REQUIRE(pending.contains(1));

    auto record = pending.take(1);
    CATCH_REQUIRE(record.has_value());
    CATCH_REQUIRE(std::holds_alternative<ResponseCallback>(*record));
    CATCH_REQUIRE(!pending.contains(1));
    CATCH_REQUIRE(!pending.take(1).has_value()); // at most once
    CATCH_REQUIRE(pending.size() == 1);
  }

  CATCH_SECTION("duplicate-id") {
    pending.insert(3, callback);
    CATCH_REQUIRE_THROWS_AS((pending.insert(3, callback)), RpcError);
    CATCH_REQUIRE(pending.size() == 1);
  }

  CATCH_SECTION("expired") {
    pending.insert(5, awaiting(now + std::chrono::seconds{1}));
    pending.insert(2, awaiting(now + std::chrono::seconds{1}));
    pending.insert(9, awaiting(now + std::chrono::seconds{9}));
    pending.insert(1, awaiting(ticktock_type::max()));
    pending.insert(4, callback);

    CATCH_REQUIRE(pending.expired(now).empty());
    CATCH_REQUIRE(pending.expired(now + std::chrono::seconds{2}) == std::vector<MessageId>{2, 5});
    CATCH_REQUIRE(pending.expired(now + std::chrono::hours{1}) == std::vector<MessageId>{2, 5, 9});
    CATCH_REQUIRE(pending.size() == 5); // `expired` does not remove anything
  }

  CATCH_SECTION("take-all-awaiting") {
    pending.insert(2, awaiting(ticktock_type::max()));
    pending.insert(7, callback);
    pending.insert(1, awaiting(ticktock_type::max()));

    const auto taken = pending.take_all_awaiting();
    CATCH_REQUIRE(taken.size() == 2);
    CATCH_REQUIRE(taken[0].first == 1);
    CATCH_REQUIRE(taken[1].first == 2);
    CATCH_REQUIRE(pending.size() == 1);
    CATCH_REQUIRE(pending.callback_count() == 1);

    pending.clear();
    CATCH_REQUIRE(pending.size() == 0);
  }
}

} // namespace msgrpc::net::test
