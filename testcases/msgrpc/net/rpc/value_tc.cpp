#include "msgrpc/net/rpc/value.hpp"

#include <catch2/catch.hpp>

namespace msgrpc::net::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("Value", "[value]") {
  CATCH_SECTION("types") {
    CATCH_REQUIRE(Value{}.is_nil());
    CATCH_REQUIRE(Value{nullptr}.is_nil());
    CATCH_REQUIRE(Value{true}.type() == ValueType::BOOLEAN);
    CATCH_REQUIRE(Value{-3}.type() == ValueType::INTEGER);
    CATCH_REQUIRE(Value{3u}.type() == ValueType::UNSIGNED);
    CATCH_REQUIRE(Value{3}.type() == ValueType::UNSIGNED); // msgpack normalises the sign
    CATCH_REQUIRE(Value{1.5}.type() == ValueType::FLOAT);
    CATCH_REQUIRE(Value{"text"}.type() == ValueType::STRING);
    CATCH_REQUIRE(Value{Binary{std::byte{1}}}.type() == ValueType::BINARY);
    CATCH_REQUIRE(Value{make_array(1, 2)}.type() == ValueType::ARRAY);
    CATCH_REQUIRE(Value{Map{{"k", 1}}}.type() == ValueType::MAP);
    CATCH_REQUIRE(str(ValueType::UNSIGNED) == "UNSIGNED");
    CATCH_REQUIRE(Value{1.5}.object().type == msgpack::type::FLOAT64);
  }

  CATCH_SECTION("accessors") {
    CATCH_REQUIRE(Value{5}.as_int().value() == 5);
    CATCH_REQUIRE(Value{5u}.as_int().value() == 5);
    CATCH_REQUIRE(Value{5}.as_uint().value() == 5u);
    CATCH_REQUIRE(Value{5}.as_double().value() == 5.0);
    CATCH_REQUIRE(Value{"abc"}.as_string().value() == "abc");
    CATCH_REQUIRE(Value{false}.as_bool().value() == false);

    CATCH_REQUIRE(!Value{-1}.as_uint());
    CATCH_REQUIRE(!Value{std::numeric_limits<uint64_t>::max()}.as_int());
    CATCH_REQUIRE(Value{"abc"}.as_int().error() == make_error_code(ecode::type_error));
    CATCH_REQUIRE(!Value{}.as_string());
    CATCH_REQUIRE(!Value{1}.as_bool());

    const Binary bytes{std::byte{1}, std::byte{2}};
    CATCH_REQUIRE(Value{bytes}.as_binary().value() == bytes);
    CATCH_REQUIRE(!Value{"12"}.as_binary());
    CATCH_REQUIRE(!Value{1}.as_array());
    CATCH_REQUIRE(!Value{make_array()}.as_map());
  }

  CATCH_SECTION("containers") {
    const Value array{make_array(1, "two", 3.0)};
    CATCH_REQUIRE(array.size() == 3);
    CATCH_REQUIRE(array.as_array()->at(1) == Value{"two"});
    CATCH_REQUIRE(Value{1}.size() == 0);

    const Value map{Map{{"a", 1}, {"b", make_array()}}};
    CATCH_REQUIRE(map.size() == 2);
    CATCH_REQUIRE(map.find("a").has_value());
    CATCH_REQUIRE(*map.find("a") == Value{1});
    CATCH_REQUIRE(!map.find("z").has_value());
    CATCH_REQUIRE(!array.find("a").has_value());

    const auto entries = map.as_map().value();
    CATCH_REQUIRE(entries.size() == 2);
    CATCH_REQUIRE(entries[1].first == Value{"b"});
    CATCH_REQUIRE(entries[1].second == Value{make_array()});
  }

  CATCH_SECTION("elements-outlive-their-container") {
    Array elements;
    {
      const Value nested{make_array("outer", make_array("inner", 7))};
      elements = nested.as_array().value();
    }
    CATCH_REQUIRE(elements[0].as_string().value() == "outer");
    CATCH_REQUIRE(elements[1] == Value{make_array("inner", 7)});
  }

  CATCH_SECTION("equality") {
    CATCH_REQUIRE(Value{5} == Value{5u});
    CATCH_REQUIRE(Value{5} != Value{6});
    CATCH_REQUIRE(Value{-1} != Value{std::numeric_limits<uint64_t>::max()});
    CATCH_REQUIRE(Value{5} != Value{5.0});
    CATCH_REQUIRE(Value{"5"} != Value{5});
    CATCH_REQUIRE(Value{make_array(1, make_array(2u))} == Value{make_array(1u, make_array(2))});
    CATCH_REQUIRE(Value{} == Value{nullptr});
    CATCH_REQUIRE(Value{Map{{"a", 1}, {"b", 2}}} != Value{Map{{"b", 2}, {"a", 1}}});
  }

  CATCH_SECTION("to-string") {
    CATCH_REQUIRE(to_string(Value{}) == "nil");
    CATCH_REQUIRE(to_string(Value{true}) == "true");
    CATCH_REQUIRE(to_string(Value{-7}) == "-7");
    CATCH_REQUIRE(to_string(Value{"a\"b"}) == "\"a\\\"b\"");
    CATCH_REQUIRE(to_string(Value{Binary(4)}) == "<binary 4 bytes>");
    CATCH_REQUIRE(to_string(Value{make_array(1, "x", Value{})}) == "[1, \"x\", nil]");
    CATCH_REQUIRE(to_string(Value{Map{{"k", make_array()}}}) == "{\"k\": []}");
    CATCH_REQUIRE(fmt::format("{}", Value{make_array(2, 3)}) == "[2, 3]");
  }
}

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("Value_msgpack", "[value]") {
  CATCH_SECTION("pack-unpack") {
    const Value message{make_array(0, 17u, "add", make_array(-1, 2.5, Value{}, Map{{"k", true}}))};
    const auto buffer = pack(message);
    const auto unpacked = unpack({buffer.data(), buffer.size()});
    CATCH_REQUIRE(unpacked.has_value());
    CATCH_REQUIRE(*unpacked == message);
    CATCH_REQUIRE(to_string(*unpacked) == to_string(message));
  }

  CATCH_SECTION("packs-like-msgpack-c") {
    msgpack::sbuffer expected_buffer;
    msgpack::packer<msgpack::sbuffer> packer{expected_buffer};
    packer.pack_array(3);
    packer.pack(2);
    packer.pack(std::string{"log"});
    packer.pack_array(1);
    packer.pack(std::string{"hello"});

    const auto buffer = pack(Value{make_array(2, "log", make_array("hello"))});
    CATCH_REQUIRE(std::string_view(buffer.data(), buffer.size()) ==
                  std::string_view(expected_buffer.data(), expected_buffer.size()));
  }

  CATCH_SECTION("unpack-rejects-bad-input") {
    const auto buffer = pack(Value{make_array(1, 2, 3)});
    const std::string bytes{buffer.data(), buffer.size()};
    const auto invalid_data = make_error_code(ecode::invalid_data);
    CATCH_REQUIRE(unpack(std::string_view{bytes}.substr(0, bytes.size() - 1)).error() ==
                  invalid_data);
    CATCH_REQUIRE(unpack(bytes + bytes).error() == invalid_data);
    CATCH_REQUIRE(unpack("").error() == invalid_data);
  }

  CATCH_SECTION("copy-from-object") {
    Value copy;
    {
      msgpack::zone zone;
      const msgpack::object object{std::string{"zone-owned"}, zone};
      copy = Value{object};
    }
    CATCH_REQUIRE(copy.as_string().value() == "zone-owned");
  }
}

} // namespace msgrpc::net::test
