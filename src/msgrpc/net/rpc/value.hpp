#pragma once

#include "msgrpc/utils/base-include.hpp"
#include "msgrpc/utils/error-codes.hpp"

#include <fmt/format.h>
#include <msgpack.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace msgrpc::net {

class Value;

using Array = std::vector<Value>;
using Map = std::vector<std::pair<Value, Value>>; //!< keys may be any value; order is preserved
using Binary = std::vector<std::byte>;

enum class ValueType : int8_t {
  NIL,
  BOOLEAN,
  INTEGER,  //!< negative integers
  UNSIGNED, //!< non-negative integers
  FLOAT,
  STRING,
  BINARY,
  ARRAY,
  MAP,
  EXTENSION
};

constexpr std::string_view str(ValueType type) {
#define CASE(x)                                                                                    \
  case ValueType::x:                                                                               \
    return #x
  switch (type) {
    CASE(NIL);
    CASE(BOOLEAN);
    CASE(INTEGER);
    CASE(UNSIGNED);
    CASE(FLOAT);
    CASE(STRING);
    CASE(BINARY);
    CASE(ARRAY);
    CASE(MAP);
    CASE(EXTENSION);
  }
#undef CASE
  return "<unknown case>";
}

// ------------------------------------------------------------------------------------------- Value

/**
 * @brief A dynamically typed value, as carried by the arguments, results and errors of
 *        RPC messages.
 *
 * A `msgpack::object` together with the zone that owns its strings and elements. Values
 * are immutable, so copies share the zone, and so do the elements returned by
 * `as_array` and `as_map`.
 *
 * MessagePack stores every non-negative integer as UNSIGNED, whatever the C++ type it
 * was built from. Only negative integers are INTEGER.
 */
class Value {
private:
  std::shared_ptr<msgpack::zone> zone_{}; //!< nullptr for scalars
  msgpack::object object_{};

  Value(std::shared_ptr<msgpack::zone> zone, const msgpack::object& object)
      : zone_{std::move(zone)}, object_{object} {}

  void assign_raw_(msgpack::type::object_type type, const char* data, std::size_t size);

public:
  Value() noexcept = default;
  Value(std::nullptr_t) noexcept {}
  Value(bool x) : object_{x} {}
  template <typename T>
    requires(std::integral<T> && !std::same_as<T, bool>)
  Value(T x) {
    if constexpr (std::is_signed_v<T>)
      object_ = msgpack::object{int64_t(x)};
    else
      object_ = msgpack::object{uint64_t(x)};
  }
  Value(double x) : object_{x} {}
  Value(const char* x) : Value{std::string_view{x}} {}
  Value(std::string_view x);
  Value(const std::string& x) : Value{std::string_view{x}} {}
  Value(const Binary& x);
  Value(const Array& x);
  Value(const Map& x);

  /** @brief Deep copy of `object`, which may live in a zone that is about to be freed */
  explicit Value(const msgpack::object& object);

  /** @brief Takes over the zone of an unpacked message */
  explicit Value(msgpack::object_handle handle);

  ValueType type() const noexcept;

  bool is_nil() const noexcept { return object_.type == msgpack::type::NIL; }
  bool is_bool() const noexcept { return type() == ValueType::BOOLEAN; }
  bool is_integer() const noexcept {
    return type() == ValueType::INTEGER || type() == ValueType::UNSIGNED;
  }
  bool is_float() const noexcept { return type() == ValueType::FLOAT; }
  bool is_string() const noexcept { return type() == ValueType::STRING; }
  bool is_binary() const noexcept { return type() == ValueType::BINARY; }
  bool is_array() const noexcept { return type() == ValueType::ARRAY; }
  bool is_map() const noexcept { return type() == ValueType::MAP; }

  /// @{ Checked accessors; `ecode::type_error` on mismatch, or if a number doesn't fit
  expected<bool, error_code> as_bool() const;
  expected<int64_t, error_code> as_int() const;
  expected<uint64_t, error_code> as_uint() const;
  expected<double, error_code> as_double() const;
  expected<std::string_view, error_code> as_string() const; //!< valid while this Value lives
  expected<Binary, error_code> as_binary() const;
  expected<Array, error_code> as_array() const;
  expected<Map, error_code> as_map() const;
  /// @}

  /** @brief The underlying object, for use with msgpack-c adaptors */
  const msgpack::object& object() const noexcept { return object_; }

  /** @brief Number of elements of an array or map; 0 for scalars */
  std::size_t size() const noexcept;

  /** @brief Look up a map entry by string key */
  std::optional<Value> find(std::string_view key) const;

  friend bool operator==(const Value& a, const Value& b) noexcept { return a.object_ == b.object_; }
};

/** @brief Render `value` for humans (logs, test failures). Not a wire format. */
std::string to_string(const Value& value);

/** @brief Encode `value` as MessagePack */
msgpack::sbuffer pack(const Value& value);

/**
 * @brief Decode the single MessagePack value that spans all of `bytes`.
 * @return `ecode::invalid_data` if `bytes` is truncated, malformed, or has trailing data.
 */
expected<Value, error_code> unpack(std::string_view bytes);

/**
 * @brief Pack C++ arguments into an argument array.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto args = make_array("add", 2, 3); // ["add", 2, 3]
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
template <typename... Args> Array make_array(Args&&... args) {
  Array array;
  array.reserve(sizeof...(Args));
  (array.emplace_back(std::forward<Args>(args)), ...);
  return array;
}

} // namespace msgrpc::net

template <> struct fmt::formatter<msgrpc::net::Value> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const msgrpc::net::Value& value, FormatContext& ctx) const {
    const auto s = msgrpc::net::to_string(value);
    return fmt::formatter<std::string_view>::format(std::string_view{s}, ctx);
  }
};
