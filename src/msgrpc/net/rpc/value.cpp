#include "value.hpp"

#include <fmt/format.h>

#include <cstring>
#include <limits>
#include <new>
#include <stdexcept>

namespace msgrpc::net {

/// @private
static auto type_error() { return make_unexpected(make_error_code(ecode::type_error)); }

/// @private
template <typename T> static T* allocate_in(msgpack::zone& zone, std::size_t count) {
  return static_cast<T*>(zone.allocate_align(sizeof(T) * count, alignof(T)));
}

// ------------------------------------------------------------------------------------ construction

void Value::assign_raw_(msgpack::type::object_type type, const char* data, std::size_t size) {
  if (size > std::numeric_limits<uint32_t>::max())
    throw std::length_error{"value too large for MessagePack"};
  zone_ = std::make_shared<msgpack::zone>();
  char* ptr = nullptr;
  if (size > 0) {
    ptr = static_cast<char*>(zone_->allocate_no_align(size));
    std::memcpy(ptr, data, size);
  }
  object_.type = type;
  if (type == msgpack::type::STR) {
    object_.via.str.size = uint32_t(size);
    object_.via.str.ptr = ptr;
  } else {
    object_.via.bin.size = uint32_t(size);
    object_.via.bin.ptr = ptr;
  }
}

Value::Value(std::string_view x) { assign_raw_(msgpack::type::STR, x.data(), x.size()); }

Value::Value(const Binary& x) {
  assign_raw_(msgpack::type::BIN, reinterpret_cast<const char*>(x.data()), x.size());
}

Value::Value(const Array& x) : zone_{std::make_shared<msgpack::zone>()} {
  if (x.size() > std::numeric_limits<uint32_t>::max())
    throw std::length_error{"array too large for MessagePack"};
  object_.type = msgpack::type::ARRAY;
  object_.via.array.size = uint32_t(x.size());
  object_.via.array.ptr = nullptr;
  if (x.empty())
    return;

  auto* elements = allocate_in<msgpack::object>(*zone_, x.size());
  for (std::size_t i = 0; i < x.size(); ++i)
    new (&elements[i]) msgpack::object(x[i].object_, *zone_);
  object_.via.array.ptr = elements;
}

Value::Value(const Map& x) : zone_{std::make_shared<msgpack::zone>()} {
  if (x.size() > std::numeric_limits<uint32_t>::max())
    throw std::length_error{"map too large for MessagePack"};
  object_.type = msgpack::type::MAP;
  object_.via.map.size = uint32_t(x.size());
  object_.via.map.ptr = nullptr;
  if (x.empty())
    return;

  auto* entries = allocate_in<msgpack::object_kv>(*zone_, x.size());
  for (std::size_t i = 0; i < x.size(); ++i) {
    new (&entries[i].key) msgpack::object(x[i].first.object_, *zone_);
    new (&entries[i].val) msgpack::object(x[i].second.object_, *zone_);
  }
  object_.via.map.ptr = entries;
}

Value::Value(const msgpack::object& object) : zone_{std::make_shared<msgpack::zone>()} {
  object_ = msgpack::object(object, *zone_);
}

Value::Value(msgpack::object_handle handle)
    : zone_{std::move(handle.zone())}, object_{handle.get()} {}

// --------------------------------------------------------------------------------------- accessors

ValueType Value::type() const noexcept {
  switch (object_.type) {
  case msgpack::type::NIL: return ValueType::NIL;
  case msgpack::type::BOOLEAN: return ValueType::BOOLEAN;
  case msgpack::type::POSITIVE_INTEGER: return ValueType::UNSIGNED;
  case msgpack::type::NEGATIVE_INTEGER: return ValueType::INTEGER;
  case msgpack::type::FLOAT32:
  case msgpack::type::FLOAT64: return ValueType::FLOAT;
  case msgpack::type::STR: return ValueType::STRING;
  case msgpack::type::BIN: return ValueType::BINARY;
  case msgpack::type::ARRAY: return ValueType::ARRAY;
  case msgpack::type::MAP: return ValueType::MAP;
  case msgpack::type::EXT: return ValueType::EXTENSION;
  }
  return ValueType::NIL;
}

expected<bool, error_code> Value::as_bool() const {
  if (object_.type == msgpack::type::BOOLEAN)
    return object_.via.boolean;
  return type_error();
}

expected<int64_t, error_code> Value::as_int() const {
  switch (object_.type) {
  case msgpack::type::NEGATIVE_INTEGER: return object_.via.i64;
  case msgpack::type::POSITIVE_INTEGER:
    if (object_.via.u64 > uint64_t(std::numeric_limits<int64_t>::max()))
      return type_error();
    return int64_t(object_.via.u64);
  default: return type_error();
  }
}

expected<uint64_t, error_code> Value::as_uint() const {
  if (object_.type == msgpack::type::POSITIVE_INTEGER)
    return object_.via.u64;
  return type_error();
}

expected<double, error_code> Value::as_double() const {
  switch (object_.type) {
  case msgpack::type::FLOAT32:
  case msgpack::type::FLOAT64: return object_.via.f64;
  case msgpack::type::NEGATIVE_INTEGER: return double(object_.via.i64);
  case msgpack::type::POSITIVE_INTEGER: return double(object_.via.u64);
  default: return type_error();
  }
}

expected<std::string_view, error_code> Value::as_string() const {
  if (object_.type == msgpack::type::STR)
    return std::string_view{object_.via.str.ptr, object_.via.str.size};
  return type_error();
}

expected<Binary, error_code> Value::as_binary() const {
  if (object_.type != msgpack::type::BIN)
    return type_error();
  const auto* data = reinterpret_cast<const std::byte*>(object_.via.bin.ptr);
  return Binary(data, data + object_.via.bin.size);
}

expected<Array, error_code> Value::as_array() const {
  if (object_.type != msgpack::type::ARRAY)
    return type_error();
  Array array;
  array.reserve(object_.via.array.size);
  for (uint32_t i = 0; i < object_.via.array.size; ++i)
    array.push_back(Value{zone_, object_.via.array.ptr[i]});
  return array;
}

expected<Map, error_code> Value::as_map() const {
  if (object_.type != msgpack::type::MAP)
    return type_error();
  Map map;
  map.reserve(object_.via.map.size);
  for (uint32_t i = 0; i < object_.via.map.size; ++i) {
    const auto& kv = object_.via.map.ptr[i];
    map.emplace_back(Value{zone_, kv.key}, Value{zone_, kv.val});
  }
  return map;
}

std::size_t Value::size() const noexcept {
  switch (object_.type) {
  case msgpack::type::ARRAY: return object_.via.array.size;
  case msgpack::type::MAP: return object_.via.map.size;
  default: return 0;
  }
}

std::optional<Value> Value::find(std::string_view key) const {
  if (object_.type != msgpack::type::MAP)
    return std::nullopt;
  for (uint32_t i = 0; i < object_.via.map.size; ++i) {
    const auto& kv = object_.via.map.ptr[i];
    if (kv.key.type == msgpack::type::STR &&
        std::string_view{kv.key.via.str.ptr, kv.key.via.str.size} == key)
      return Value{zone_, kv.val};
  }
  return std::nullopt;
}

// --------------------------------------------------------------------------------------- to_string

/// @private
static void append_quoted(std::string& out, std::string_view s) {
  out += '"';
  for (const char c : s) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\t': out += "\\t"; break;
    default: out += c;
    }
  }
  out += '"';
}

/// @private
static void append_object(std::string& out, const msgpack::object& o) {
  switch (o.type) {
  case msgpack::type::NIL: out += "nil"; return;
  case msgpack::type::BOOLEAN: out += (o.via.boolean ? "true" : "false"); return;
  case msgpack::type::POSITIVE_INTEGER: out += fmt::format("{}", o.via.u64); return;
  case msgpack::type::NEGATIVE_INTEGER: out += fmt::format("{}", o.via.i64); return;
  case msgpack::type::FLOAT32:
  case msgpack::type::FLOAT64: out += fmt::format("{}", o.via.f64); return;
  case msgpack::type::STR: append_quoted(out, {o.via.str.ptr, o.via.str.size}); return;
  case msgpack::type::BIN: out += fmt::format("<binary {} bytes>", o.via.bin.size); return;
  case msgpack::type::EXT:
    out += fmt::format("<ext {} {} bytes>", int(o.via.ext.type()), o.via.ext.size);
    return;
  case msgpack::type::ARRAY:
    out += '[';
    for (uint32_t i = 0; i < o.via.array.size; ++i) {
      if (i > 0)
        out += ", ";
      append_object(out, o.via.array.ptr[i]);
    }
    out += ']';
    return;
  case msgpack::type::MAP:
    out += '{';
    for (uint32_t i = 0; i < o.via.map.size; ++i) {
      if (i > 0)
        out += ", ";
      append_object(out, o.via.map.ptr[i].key);
      out += ": ";
      append_object(out, o.via.map.ptr[i].val);
    }
    out += '}';
    return;
  }
}

std::string to_string(const Value& value) {
  std::string out;
  append_object(out, value.object());
  return out;
}

// ------------------------------------------------------------------------------------ pack/unpack

msgpack::sbuffer pack(const Value& value) {
  msgpack::sbuffer buffer;
  msgpack::pack(buffer, value.object());
  return buffer;
}

expected<Value, error_code> unpack(std::string_view bytes) {
  const auto invalid_data = make_unexpected(make_error_code(ecode::invalid_data));
  try {
    std::size_t offset = 0;
    auto handle = msgpack::unpack(bytes.data(), bytes.size(), offset);
    if (offset != bytes.size())
      return invalid_data;
    return Value{std::move(handle)};
  } catch (const msgpack::unpack_error& e) {
    LOG_DEBUG("failed to unpack {} byte(s): {}", bytes.size(), e.what());
    return invalid_data;
  }
}

} // namespace msgrpc::net
