#include "message.hpp"

#include <limits>
#include <optional>

namespace msgrpc::net {

/// @private
static auto invalid_data() { return make_unexpected(make_error_code(ecode::invalid_data)); }

/// @private
static std::optional<Array> as_message(const Value& message, MessageType type,
                                       std::size_t arity) {
  if (message.size() != arity)
    return std::nullopt;
  const auto tag = message_type(message);
  if (!tag || *tag != type)
    return std::nullopt;
  auto array = message.as_array();
  if (!array)
    return std::nullopt;
  return std::move(*array);
}

/// @private
static bool decode_msgid(const Value& value, MessageId& msgid) {
  const auto x = value.as_uint();
  if (!x || *x > std::numeric_limits<MessageId>::max())
    return false;
  msgid = MessageId(*x);
  return true;
}

// ---------------------------------------------------------------------------------------- Encoders

Value make_request(MessageId msgid, std::string_view method, Array args) {
  return Value{make_array(int8_t(MessageType::REQUEST), msgid, method, std::move(args))};
}

Value make_notify(std::string_view method, Array args) {
  return Value{make_array(int8_t(MessageType::NOTIFY), method, std::move(args))};
}

Value make_response(MessageId msgid, Value error, Value result) {
  return Value{
      make_array(int8_t(MessageType::RESPONSE), msgid, std::move(error), std::move(result))};
}

// ---------------------------------------------------------------------------------------- Decoders

expected<MessageType, error_code> message_type(const Value& message) {
  if (!message.is_array() || message.size() == 0)
    return invalid_data();
  const auto tag = message.as_array()->front().as_int();
  if (!tag)
    return invalid_data();
  switch (*tag) {
  case int64_t(MessageType::REQUEST): return MessageType::REQUEST;
  case int64_t(MessageType::RESPONSE): return MessageType::RESPONSE;
  case int64_t(MessageType::NOTIFY): return MessageType::NOTIFY;
  }
  return invalid_data();
}

expected<RequestEnvelope, error_code> decode_request(const Value& message) {
  const auto array = as_message(message, MessageType::REQUEST, 4);
  if (!array)
    return invalid_data();

  RequestEnvelope envelope;
  const auto method = (*array)[2].as_string();
  auto args = (*array)[3].as_array();
  if (!decode_msgid((*array)[1], envelope.msgid) || // If any field
      !method ||                                     // has the wrong
      !args)                                         // type, then
    return invalid_data();                           // it's corrupt

  envelope.method = std::string{*method};
  envelope.args = std::move(*args);
  return envelope;
}

expected<NotifyEnvelope, error_code> decode_notify(const Value& message) {
  const auto array = as_message(message, MessageType::NOTIFY, 3);
  if (!array)
    return invalid_data();

  const auto method = (*array)[1].as_string();
  auto args = (*array)[2].as_array();
  if (!method || !args)
    return invalid_data();

  return NotifyEnvelope{std::string{*method}, std::move(*args)};
}

expected<ResponseEnvelope, error_code> decode_response(const Value& message) {
  const auto array = as_message(message, MessageType::RESPONSE, 4);
  if (!array)
    return invalid_data();

  ResponseEnvelope envelope;
  if (!decode_msgid((*array)[1], envelope.msgid))
    return invalid_data();
  envelope.error = (*array)[2];
  envelope.result = (*array)[3];
  return envelope;
}

} // namespace msgrpc::net
