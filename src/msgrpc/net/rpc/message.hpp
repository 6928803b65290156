#pragma once

#include "value.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace msgrpc::net {

/**
 * @brief Identifies an outstanding request, so that its response can be matched to it.
 */
using MessageId = uint32_t;

/**
 * @brief The first element of every wire message
 */
enum class MessageType : int8_t {
  REQUEST = 0,  //!< [REQUEST, msgid, method, args]
  RESPONSE = 1, //!< [RESPONSE, msgid, error, result]
  NOTIFY = 2    //!< [NOTIFY, method, args]
};

constexpr std::string_view str(MessageType type) {
  switch (type) {
  case MessageType::REQUEST: return "REQUEST";
  case MessageType::RESPONSE: return "RESPONSE";
  case MessageType::NOTIFY: return "NOTIFY";
  }
  return "<unknown case>";
}

struct RequestEnvelope {
  MessageId msgid{0};  //!< So the client can track responses
  std::string method{}; //!< The procedure to invoke
  Array args{};         //!< Positional arguments
};

struct NotifyEnvelope {
  std::string method{}; //!< The procedure to invoke; no response is expected
  Array args{};         //!< Positional arguments
};

struct ResponseEnvelope {
  MessageId msgid{0}; //!< The id of the request being answered
  Value error{};      //!< nil iff the call succeeded
  Value result{};     //!< The return value; meaningless if `error` is set
};

///@{ Build the array-encoded, position-significant wire messages
Value make_request(MessageId msgid, std::string_view method, Array args);
Value make_notify(std::string_view method, Array args);
Value make_response(MessageId msgid, Value error, Value result);
///@}

/**
 * @brief The type tag of a wire message.
 * @return `ecode::invalid_data` if `message` is not an array starting with a known tag.
 */
expected<MessageType, error_code> message_type(const Value& message);

///@{ Validate arity, tag and field types; `ecode::invalid_data` on any mismatch
expected<RequestEnvelope, error_code> decode_request(const Value& message);
expected<NotifyEnvelope, error_code> decode_notify(const Value& message);
expected<ResponseEnvelope, error_code> decode_response(const Value& message);
///@}

} // namespace msgrpc::net
