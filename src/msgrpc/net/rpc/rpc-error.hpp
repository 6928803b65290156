#pragma once

#include "value.hpp"

#include "msgrpc/utils/error-codes.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace msgrpc::net {

/**
 * @brief Base class of every error that an RPC call can fail with.
 *
 * `code()` is in the `ecode_category()`. `message()` is the bare message, without
 * the category description that `std::system_error::what()` appends.
 */
class RpcError : public std::system_error {
private:
  std::string message_;

public:
  RpcError(ecode code, std::string message)
      : std::system_error{make_error_code(code), message}, message_{std::move(message)} {}

  std::string_view message() const noexcept { return message_; }
};

/**
 * @brief The server answered with a non-empty error field, which is kept verbatim.
 */
class RemoteError : public RpcError {
private:
  Value error_;

public:
  explicit RemoteError(Value error);

  const Value& error() const noexcept { return error_; }
};

/**
 * @brief The call's deadline passed before a response arrived.
 */
class TimeoutError : public RpcError {
public:
  static constexpr std::string_view k_message = "Request timed out";
  TimeoutError() : RpcError{ecode::timed_out, std::string{k_message}} {}
};

/**
 * @brief The transport reported a connection failure; `message()` is its reason.
 */
class ConnectionError : public RpcError {
public:
  explicit ConnectionError(std::string reason)
      : RpcError{ecode::connection_failed, std::move(reason)} {}
};

} // namespace msgrpc::net
