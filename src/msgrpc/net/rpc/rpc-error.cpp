#include "rpc-error.hpp"

namespace msgrpc::net {

/// @private
static std::string describe(const Value& error) {
  // A string error reads better without quotes
  if (const auto s = error.as_string())
    return std::string{*s};
  return to_string(error);
}

RemoteError::RemoteError(Value error)
    : RpcError{ecode::remote_error, describe(error)}, error_{std::move(error)} {}

} // namespace msgrpc::net
