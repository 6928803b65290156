#pragma once

#include "msgrpc/utils/base-include.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace msgrpc::net {

/**
 * @brief The endpoint of an RPC server. Not resolved here: the transport does that.
 */
struct Address {
  std::string host{};
  uint16_t port{0};

  /**
   * @brief Parse "host:port". IPv6 hosts must be bracketed: "[::1]:18800".
   * @return `ecode::argument_error` if the host is empty or the port is not a number
   *         in [0..65535].
   */
  static expected<Address, error_code> parse(std::string_view text);

  /** @brief The inverse of `parse` */
  std::string to_string() const;

  bool operator==(const Address&) const = default;
};

} // namespace msgrpc::net

template <> struct fmt::formatter<msgrpc::net::Address> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const msgrpc::net::Address& address, FormatContext& ctx) const {
    const auto s = address.to_string();
    return fmt::formatter<std::string_view>::format(std::string_view{s}, ctx);
  }
};
