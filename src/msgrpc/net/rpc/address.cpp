#include "address.hpp"

#include "msgrpc/utils/error-codes.hpp"

#include <charconv>

namespace msgrpc::net {

/// @private
static auto argument_error() { return make_unexpected(make_error_code(ecode::argument_error)); }

expected<Address, error_code> Address::parse(std::string_view text) {
  std::string_view host, port;

  if (!text.empty() && text.front() == '[') { // [ipv6]:port
    const auto pos = text.find("]:");
    if (pos == std::string_view::npos)
      return argument_error();
    host = text.substr(1, pos - 1);
    port = text.substr(pos + 2);
  } else {
    const auto pos = text.rfind(':');
    if (pos == std::string_view::npos)
      return argument_error();
    host = text.substr(0, pos);
    port = text.substr(pos + 1);
    if (host.find(':') != std::string_view::npos)
      return argument_error(); // unbracketed ipv6
  }

  if (host.empty() || port.empty())
    return argument_error();

  uint16_t value = 0;
  const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
  if (ec != std::errc{} || ptr != port.data() + port.size())
    return argument_error();

  return Address{std::string{host}, value};
}

std::string Address::to_string() const {
  if (host.find(':') != std::string::npos)
    return fmt::format("[{}]:{}", host, port);
  return fmt::format("{}:{}", host, port);
}

} // namespace msgrpc::net
