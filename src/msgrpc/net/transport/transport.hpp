#pragma once

#include "msgrpc/async/event-loop.hpp"
#include "msgrpc/net/rpc/address.hpp"
#include "msgrpc/net/rpc/message.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace msgrpc::net {

/**
 * @brief Called once a message has been handed to the connection.
 */
using OnSent = std::function<void()>;

/**
 * @brief Receives the inbound events of a transport. Implemented by `Session`.
 *
 * Transports invoke these from inside the event loop.
 */
class TransportHandler {
public:
  virtual ~TransportHandler() = default;

  /**
   * @brief A response arrived.
   * @param error nil iff the call succeeded
   */
  virtual void on_response(MessageId msgid, Value error, Value result) = 0;

  /** @brief The connection could not be established, or was lost for good. */
  virtual void on_connect_failed(std::string_view reason) = 0;
};

/**
 * @brief The client end of a persistent connection.
 *
 * Owns connecting, reconnecting, framing and (de)serialization. None of that is
 * visible to the session, which only sees array-encoded messages.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * @brief Queue `message` for sending.
   *
   * Exceptions
   * + RpcError if the message cannot be queued, in which case `on_sent` is never called.
   */
  virtual void send_message(Value message, OnSent on_sent) = 0;

  /** @brief Tear down the connection. No handler is invoked afterwards. */
  virtual void close() noexcept = 0;
};

/**
 * @brief Everything a transport needs from the session's configuration.
 *
 * The encodings and the reconnect limit are forwarded untouched.
 */
struct TransportOptions {
  Address address{};
  unsigned reconnect_limit{5};
  std::string pack_encoding{"utf-8"};
  std::string unpack_encoding{};
  std::shared_ptr<async::EventLoop> loop{};
};

using TransportBuilder = std::function<std::unique_ptr<Transport>(TransportHandler& handler,
                                                                  const TransportOptions& options)>;

} // namespace msgrpc::net
