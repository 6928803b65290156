#pragma once

#include "address.hpp"
#include "id-generator.hpp"
#include "message.hpp"
#include "pending-calls.hpp"
#include "rpc-error.hpp"

#include "msgrpc/async/deferred-result.hpp"
#include "msgrpc/async/event-loop.hpp"
#include "msgrpc/net/transport/transport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace msgrpc::net {

/**
 * @brief Multiplexes many calls over one transport, and matches each response to the
 *        call that requested it.
 *
 * A call is registered under a fresh message id before its request is sent, and leaves
 * the registry exactly once: when its response arrives, when its deadline passes (see
 * `step_timeout`), or when the connection fails. Responses for ids that are no longer
 * registered are discarded.
 *
 * The session is single threaded. Everything, including the transport's callbacks,
 * runs on the thread that drives `loop()`. A synchronous `call` drives the loop until
 * its result is set, so other calls keep making progress while it waits.
 *
 * Callback-style calls are weaker than the other shapes: they never time out, they are
 * not told about connection failure, and an error response reaches them as
 * `std::nullopt`.
 */
class Session : public TransportHandler {
public:
  struct Config {
    Address address{};
    std::chrono::seconds timeout{10}; //!< 0 disables deadlines
    unsigned reconnect_limit{5};
    std::string pack_encoding{"utf-8"};
    std::string unpack_encoding{}; //!< empty means raw bytes
    std::shared_ptr<async::EventLoop> loop{}; //!< a new loop is created when null
    TransportBuilder transport_builder{};
    bool external_loop{false}; //!< the host drives `loop`; the session never stops it
  };

  using FutureType = async::Future<Value>;

private:
  Address address_;
  std::chrono::seconds timeout_;
  bool external_loop_;
  std::shared_ptr<async::EventLoop> loop_;
  async::PeriodicCallback timeout_sweep_{}; // destroyed before `loop_`
  IdGenerator generator_{};
  PendingCalls pending_{};
  std::unique_ptr<Transport> transport_{};

  Transport& transport_or_throw_();
  void send_registered_(MessageId msgid, Value message);
  void start_loop_();
  void stop_loop_() noexcept;

protected:
  /** @brief Run `step_timeout` every `interval` from inside the loop */
  void attach_timeout_sweep_(std::chrono::milliseconds interval);

public:
  /**
   * Exceptions
   * + RpcError `ecode::argument_error` if the timeout is negative.
   * + RpcError `ecode::no_transport` if there is no transport builder, or it returns null.
   * + Whatever the transport builder throws.
   */
  explicit Session(Config config);
  Session(const Session&) = delete;
  Session(Session&&) = delete;
  ~Session() override;
  Session& operator=(const Session&) = delete;
  Session& operator=(Session&&) = delete;

  ///@{ getters
  const Address& address() const noexcept { return address_; }
  std::chrono::seconds timeout() const noexcept { return timeout_; }
  const std::shared_ptr<async::EventLoop>& loop() const noexcept { return loop_; }
  bool is_closed() const noexcept { return transport_ == nullptr; }
  bool has_timeout_sweep() const noexcept { return timeout_sweep_.is_attached(); }
  ///@}

  ///@{ registry
  std::size_t pending_count() const noexcept { return pending_.size(); }
  std::size_t awaiting_count() const noexcept { return pending_.awaiting_count(); }
  std::size_t callback_count() const noexcept { return pending_.callback_count(); }
  ///@}

  // -------------------------------------------------------------------------------------- calls

  /**
   * @brief Register a call and send its request. The shared path of `call` and `call_async`.
   *
   * Exceptions
   * + RpcError `ecode::session_closed` after `close()`.
   * + Whatever the transport throws; the call is unregistered first.
   */
  FutureType send_request(std::string_view method, Array args);

  /**
   * @brief Call `method` and wait for the result.
   *
   * If no periodic timeout sweep is attached, then one is attached for the duration of
   * the wait, so that the call's deadline is always observed. The wait returns as soon as
   * the result is set, including when `loop()` is external, provided the host is not
   * driving it at that moment.
   *
   * Exceptions
   * + RemoteError, TimeoutError, ConnectionError: the call failed.
   * + std::logic_error if called from a handler running inside `loop()`.
   */
  Value call(std::string_view method, Array args);

  template <typename... Args> Value call(std::string_view method, Args&&... args) {
    return call(method, make_array(std::forward<Args>(args)...));
  }

  /** @brief Call `method`, without waiting for the result */
  FutureType call_async(std::string_view method, Array args) {
    return send_request(method, std::move(args));
  }

  template <typename... Args> FutureType call_async(std::string_view method, Args&&... args) {
    return call_async(method, make_array(std::forward<Args>(args)...));
  }

  /**
   * @brief Call `method`, and pass its result to `callback` when the response arrives.
   */
  void call_with_callback(std::string_view method, ResponseCallback callback, Array args);

  template <typename... Args>
  void call_with_callback(std::string_view method, ResponseCallback callback, Args&&... args) {
    call_with_callback(method, std::move(callback), make_array(std::forward<Args>(args)...));
  }

  /**
   * @brief Send a notification: no message id, no registration, no response.
   *
   * Drives the loop until the transport reports the message as sent, unless the loop
   * is external or already running.
   */
  void notify(std::string_view method, Array args);

  template <typename... Args> void notify(std::string_view method, Args&&... args) {
    notify(method, make_array(std::forward<Args>(args)...));
  }

  /**
   * @brief Tear down the transport and forget every outstanding call.
   *
   * Futures that are still pending are abandoned: they will never complete.
   */
  void close() noexcept;

  // ---------------------------------------------------------------------------------- timeouts

  /**
   * @brief Fail every awaiting call whose deadline has passed with a TimeoutError.
   *
   * Callback-style calls are never timed out.
   */
  void step_timeout(ticktock_type now);
  void step_timeout() { step_timeout(tick()); }

  // --------------------------------------------------------------------------- TransportHandler

  /**
   * @brief Deliver a response to its registered call, then stop the loop.
   *
   * An exception thrown by a response callback, or by a callback attached to the call's
   * future, propagates out of whatever is driving the loop at the time. That may be a
   * blocking `call` for a different message id.
   */
  void on_response(MessageId msgid, Value error, Value result) override;
  void on_connect_failed(std::string_view reason) override;
};

} // namespace msgrpc::net
