#pragma once

#include "transport.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace msgrpc::net {

class InProcessTransport;

// -------------------------------------------------------------------------------- InProcessService

/**
 * @brief A table of named procedures, served to sessions in the same process.
 *
 * There is no serialization and no socket: requests are dispatched, and responses
 * delivered, by posting to the session's event loop. Useful for tests and for
 * embedding a service next to its client.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto service = InProcessService::make();
 * service->add_method("add", [](const Array& args) {
 *   return Value{*args.at(0).as_int() + *args.at(1).as_int()};
 * });
 * Client client{{.transport_builder = service->builder()}};
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class InProcessService final : public std::enable_shared_from_this<InProcessService> {
public:
  /** @brief Answers a request; only the first answer is delivered */
  using Responder = std::function<void(Value error, Value result)>;

  /** @brief Returns the result. A thrown exception becomes the error field. */
  using MethodHandler = std::function<Value(const Array& args)>;

  /** @brief Answers through `respond`, now, later, or never */
  using DeferredMethodHandler = std::function<void(const Array& args, Responder respond)>;

private:
  struct Method {
    MethodHandler handler;
    DeferredMethodHandler deferred_handler;
  };

  std::unordered_map<std::string, Method> methods_{};
  std::vector<InProcessTransport*> transports_{};
  std::size_t request_count_{0};
  std::size_t notify_count_{0};

  friend class InProcessTransport;

  InProcessService() = default;
  const Method* find_method_(std::string_view name) const;

public:
  static std::shared_ptr<InProcessService> make();

  InProcessService(const InProcessService&) = delete;
  InProcessService& operator=(const InProcessService&) = delete;

  ///@{ Register `name`, replacing any previous method of the same name
  void add_method(std::string name, MethodHandler handler);
  void add_deferred_method(std::string name, DeferredMethodHandler handler);
  ///@}

  bool has_method(std::string_view name) const { return find_method_(name) != nullptr; }

  /** @brief Builds transports connected to this service */
  TransportBuilder builder();

  /** @brief Fail every open connection with `reason` */
  void fail(std::string_view reason);

  ///@{ getters
  std::size_t connection_count() const noexcept { return transports_.size(); }
  std::size_t request_count() const noexcept { return request_count_; }
  std::size_t notify_count() const noexcept { return notify_count_; }
  ///@}
};

// ------------------------------------------------------------------------------ InProcessTransport

/**
 * @brief A transport connected to an `InProcessService`.
 */
class InProcessTransport final : public Transport {
private:
  std::shared_ptr<InProcessService> service_;
  TransportHandler& handler_;
  std::shared_ptr<async::EventLoop> loop_;
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)}; // guards posted thunks
  bool is_closed_{false};

  void post_(std::function<void(InProcessTransport&)> thunk);
  InProcessService::Responder make_responder_(MessageId msgid);
  void dispatch_request_(const RequestEnvelope& request, const OnSent& on_sent);
  void dispatch_notify_(const NotifyEnvelope& notify, const OnSent& on_sent);

public:
  InProcessTransport(std::shared_ptr<InProcessService> service, TransportHandler& handler,
                     const TransportOptions& options);
  InProcessTransport(const InProcessTransport&) = delete;
  InProcessTransport& operator=(const InProcessTransport&) = delete;
  ~InProcessTransport() override;

  /**
   * Exceptions
   * + RpcError `ecode::invalid_data` if `message` is not a request or a notify.
   * + RpcError `ecode::connection_failed` if the transport is closed.
   */
  void send_message(Value message, OnSent on_sent) override;

  void close() noexcept override;

  /** @brief Simulate a connection failure. The handler is told from inside the loop. */
  void fail(std::string reason);

  bool is_closed() const noexcept { return is_closed_; }
};

} // namespace msgrpc::net
