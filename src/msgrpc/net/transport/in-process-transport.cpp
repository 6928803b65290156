#include "in-process-transport.hpp"

#include "msgrpc/net/rpc/rpc-error.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace msgrpc::net {

// -------------------------------------------------------------------------------- InProcessService

std::shared_ptr<InProcessService> InProcessService::make() {
  return std::shared_ptr<InProcessService>{new InProcessService{}};
}

const InProcessService::Method* InProcessService::find_method_(std::string_view name) const {
  auto ii = methods_.find(std::string{name});
  return (ii == cend(methods_)) ? nullptr : &ii->second;
}

void InProcessService::add_method(std::string name, MethodHandler handler) {
  if (!handler)
    throw std::invalid_argument{"method handler must be callable"};
  methods_[std::move(name)] = Method{std::move(handler), {}};
}

void InProcessService::add_deferred_method(std::string name, DeferredMethodHandler handler) {
  if (!handler)
    throw std::invalid_argument{"method handler must be callable"};
  methods_[std::move(name)] = Method{{}, std::move(handler)};
}

TransportBuilder InProcessService::builder() {
  return [service = shared_from_this()](TransportHandler& handler,
                                        const TransportOptions& options) {
    return std::make_unique<InProcessTransport>(service, handler, options);
  };
}

void InProcessService::fail(std::string_view reason) {
  // `fail` does not deregister, but copy anyway: a transport may close while we iterate
  const auto transports = transports_;
  for (auto* transport : transports)
    transport->fail(std::string{reason});
}

// ------------------------------------------------------------------------------ InProcessTransport

InProcessTransport::InProcessTransport(std::shared_ptr<InProcessService> service,
                                       TransportHandler& handler, const TransportOptions& options)
    : service_{std::move(service)}, handler_{handler}, loop_{options.loop} {
  if (service_ == nullptr || loop_ == nullptr)
    throw std::invalid_argument{"an in-process transport needs a service and an event loop"};
  service_->transports_.push_back(this);
  LOG_DEBUG("in-process connection to {} opened", options.address);
}

InProcessTransport::~InProcessTransport() { close(); }

void InProcessTransport::post_(std::function<void(InProcessTransport&)> thunk) {
  loop_->post([weak = std::weak_ptr<bool>{alive_}, this, thunk = std::move(thunk)]() {
    if (weak.lock() == nullptr || is_closed_)
      return; // the connection went away while the thunk was queued
    // `thunk` may close and destroy this transport: touch nothing after it
    thunk(*this);
  });
}

void InProcessTransport::send_message(Value message, OnSent on_sent) {
  if (is_closed_)
    throw RpcError{ecode::connection_failed, "transport is closed"};

  const auto type = message_type(message);
  if (type && *type == MessageType::REQUEST) {
    auto request = decode_request(message);
    if (request) {
      post_([request = std::move(*request), on_sent = std::move(on_sent)](auto& self) {
        self.dispatch_request_(request, on_sent);
      });
      return;
    }
  } else if (type && *type == MessageType::NOTIFY) {
    auto notify = decode_notify(message);
    if (notify) {
      post_([notify = std::move(*notify), on_sent = std::move(on_sent)](auto& self) {
        self.dispatch_notify_(notify, on_sent);
      });
      return;
    }
  }

  throw RpcError{ecode::invalid_data, fmt::format("cannot send message: {}", message)};
}

void InProcessTransport::close() noexcept {
  if (is_closed_)
    return;
  is_closed_ = true;
  auto& transports = service_->transports_;
  transports.erase(std::remove(begin(transports), end(transports), this), end(transports));
}

void InProcessTransport::fail(std::string reason) {
  post_([reason = std::move(reason)](auto& self) {
    self.close();
    self.handler_.on_connect_failed(reason);
  });
}

InProcessService::Responder InProcessTransport::make_responder_(MessageId msgid) {
  return [weak = std::weak_ptr<bool>{alive_}, this, msgid,
          is_answered = std::make_shared<bool>(false)](Value error, Value result) {
    if (*is_answered || weak.lock() == nullptr)
      return;
    *is_answered = true;
    post_([msgid, error = std::move(error), result = std::move(result)](auto& self) {
      self.handler_.on_response(msgid, error, result);
    });
  };
}

void InProcessTransport::dispatch_request_(const RequestEnvelope& request,
                                           const OnSent& on_sent) {
  ++service_->request_count_;
  if (on_sent)
    on_sent();

  auto respond = make_responder_(request.msgid);
  const auto* method = service_->find_method_(request.method);
  if (method == nullptr) {
    respond(Value{fmt::format("method not found: {}", request.method)}, Value{});
    return;
  }

  if (method->deferred_handler) {
    method->deferred_handler(request.args, std::move(respond));
    return;
  }

  try {
    auto result = method->handler(request.args);
    respond(Value{}, std::move(result));
  } catch (const RemoteError& e) {
    respond(e.error(), Value{});
  } catch (const std::exception& e) {
    respond(Value{e.what()}, Value{});
  }
}

void InProcessTransport::dispatch_notify_(const NotifyEnvelope& notify, const OnSent& on_sent) {
  ++service_->notify_count_;
  if (on_sent)
    on_sent();

  const auto* method = service_->find_method_(notify.method);
  if (method == nullptr) {
    WARN("notify of unknown method '{}' ignored", notify.method);
    return;
  }

  if (method->deferred_handler) {
    method->deferred_handler(notify.args, [](Value, Value) {});
    return;
  }

  try {
    method->handler(notify.args);
  } catch (const std::exception& e) {
    WARN("notify '{}' failed: {}", notify.method, e.what());
  }
}

} // namespace msgrpc::net
