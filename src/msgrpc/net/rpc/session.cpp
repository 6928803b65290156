#include "session.hpp"

#include <exception>
#include <stdexcept>

namespace msgrpc::net {

// ------------------------------------------------------------------------------------ construction

Session::Session(Config config)
    : address_{std::move(config.address)}, timeout_{config.timeout},
      external_loop_{config.external_loop}, loop_{std::move(config.loop)} {
  if (timeout_ < std::chrono::seconds{0})
    throw RpcError{ecode::argument_error, "timeout must not be negative"};
  if (!config.transport_builder)
    throw RpcError{ecode::no_transport, "no transport builder configured"};
  if (loop_ == nullptr)
    loop_ = std::make_shared<async::EventLoop>();

  TransportOptions options;
  options.address = address_;
  options.reconnect_limit = config.reconnect_limit;
  options.pack_encoding = std::move(config.pack_encoding);
  options.unpack_encoding = std::move(config.unpack_encoding);
  options.loop = loop_;

  transport_ = config.transport_builder(*this, options);
  if (transport_ == nullptr)
    throw RpcError{ecode::no_transport, "transport builder returned no transport"};
}

Session::~Session() { close(); }

void Session::attach_timeout_sweep_(std::chrono::milliseconds interval) {
  timeout_sweep_ = loop_->attach_periodic_callback([this]() { step_timeout(); }, interval);
}

// ---------------------------------------------------------------------------------- loop control

void Session::start_loop_() {
  if (!external_loop_)
    loop_->start();
}

void Session::stop_loop_() noexcept {
  if (!external_loop_)
    loop_->stop();
}

Transport& Session::transport_or_throw_() {
  if (transport_ == nullptr)
    throw RpcError{ecode::session_closed, fmt::format("session to {} is closed", address_)};
  return *transport_;
}

void Session::send_registered_(MessageId msgid, Value message) {
  try {
    transport_or_throw_().send_message(std::move(message), {});
  } catch (...) {
    pending_.take(msgid); // never leave a call registered that was not sent
    throw;
  }
}

// ------------------------------------------------------------------------------------------ calls

Session::FutureType Session::send_request(std::string_view method, Array args) {
  transport_or_throw_();

  const auto msgid = generator_.next();
  async::Promise<Value> promise{loop_, deadline_after(timeout_)};
  auto future = promise.get_future();
  pending_.insert(msgid, std::move(promise));

  TRACE("request {} -> {}({})", msgid, method, Value{args});
  send_registered_(msgid, make_request(msgid, method, std::move(args)));
  return future;
}

Value Session::call(std::string_view method, Array args) {
  if (loop_->is_running())
    throw std::logic_error{"cannot make a blocking call from inside the event loop"};

  auto future = send_request(method, std::move(args));

  async::PeriodicCallback temporary_sweep;
  if (timeout_ > std::chrono::seconds{0} && !has_timeout_sweep())
    temporary_sweep = loop_->attach_periodic_callback([this]() { step_timeout(); }, 1000ms);

  return future.get();
}

void Session::call_with_callback(std::string_view method, ResponseCallback callback, Array args) {
  if (!callback)
    throw std::invalid_argument{"response callback must be callable"};
  transport_or_throw_();

  const auto msgid = generator_.next();
  pending_.insert(msgid, std::move(callback));

  TRACE("request {} -> {}({}) with callback", msgid, method, Value{args});
  send_registered_(msgid, make_request(msgid, method, std::move(args)));
}

void Session::notify(std::string_view method, Array args) {
  auto& transport = transport_or_throw_();

  auto is_sent = std::make_shared<bool>(false);
  TRACE("notify -> {}({})", method, Value{args});
  transport.send_message(make_notify(method, std::move(args)), [this, is_sent]() {
    *is_sent = true;
    stop_loop_();
  });

  // Drive the loop until the message is flushed. From inside the loop that cannot be
  // done: the message is flushed once control returns to the loop.
  if (external_loop_ || loop_->is_running())
    return;
  loop_->run_until([&]() { return *is_sent || is_closed(); });
}

void Session::close() noexcept {
  if (transport_ != nullptr) {
    LOG_DEBUG("closing session to {}, {} call(s) abandoned", address_, pending_.size());
    transport_->close();
  }
  transport_.reset();
  pending_.clear();
}

// --------------------------------------------------------------------------------------- timeouts

void Session::step_timeout(ticktock_type now) {
  const auto expired = pending_.expired(now);
  if (expired.empty())
    return;

  // No delivery may race with the registry mutation below
  stop_loop_();
  for (const auto msgid : expired) {
    auto record = pending_.take(msgid);
    if (!record)
      continue;
    INFO("request {} to {} timed out", msgid, address_);
    std::get<PendingCalls::Awaiting>(*record).set_exception(
        std::make_exception_ptr(TimeoutError{}));
  }
  start_loop_();
}

// ------------------------------------------------------------------------------- TransportHandler

void Session::on_response(MessageId msgid, Value error, Value result) {
  auto record = pending_.take(msgid);
  if (!record) {
    LOG_DEBUG("discarding response for unknown message id {}", msgid);
    return;
  }

  // Before delivery, so that the stop is issued even if a callback throws
  stop_loop_();
  if (auto* promise = std::get_if<PendingCalls::Awaiting>(&*record)) {
    if (!error.is_nil())
      promise->set_exception(std::make_exception_ptr(RemoteError{std::move(error)}));
    else
      promise->set_value(std::move(result));
  } else {
    auto& callback = std::get<ResponseCallback>(*record);
    if (!error.is_nil())
      callback(std::nullopt);
    else
      callback(std::move(result));
  }
}

void Session::on_connect_failed(std::string_view reason) {
  auto awaiting = pending_.take_all_awaiting();
  WARN("connection to {} failed: {}; failing {} call(s)", address_, reason, awaiting.size());
  for (auto& [msgid, promise] : awaiting)
    promise.set_exception(std::make_exception_ptr(ConnectionError{std::string{reason}}));

  close();
  stop_loop_();
}

} // namespace msgrpc::net
