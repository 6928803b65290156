#pragma once

#include "msgrpc/net/rpc/rpc-error.hpp"
#include "msgrpc/net/transport/transport.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace msgrpc::net::test {

/**
 * @brief The test's view of a `ScriptedTransport`: what was sent, and a way to
 *        impersonate the server.
 */
struct Script {
  TransportHandler* handler{nullptr};
  std::shared_ptr<async::EventLoop> loop{};
  TransportOptions options{};
  std::vector<Value> sent{};
  bool is_closed{false};
  bool fail_next_send{false};
  std::function<void(const RequestEnvelope&)> on_request{}; // called for each request sent

  /** @brief Deliver a response right now, from outside the loop */
  void respond(MessageId msgid, Value error, Value result) {
    handler->on_response(msgid, std::move(error), std::move(result));
  }

  /** @brief Deliver a response from inside the loop */
  void post_response(MessageId msgid, Value error, Value result) {
    loop->post([this, msgid, error = std::move(error), result = std::move(result)]() {
      if (!is_closed)
        handler->on_response(msgid, error, result);
    });
  }

  void fail(std::string_view reason) { handler->on_connect_failed(reason); }

  MessageId sent_msgid(std::size_t index) const { return decode_request(sent.at(index))->msgid; }

  TransportBuilder builder();
};

class ScriptedTransport final : public Transport {
private:
  Script& script_;

public:
  explicit ScriptedTransport(Script& script) : script_{script} {}

  void send_message(Value message, OnSent on_sent) override {
    if (script_.is_closed)
      throw RpcError{ecode::connection_failed, "transport is closed"};
    if (script_.fail_next_send) {
      script_.fail_next_send = false;
      throw RpcError{ecode::connection_failed, "send failed"};
    }
    script_.sent.push_back(message);
    if (on_sent)
      script_.loop->post(std::move(on_sent));
    auto request = decode_request(message);
    if (request && script_.on_request)
      script_.on_request(*request);
  }

  void close() noexcept override { script_.is_closed = true; }
};

inline TransportBuilder Script::builder() {
  return [this](TransportHandler& handler, const TransportOptions& opts) {
    this->handler = &handler;
    this->loop = opts.loop;
    this->options = opts;
    return std::make_unique<ScriptedTransport>(*this);
  };
}

} // namespace msgrpc::net::test
