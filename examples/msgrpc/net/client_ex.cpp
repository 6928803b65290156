#include "msgrpc/net.hpp"
#include "msgrpc/utils.hpp"

#include <cstdlib>
#include <exception>

namespace msgrpc::example {

using namespace msgrpc::net;

static std::shared_ptr<InProcessService> make_service() {
  auto service = InProcessService::make();
  service->add_method("add", [](const Array& args) {
    return Value{args.at(0).as_int().value() + args.at(1).as_int().value()};
  });
  service->add_method("echo", [](const Array& args) { return Value{args}; });
  service->add_method("log", [](const Array& args) {
    INFO("server log: {}", Value{args});
    return Value{};
  });
  return service;
}

static int client_example() {
  auto service = make_service();

  Client::Config config;
  config.address = Address::parse("localhost:18800").value();
  config.timeout = std::chrono::seconds{5};
  config.transport_builder = service->builder();

  auto client = Client::open(config); // closed at the end of the scope

  const auto encoded = pack(make_request(0, "add", make_array(2, 3)));
  INFO("add(2, 3) is {} bytes as MessagePack", encoded.size());

  // Synchronous: drives the loop until the result arrives
  const auto sum = client->call("add", 2, 3);
  INFO("add(2, 3) = {}", sum);

  // Asynchronous: the result is collected later
  auto future = client->call_async("echo", "hello", 42);
  future.attach_callback([](const auto& f) { INFO("echo completed: {}", f.get()); });

  // Callback: no future; an error response arrives as std::nullopt
  client->call_with_callback(
      "add",
      [](std::optional<Value> result) {
        if (result)
          INFO("callback add(4, 5) = {}", *result);
        else
          WARN("callback add failed");
      },
      4, 5);

  // Notify: no response; returns once the message is flushed
  client->notify("log", "notified");

  // Waiting on the future drives the loop until the echo response is delivered
  const auto echoed = future.get();
  INFO("echo returned {}", echoed);

  while (client->pending_count() > 0)
    client->loop()->run_for(std::chrono::milliseconds{10});

  return EXIT_SUCCESS;
}

} // namespace msgrpc::example

int main(int, char**) {
  msgrpc::logging::set_log_level(msgrpc::logging::LogLevel::INFO);
  try {
    return msgrpc::example::client_example();
  } catch (const std::exception& e) {
    LOG_ERR("client example failed: {}", e.what());
  }
  return EXIT_FAILURE;
}
