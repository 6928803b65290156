#include "client.hpp"

namespace msgrpc::net {

Client::Client(Config config) : Session{std::move(config)} {
  if (timeout() > std::chrono::seconds{0})
    attach_timeout_sweep_(k_sweep_interval);
}

Client::Context Client::open(Config config) {
  return Context{std::make_unique<Client>(std::move(config))};
}

} // namespace msgrpc::net
