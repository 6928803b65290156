#pragma once

#include "session.hpp"

#include <memory>

namespace msgrpc::net {

/**
 * @brief A `Session` that sweeps for timed out calls once a second.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto client = Client::open(config);   // closed when `client` leaves scope
 * const auto sum = client->call("add", 2, 3);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class Client : public Session {
public:
  static constexpr std::chrono::milliseconds k_sweep_interval{1000};

  /**
   * @brief Owns a client, and closes it on destruction, whether or not an exception is
   *        propagating.
   */
  class Context {
  private:
    std::unique_ptr<Client> client_;

  public:
    explicit Context(std::unique_ptr<Client> client) : client_{std::move(client)} {}
    Context(const Context&) = delete;
    Context(Context&&) noexcept = default;
    ~Context() {
      if (client_ != nullptr)
        client_->close();
    }
    Context& operator=(const Context&) = delete;
    Context& operator=(Context&&) = delete;

    Client* get() const noexcept { return client_.get(); }
    Client* operator->() const noexcept { return client_.get(); }
    Client& operator*() const noexcept { return *client_; }
  };

  explicit Client(Config config);

  /** @brief Create a client, scoped to the returned context */
  static Context open(Config config);
};

} // namespace msgrpc::net
