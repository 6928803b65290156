#pragma once

#include "message.hpp"

namespace msgrpc::net {

/**
 * @brief Produces message ids 0, 1, 2, ..., `k_max_id`, and then starts over at 0.
 *
 * Ids are only unique among the calls that are outstanding at the same time, and only
 * while there are no more than `k_max_id` of them. Not thread safe.
 */
class IdGenerator {
private:
  MessageId next_{0};

public:
  static constexpr MessageId k_max_id = MessageId(1) << 30; // bounds the size on the wire

  /** @param start The first id; for resuming a sequence */
  explicit IdGenerator(MessageId start = 0) : next_{start > k_max_id ? 0 : start} {}

  /** @brief The id that `next()` will return */
  MessageId peek() const noexcept { return next_; }

  MessageId next() noexcept {
    const auto id = next_;
    next_ = (id >= k_max_id) ? 0 : id + 1;
    return id;
  }
};

} // namespace msgrpc::net
