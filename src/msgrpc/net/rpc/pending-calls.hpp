#pragma once

#include "message.hpp"

#include "msgrpc/async/deferred-result.hpp"
#include "msgrpc/utils/tick-tock.hpp"

#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace msgrpc::net {

/**
 * @brief Completion of a callback-style call: the result, or `std::nullopt` if the server
 *        answered with an error. The error itself is not passed on.
 */
using ResponseCallback = std::function<void(std::optional<Value> result)>;

/**
 * @brief The calls that are waiting for a response, keyed by message id.
 *
 * Each record is either a Promise (`call`, `call_async`) or a callback
 * (`call_with_callback`). A record leaves the registry exactly once, through `take`,
 * `take_all_awaiting` or `clear`, and that removal is what guarantees that no call
 * sees more than one outcome.
 */
class PendingCalls {
public:
  using Awaiting = async::Promise<Value>;
  using Record = std::variant<Awaiting, ResponseCallback>;

private:
  std::unordered_map<MessageId, Record> records_;

public:
  /**
   * @exception RpcError `ecode::logic_error` if `msgid` is already outstanding, which
   *            only happens when more ids are in flight than the generator can produce.
   */
  void insert(MessageId msgid, Record record);

  /** @brief Remove and return the record for `msgid`, if there is one */
  std::optional<Record> take(MessageId msgid);

  /** @brief The ids of awaiting calls whose deadline passed as of `now`, in id order */
  std::vector<MessageId> expired(ticktock_type now) const;

  /** @brief Remove every awaiting call, leaving the callbacks in place */
  std::vector<std::pair<MessageId, Awaiting>> take_all_awaiting();

  void clear() noexcept { records_.clear(); }

  ///@{ getters
  bool contains(MessageId msgid) const { return records_.count(msgid) > 0; }
  std::size_t size() const noexcept { return records_.size(); }
  std::size_t awaiting_count() const noexcept;
  std::size_t callback_count() const noexcept { return size() - awaiting_count(); }
  ///@}
};

} // namespace msgrpc::net
