#include "pending-calls.hpp"

#include "rpc-error.hpp"

#include <algorithm>

namespace msgrpc::net {

void PendingCalls::insert(MessageId msgid, Record record) {
  const auto [ii, success] = records_.try_emplace(msgid, std::move(record));
  if (!success)
    throw RpcError{ecode::logic_error, fmt::format("message id {} is already outstanding", msgid)};
}

std::optional<PendingCalls::Record> PendingCalls::take(MessageId msgid) {
  auto ii = records_.find(msgid);
  if (ii == end(records_))
    return std::nullopt;
  std::optional<Record> record{std::move(ii->second)};
  records_.erase(ii);
  return record;
}

std::vector<MessageId> PendingCalls::expired(ticktock_type now) const {
  std::vector<MessageId> msgids;
  for (const auto& [msgid, record] : records_) {
    const auto* promise = std::get_if<Awaiting>(&record);
    if (promise != nullptr && promise->step_timeout(now))
      msgids.push_back(msgid);
  }
  std::sort(begin(msgids), end(msgids));
  return msgids;
}

std::vector<std::pair<MessageId, PendingCalls::Awaiting>> PendingCalls::take_all_awaiting() {
  std::vector<std::pair<MessageId, Awaiting>> out;
  for (auto ii = begin(records_); ii != end(records_);) {
    if (auto* promise = std::get_if<Awaiting>(&ii->second)) {
      out.emplace_back(ii->first, std::move(*promise));
      ii = records_.erase(ii);
    } else {
      ++ii;
    }
  }
  std::sort(begin(out), end(out),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  return out;
}

std::size_t PendingCalls::awaiting_count() const noexcept {
  return std::size_t(std::count_if(begin(records_), end(records_), [](const auto& x) {
    return std::holds_alternative<Awaiting>(x.second);
  }));
}

} // namespace msgrpc::net
