#include "event-loop.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

#include <stdexcept>

namespace msgrpc::async {

// ----------------------------------------------------------------------------------------- State

struct PeriodicCallback::State {
  boost::asio::steady_timer timer;
  thunk_type thunk;
  std::chrono::milliseconds interval;
  bool is_cancelled{false};

  State(boost::asio::io_context& io_context, thunk_type thunk_, std::chrono::milliseconds interval_)
      : timer{io_context}, thunk{std::move(thunk_)}, interval{interval_} {}
};

bool PeriodicCallback::is_attached() const noexcept {
  return state_ != nullptr && !state_->is_cancelled;
}

std::chrono::milliseconds PeriodicCallback::interval() const noexcept {
  return (state_ == nullptr) ? std::chrono::milliseconds{0} : state_->interval;
}

void PeriodicCallback::cancel() noexcept {
  if (state_ == nullptr)
    return;
  state_->is_cancelled = true;
  boost::system::error_code ec;
  state_->timer.cancel(ec);
  state_.reset();
}

void PeriodicCallback::schedule_next_(const std::shared_ptr<State>& state) {
  // Fixed rate, but never try to catch up on missed ticks
  const auto now = std::chrono::steady_clock::now();
  auto next = state->timer.expiry() + state->interval;
  if (next <= now)
    next = now + state->interval;
  state->timer.expires_at(next);
  state->timer.async_wait(
      [weak = std::weak_ptr<State>{state}](const boost::system::error_code& ec) {
        if (ec)
          return; // cancelled
        auto state = weak.lock();
        if (state == nullptr || state->is_cancelled)
          return;
        state->thunk();
        if (!state->is_cancelled)
          schedule_next_(state);
      });
}

// -------------------------------------------------------------------------------------- RunScope

/// @private Marks the loop as running for the lifetime of the scope, even if a handler throws
struct EventLoop::RunScope {
  EventLoop& loop;
  explicit RunScope(EventLoop& loop_) : loop{loop_} { loop.is_running_ = true; }
  ~RunScope() {
    loop.is_running_ = false;
    loop.stop_requested_ = false;
  }
};

// ------------------------------------------------------------------------------------- EventLoop

EventLoop::EventLoop()
    : owned_context_{std::make_unique<boost::asio::io_context>(1)}, io_context_{*owned_context_} {}

EventLoop::EventLoop(boost::asio::io_context& io_context) : io_context_{io_context} {}

EventLoop::~EventLoop() = default;

template <typename RunOne> bool EventLoop::drive_(RunOne&& run_one) {
  RunScope scope{*this};
  auto work = boost::asio::make_work_guard(io_context_);
  if (io_context_.stopped())
    io_context_.restart();
  while (!stop_requested_) {
    if (run_one() == 0)
      return false; // deadline passed, or the io_context was stopped by someone else
  }
  return true;
}

void EventLoop::start() {
  if (is_running_)
    return;
  if (stop_requested_) {
    stop_requested_ = false;
    return;
  }
  drive_([this]() { return io_context_.run_one(); });
}

bool EventLoop::run_for(std::chrono::steady_clock::duration duration) {
  if (is_running_)
    return false;
  if (stop_requested_) {
    stop_requested_ = false;
    return true;
  }
  const auto deadline = std::chrono::steady_clock::now() + duration;
  return drive_([this, deadline]() { return io_context_.run_one_until(deadline); });
}

bool EventLoop::run_until(const std::function<bool()>& is_done,
                          std::chrono::steady_clock::time_point deadline) {
  if (is_running_)
    throw std::logic_error{"cannot wait on the event loop from inside a handler it is executing"};

  RunScope scope{*this};
  auto work = boost::asio::make_work_guard(io_context_);
  if (io_context_.stopped())
    io_context_.restart();
  const bool has_deadline = deadline != std::chrono::steady_clock::time_point::max();
  while (!is_done()) {
    const auto n = has_deadline ? io_context_.run_one_until(deadline) : io_context_.run_one();
    if (n == 0)
      return is_done(); // deadline passed, or the io_context was stopped by someone else
  }
  return true;
}

void EventLoop::post(thunk_type thunk) { boost::asio::post(io_context_, std::move(thunk)); }

PeriodicCallback EventLoop::attach_periodic_callback(thunk_type thunk,
                                                     std::chrono::milliseconds interval) {
  if (!thunk)
    throw std::invalid_argument{"periodic callback must be callable"};
  if (interval <= std::chrono::milliseconds{0})
    throw std::invalid_argument{"periodic callback interval must be positive"};

  auto state = std::make_shared<PeriodicCallback::State>(io_context_, std::move(thunk), interval);
  state->timer.expires_at(std::chrono::steady_clock::now());
  PeriodicCallback::schedule_next_(state);
  return PeriodicCallback{std::move(state)};
}

} // namespace msgrpc::async
