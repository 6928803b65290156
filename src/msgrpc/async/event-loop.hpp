#pragma once

#include "msgrpc/utils/base-include.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <memory>

namespace msgrpc::async {

class EventLoop;

// -------------------------------------------------------------------------------- PeriodicCallback

/**
 * @ingroup async
 * @brief Handle to a thunk that an `EventLoop` executes at a fixed interval.
 *
 * The thunk stays attached until `cancel()` is called or the handle is destroyed.
 */
class PeriodicCallback {
private:
  struct State;
  std::shared_ptr<State> state_;

  friend class EventLoop;
  explicit PeriodicCallback(std::shared_ptr<State> state) : state_{std::move(state)} {}

  static void schedule_next_(const std::shared_ptr<State>& state);

public:
  PeriodicCallback() noexcept = default;
  PeriodicCallback(const PeriodicCallback&) = delete;
  PeriodicCallback(PeriodicCallback&&) noexcept = default;
  ~PeriodicCallback() { cancel(); }
  PeriodicCallback& operator=(const PeriodicCallback&) = delete;
  PeriodicCallback& operator=(PeriodicCallback&& o) noexcept {
    if (this != &o) {
      cancel();
      state_ = std::move(o.state_);
    }
    return *this;
  }

  /** @brief true iff the thunk is still scheduled to run */
  bool is_attached() const noexcept;

  /** @brief The interval between executions */
  std::chrono::milliseconds interval() const noexcept;

  /** @brief Detach the thunk. It will not be executed again. */
  void cancel() noexcept;
};

// --------------------------------------------------------------------------------------- EventLoop

/**
 * @ingroup async
 * @brief A single threaded, cooperative loop over a `boost::asio::io_context`.
 *
 * Transports deliver their events to the loop with `post`, and the session drives the
 * loop with `start` when a caller must wait for a result. `stop` requests that the
 * current `start` return. A `stop` that arrives while the loop is not being driven
 * makes the next `start` return immediately, so a stop is never lost between the two.
 *
 * Calling `start` from a handler that is already executing inside this loop does
 * nothing: the loop is already being driven further up the stack.
 *
 * The io_context is either owned by the loop, or borrowed from a host application
 * that integrates its own scheduler.
 */
class EventLoop {
private:
  std::unique_ptr<boost::asio::io_context> owned_context_;
  boost::asio::io_context& io_context_;
  bool is_running_{false};
  bool stop_requested_{false};

  struct RunScope;

  // Returns true iff the loop left because `stop` was called
  template <typename RunOne> bool drive_(RunOne&& run_one);

public:
  using ExecutorType = boost::asio::io_context::executor_type;
  using SteadyTimerType = boost::asio::steady_timer;

  /** @brief A loop with its own io_context */
  EventLoop();

  /** @brief A loop over a host application's io_context */
  explicit EventLoop(boost::asio::io_context& io_context);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) = delete;
  ~EventLoop();
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) = delete;

  /**
   * @brief Execute handlers until `stop()` is called.
   *
   * Returns immediately when a stop was requested beforehand, or when the loop is
   * already running on this thread.
   *
   * Exceptions
   * + Any exception thrown by a handler propagates out of `start`.
   */
  void start();

  /**
   * @brief Like `start`, but gives up after `duration`.
   * @return true iff the loop returned because of `stop()`.
   */
  bool run_for(std::chrono::steady_clock::duration duration);

  /**
   * @brief Execute handlers until `is_done()` holds, or `deadline` passes.
   *
   * `is_done` is checked before the first handler and after every handler, so the loop
   * returns as soon as the awaited condition is met, whether or not anything calls
   * `stop`. A `stop` does not end `run_until`, and a pending one is discarded when it
   * returns.
   *
   * @return true iff `is_done()` holds.
   *
   * Exceptions
   * + std::logic_error if called from inside this loop.
   * + Any exception thrown by a handler propagates out of `run_until`.
   */
  bool run_until(const std::function<bool()>& is_done,
                 std::chrono::steady_clock::time_point deadline =
                     std::chrono::steady_clock::time_point::max());

  /** @brief Request the current, or next, `start` to return. */
  void stop() noexcept { stop_requested_ = true; }

  /** @brief true iff `start` or `run_for` is executing handlers */
  bool is_running() const noexcept { return is_running_; }

  /** @brief true iff a `stop` is pending */
  bool is_stop_requested() const noexcept { return stop_requested_; }

  /** @brief Queue `thunk` for execution inside the loop */
  void post(thunk_type thunk);

  /**
   * @brief Execute `thunk` every `interval`, from inside the loop.
   * @return A handle that detaches the thunk when cancelled or destroyed.
   */
  [[nodiscard]] PeriodicCallback attach_periodic_callback(thunk_type thunk,
                                                          std::chrono::milliseconds interval);

  /** @brief Return the executor of the underlying io_context */
  ExecutorType get_executor() const { return io_context_.get_executor(); }

  /** @brief Create a new steady timer bound to this loop */
  SteadyTimerType make_steady_timer() const { return SteadyTimerType{io_context_}; }

  /** @brief Direct access to the underlying io_context */
  boost::asio::io_context& io_context() noexcept { return io_context_; }
};

} // namespace msgrpc::async
