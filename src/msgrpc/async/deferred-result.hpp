#pragma once

#include "event-loop.hpp"

#include "msgrpc/utils/base-include.hpp"
#include "msgrpc/utils/tick-tock.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace msgrpc::async
{
template<typename R> class Promise;
template<typename R> class Future;

namespace detail
{
   /**
    * The state shared by a Promise and its Future. There is no locking: the state is
    * only ever touched from the thread that drives the associated EventLoop.
    */
   template<typename R>
   class DeferredState : public std::enable_shared_from_this<DeferredState<R>>
   {
    public:
      static_assert(!std::is_void_v<R>, "a deferred result always carries a value");

      using callback_type       = std::function<void(const Future<R>&)>;
      using result_handler_type = std::function<R(R)>;
      using error_handler_type  = std::function<R(std::exception_ptr)>;

    private:
      std::shared_ptr<EventLoop> loop_;
      ticktock_type deadline_               = ticktock_type::max();
      std::optional<R> value_               = {};
      std::exception_ptr exception_ptr_     = {};
      bool is_set_                          = false;
      bool future_is_retreived_             = false;
      std::vector<callback_type> callbacks_ = {};
      result_handler_type result_handler_   = {};
      error_handler_type error_handler_     = {};

      void mark_set_()
      {
         is_set_ = true;
         // Callbacks may attach further callbacks; run them from a local copy
         auto callbacks = std::move(callbacks_);
         callbacks_.clear();
         for(auto& callback : callbacks) callback(Future<R>{this->shared_from_this(), this});
      }

    public:
      DeferredState(std::shared_ptr<EventLoop> loop, ticktock_type deadline)
          : loop_{std::move(loop)}
          , deadline_{deadline}
      {
         if(loop_ == nullptr) throw std::invalid_argument{"a deferred result needs an event loop"};
      }

      ///@{ getters
      bool is_set() const noexcept { return is_set_; }
      bool has_exception() const noexcept { return exception_ptr_ != nullptr; }
      ticktock_type deadline() const noexcept { return deadline_; }
      EventLoop& loop() const noexcept { return *loop_; }
      ///@}

      void flag_future_has_been_retreived()
      {
         if(future_is_retreived_)
            throw std::future_error{std::future_errc::future_already_retrieved};
         future_is_retreived_ = true;
      }

      /**
       * @brief true iff the deadline has passed. A state that is already set never
       * times out.
       */
      bool step_timeout(ticktock_type now) const noexcept
      {
         return !is_set_ && deadline_ != ticktock_type::max() && now >= deadline_;
      }

      ///@{ set
      void set_value(R value)
      {
         if(is_set_) throw std::future_error{std::future_errc::promise_already_satisfied};
         value_ = std::move(value);
         mark_set_();
      }

      void set_exception_ptr(std::exception_ptr ex_ptr)
      {
         if(ex_ptr == nullptr) throw std::invalid_argument{"exception_ptr must not be null"};
         if(is_set_) throw std::future_error{std::future_errc::promise_already_satisfied};
         exception_ptr_ = std::move(ex_ptr);
         mark_set_();
      }
      ///@}

      ///@{ wait
      void join()
      {
         if(is_set_) return;
         if(loop_->is_running())
            throw std::logic_error{"cannot block on a deferred result from inside its event loop"};
         while(!is_set_) loop_->run_until([this]() { return is_set_; });
      }

      template<typename Rep, typename Period>
      std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration)
      {
         if(is_set_) return std::future_status::ready;
         if(duration <= duration.zero()) return std::future_status::timeout;
         if(loop_->is_running())
            throw std::logic_error{"cannot block on a deferred result from inside its event loop"};
         const auto deadline = deadline_after(duration);
         while(!is_set_ && tick() < deadline)
            loop_->run_until([this]() { return is_set_; }, deadline);
         return is_set_ ? std::future_status::ready : std::future_status::timeout;
      }
      ///@}

      R get()
      {
         join();
         if(exception_ptr_ != nullptr) {
            if(error_handler_) return error_handler_(exception_ptr_);
            std::rethrow_exception(exception_ptr_);
         }
         Expects(value_.has_value());
         if(result_handler_) return result_handler_(*value_);
         return *value_;
      }

      ///@{ handlers
      void attach_callback(callback_type callback)
      {
         if(!callback) return;
         if(is_set_)
            callback(Future<R>{this->shared_from_this(), this});
         else
            callbacks_.push_back(std::move(callback));
      }

      void attach_result_handler(result_handler_type handler) { result_handler_ = std::move(handler); }
      void attach_error_handler(error_handler_type handler) { error_handler_ = std::move(handler); }
      ///@}
   };

} // namespace detail

// ------------------------------------------------------------------------------------------ Future

/**
 * @ingroup async
 * @brief The caller's side of a deferred result: a value that is not yet available.
 *
 * The result is set exactly once, to either a value or an exception, by the associated
 * Promise. Waiting (`join`, `get`, `wait_for`) is cooperative: the waiting thread drives
 * the EventLoop, so replies and timeouts for every other outstanding call keep flowing
 * while it waits.
 *
 * A waiter re-checks the result after every handler the loop executes, so the producer
 * does not need to stop the loop. This holds for a host-driven loop too.
 *
 * Waiting from inside a handler that the same EventLoop is executing is an error, since
 * nothing further up the stack could ever make progress.
 */
template<typename R> class Future final
{
 private:
   using shared_state_type = detail::DeferredState<R>;
   std::shared_ptr<shared_state_type> shared_state_{};

   friend class Promise<R>;
   friend class detail::DeferredState<R>;

   // Takes ownership of the Future slot of the shared state
   explicit Future(std::shared_ptr<shared_state_type> shared_state)
       : shared_state_{std::move(shared_state)}
   {
      shared_state_->flag_future_has_been_retreived();
   }

   // A view handed to callbacks; does not claim the Future slot
   Future(std::shared_ptr<shared_state_type> shared_state, const shared_state_type*)
       : shared_state_{std::move(shared_state)}
   {}

   shared_state_type& state_() const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      return *shared_state_;
   }

 public:
   using callback_type       = typename shared_state_type::callback_type;
   using result_handler_type = typename shared_state_type::result_handler_type;
   using error_handler_type  = typename shared_state_type::error_handler_type;

   ///@{ @name construction/assignment/swap
   Future() noexcept                      = default;
   Future(const Future& o)                = delete;
   Future(Future&& o) noexcept            = default;
   ~Future()                              = default;
   Future& operator=(const Future& o)     = delete;
   Future& operator=(Future&& o) noexcept = default;

   void swap(Future& o) noexcept
   {
      using std::swap;
      swap(shared_state_, o.shared_state_);
   }
   friend void swap(Future& a, Future& b) noexcept { a.swap(b); }
   ///@}

   ///@{ @name getters
   /** @brief True iff the Future is associated with some shared state. */
   bool valid() const noexcept { return shared_state_ != nullptr; }

   /** @brief True iff the result is set, and `get()` will not wait. */
   bool is_ready() const noexcept { return valid() && shared_state_->is_set(); }

   /** @brief True iff the result is an exception, which `get()` will rethrow. */
   bool has_exception() const { return state_().has_exception(); }

   /** @brief The moment the result times out; `time_point::max()` for never. */
   ticktock_type deadline() const { return state_().deadline(); }
   ///@}

   ///@{ @name wait
   /**
    * @brief Drive the event loop until the result is set.
    *
    * @exception std::future_error `no_state` if the Future is not valid.
    * @exception std::logic_error if called from inside the event loop.
    */
   void join() const { state_().join(); }

   /**
    * @brief Drive the event loop until the result is set, or `duration` passes.
    */
   template<typename Rep, typename Period>
   std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration) const
   {
      return state_().wait_for(duration);
   }

   /**
    * @brief Waits for the result, and then returns it or rethrows its exception.
    *
    * If a result handler is attached, then the value is passed through it first. If an
    * error handler is attached, then its return value replaces the exception.
    *
    * Unlike `std::future`, `get()` may be called more than once.
    */
   R get() const { return state_().get(); }
   ///@}

   ///@{ @name handlers
   /**
    * @brief Run `callback` when the result is set. Runs immediately if it already is.
    */
   void attach_callback(callback_type callback) { state_().attach_callback(std::move(callback)); }

   /** @brief Transform the value returned by `get()` */
   void attach_result_handler(result_handler_type handler)
   {
      state_().attach_result_handler(std::move(handler));
   }

   /** @brief Turn the exception rethrown by `get()` into a value */
   void attach_error_handler(error_handler_type handler)
   {
      state_().attach_error_handler(std::move(handler));
   }
   ///@}
};

// ----------------------------------------------------------------------------------------- Promise

/**
 * @ingroup async
 * @brief The producer's side of a deferred result.
 *
 * Holds the deadline. It is the producer's job to poll `step_timeout` and fail the
 * Promise when it reports expiry.
 */
template<typename R> class Promise final
{
 private:
   using shared_state_type = detail::DeferredState<R>;
   std::shared_ptr<shared_state_type> shared_state_{};

   shared_state_type& state_() const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      return *shared_state_;
   }

 public:
   Promise() noexcept = default;

   /**
    * @param loop The loop that waiting callers drive.
    * @param deadline When the result times out; `ticktock_type::max()` for never.
    */
   explicit Promise(std::shared_ptr<EventLoop> loop, ticktock_type deadline = ticktock_type::max())
       : shared_state_{std::make_shared<shared_state_type>(std::move(loop), deadline)}
   {}

   Promise(Promise&& o) noexcept            = default;
   Promise(const Promise&)                  = delete;
   ~Promise()                               = default;
   Promise& operator=(Promise&& o) noexcept = default;
   Promise& operator=(const Promise&)       = delete;

   void swap(Promise& o) noexcept
   {
      using std::swap;
      swap(shared_state_, o.shared_state_);
   }
   friend void swap(Promise& a, Promise& b) noexcept { a.swap(b); }

   bool valid() const noexcept { return shared_state_ != nullptr; }

   bool is_set() const noexcept { return valid() && shared_state_->is_set(); }

   /**
    * @brief Get the Future for this Promise. May be called once.
    *
    * @exception std::future_error `future_already_retrieved` on the second call.
    */
   Future<R> get_future()
   {
      state_(); // throws `no_state` if default constructed
      return Future<R>{shared_state_};
   }

   /** @brief true iff the deadline passed (as of `now`) and no result is set */
   bool step_timeout(ticktock_type now = tick()) const { return state_().step_timeout(now); }

   /**
    * @exception std::future_error `promise_already_satisfied` if the result is set.
    */
   void set_value(R value) { state_().set_value(std::move(value)); }

   /**
    * @exception std::future_error `promise_already_satisfied` if the result is set.
    */
   void set_exception(std::exception_ptr ex) { state_().set_exception_ptr(std::move(ex)); }

   void reset() noexcept { shared_state_.reset(); }
};

} // namespace msgrpc::async
