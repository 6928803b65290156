#pragma once

#include <chrono>

/**
 * @defgroup tick-tock Timing Functions
 * @ingroup msgrpc-utils
 */

namespace msgrpc {
/// @brief Type used by the `tick()` and `tock()` functions.
using ticktock_type = std::chrono::time_point<std::chrono::steady_clock>;

// ------------------------------------------------------------------------ tick
/**
 * @ingroup tick-tock
 * @brief Reads a `std::chrono::steady_clock`.
 */
inline ticktock_type tick() { return std::chrono::steady_clock::now(); }

// ------------------------------------------------------------------------ tock
/**
 * @ingroup tick-tock
 * @brief Returns the elapsed seconds -- as a `double` -- since `whence`.
 */
inline double tock(const ticktock_type& whence) {
  using ss = std::chrono::duration<double, std::ratio<1, 1>>;
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<ss>(now - whence).count();
}

// -------------------------------------------------------------------- deadline
/**
 * @ingroup tick-tock
 * @brief The moment `timeout` elapses, counting from `whence`.
 *
 * A zero (or negative) timeout means "never", and yields `time_point::max()`.
 */
template <typename Rep, typename Period>
inline ticktock_type deadline_after(const std::chrono::duration<Rep, Period>& timeout,
                                    const ticktock_type& whence = tick()) {
  if (timeout <= std::chrono::duration<Rep, Period>::zero())
    return ticktock_type::max();
  const auto remaining = ticktock_type::max() - whence;
  const auto step = std::chrono::duration_cast<ticktock_type::duration>(timeout);
  return (step >= remaining) ? ticktock_type::max() : whence + step;
}

} // namespace msgrpc
