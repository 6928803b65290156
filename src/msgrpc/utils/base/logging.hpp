#pragma once

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL 1
#endif
#include "spdlog/spdlog.h"

#include <exception>
#include <string_view>
#include <system_error>
#include <utility>

#include <tl/expected.hpp>

/**
 * @defgroup logging Logging
 * @ingroup msgrpc-utils
 *
 * @see https://github.com/gabime/spdlog
 *
 * A thin layer over `spdlog`. There is exactly one logger, named "msgrpc",
 * created lazily by `debug_logger()` and writing to stdout. A logger of the
 * same name registered with spdlog beforehand (say, by a host application
 * that wants a file sink) is adopted instead.
 *
 * The level defaults to `trace` in debug builds and `warn` otherwise. The
 * environment variable `LOG_LEVEL_OVERRIDE` wins over both.
 */

namespace msgrpc::logging
{
using logger_type = spdlog::logger;

enum class LogLevel : int { TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF };

logger_type& debug_logger();

/// @brief Parse an spdlog level name ("trace", "warn", "off", ...).
tl::expected<LogLevel, std::error_code> parse_log_level(std::string_view name);

void set_log_level(LogLevel level);
LogLevel log_level();

namespace detail
{
   constexpr spdlog::level::level_enum to_spdlog(LogLevel level)
   {
      switch(level) {
      case LogLevel::TRACE: return spdlog::level::trace;
      case LogLevel::DEBUG: return spdlog::level::debug;
      case LogLevel::INFO: return spdlog::level::info;
      case LogLevel::WARN: return spdlog::level::warn;
      case LogLevel::ERROR: return spdlog::level::err;
      case LogLevel::FATAL: return spdlog::level::critical;
      case LogLevel::OFF: return spdlog::level::off;
      }
      return spdlog::level::off;
   }
} // namespace detail

template<typename... Args>
inline void log_at(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args)
{
   auto& logger = debug_logger();
   logger.log(detail::to_spdlog(level), fmt, std::forward<Args>(args)...);
   if(level == LogLevel::FATAL) {
      logger.flush();
      std::terminate();
   }
}

} // namespace msgrpc::logging

#if defined __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#elif defined __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wvariadic-macros"
#endif

#define MSGRPC_LOG_AT_(level, fmt, ...)                                                            \
  ::msgrpc::logging::log_at(level, "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                 \
                            __LINE__ __VA_OPT__(, ) __VA_ARGS__)

#ifdef DEBUG_BUILD
#define TRACE(fmt, ...) MSGRPC_LOG_AT_(::msgrpc::logging::LogLevel::TRACE, fmt, __VA_ARGS__)
#define LOG_DEBUG(fmt, ...) MSGRPC_LOG_AT_(::msgrpc::logging::LogLevel::DEBUG, fmt, __VA_ARGS__)
#else
#define TRACE(fmt, ...)
#define LOG_DEBUG(fmt, ...)
#endif

#define INFO(fmt, ...) MSGRPC_LOG_AT_(::msgrpc::logging::LogLevel::INFO, fmt, __VA_ARGS__)
#define WARN(fmt, ...) MSGRPC_LOG_AT_(::msgrpc::logging::LogLevel::WARN, fmt, __VA_ARGS__)
#define LOG_ERR(fmt, ...) MSGRPC_LOG_AT_(::msgrpc::logging::LogLevel::ERROR, fmt, __VA_ARGS__)
#define FATAL(fmt, ...) MSGRPC_LOG_AT_(::msgrpc::logging::LogLevel::FATAL, fmt, __VA_ARGS__)

#if defined __clang__
#pragma clang diagnostic pop
#elif defined __GNUC__
#pragma GCC diagnostic pop
#endif
