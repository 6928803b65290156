#include "logging.hpp"

#include "msgrpc/utils/error-codes.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>

namespace msgrpc::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/// @private
static constexpr const char* k_logger_name = "msgrpc";

/// @private
static void apply_environment_override(spdlog::logger& logger) {
  const char* env_variable = "LOG_LEVEL_OVERRIDE";
  const char* value = std::getenv(env_variable);
  if (value == nullptr)
    return;
  auto level = parse_log_level(value);
  if (!level) {
    logger.error("failed to set log level from environment variable {}={}", env_variable, value);
    return;
  }
  logger.set_level(detail::to_spdlog(*level));
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, []() {
    instance = spdlog::get(k_logger_name);
    if (!instance) {
      instance = spdlog::stdout_color_mt(k_logger_name);
      instance->set_pattern("[%Y-%m-%d %T] [%^%l%$] %v");
#ifdef DEBUG_BUILD
      instance->set_level(spdlog::level::trace);
#else
      instance->set_level(spdlog::level::warn);
#endif
    }
    apply_environment_override(*instance);
  });

  assert(instance);
  return *instance;
}

tl::expected<LogLevel, std::error_code> parse_log_level(std::string_view name) {
  const auto level = spdlog::level::from_str(std::string{name});
  switch (level) {
  case spdlog::level::trace: return LogLevel::TRACE;
  case spdlog::level::debug: return LogLevel::DEBUG;
  case spdlog::level::info: return LogLevel::INFO;
  case spdlog::level::warn: return LogLevel::WARN;
  case spdlog::level::err: return LogLevel::ERROR;
  case spdlog::level::critical: return LogLevel::FATAL;
  default: break;
  }
  // spdlog maps every unknown name to `off`
  if (name == "off")
    return LogLevel::OFF;
  return tl::make_unexpected(make_error_code(ecode::argument_error));
}

void set_log_level(LogLevel level) { debug_logger().set_level(detail::to_spdlog(level)); }

LogLevel log_level() {
  switch (debug_logger().level()) {
  case spdlog::level::trace: return LogLevel::TRACE;
  case spdlog::level::debug: return LogLevel::DEBUG;
  case spdlog::level::info: return LogLevel::INFO;
  case spdlog::level::warn: return LogLevel::WARN;
  case spdlog::level::err: return LogLevel::ERROR;
  case spdlog::level::critical: return LogLevel::FATAL;
  default: return LogLevel::OFF;
  }
}

} // namespace msgrpc::logging
