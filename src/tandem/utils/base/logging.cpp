
#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>

namespace tandem::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/// @private
static constexpr const char* k_env_variable = "LOG_LEVEL_OVERRIDE";

/// @private
static bool apply_level_(spdlog::logger& logger, std::string_view name) {
  const auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off && name != std::string_view{"off"})
    return false;
  logger.set_level(level);
  return true;
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, []() {
    instance = spdlog::stdout_color_mt("tandem");
    instance->set_pattern("[%Y-%m-%d %T.%e] [%^%l%$] [%t] %v");

#ifdef DEBUG_BUILD
    instance->set_level(spdlog::level::trace);
#else
    instance->set_level(spdlog::level::warn);
#endif

    const char* log_level = std::getenv(k_env_variable);
    if (log_level != nullptr && !apply_level_(*instance, log_level)) {
      instance->error("failed to set log level from environment variable {}={}", k_env_variable,
                      log_level);
    }
  });

  assert(instance);
  return *instance;
}

bool set_log_level(std::string_view level) { return apply_level_(debug_logger(), level); }

} // namespace tandem::logging
