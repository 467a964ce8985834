#pragma once

// Included first by every tandem translation unit, through `stdinc.hpp`.

#include <tl/expected.hpp>

#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

#include <fmt/format.h>

#include "base/logging.hpp"

#include <algorithm>
#include <compare>
#include <functional>
#include <memory>

#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <system_error>

namespace tandem {

using fmt::format;

using thunk_type = std::function<void()>;

using std::string;
using std::string_view;

using std::shared_ptr;
using std::weak_ptr;

using std::begin;
using std::cbegin;
using std::cend;
using std::end;

using std::error_code;

} // namespace tandem

#if defined(__clang__) || defined(__GNUC__)
#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)
#else
#define likely(x) (!!(x))
#define unlikely(x) (!!(x))
#endif

// ----------------------------------------------------------------------------------------- Logging

// `fmt` must be a string literal: it is pasted into a compile-time format string.
#define TANDEM_LOG_AT_(log_fn, fmt, ...)                                                           \
  {                                                                                                \
    using namespace ::tandem::logging::detail;                                                     \
    ::tandem::logging::log_fn(::tandem::logging::debug_logger(),                                   \
                              "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,               \
                              __LINE__ __VA_OPT__(, ) __VA_ARGS__);                                \
  }

#ifdef DEBUG_BUILD
#define TRACE(fmt, ...) TANDEM_LOG_AT_(log_trace, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_DEBUG(fmt, ...) TANDEM_LOG_AT_(log_debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define TRACE(fmt, ...)
#define LOG_DEBUG(fmt, ...)
#endif

#define INFO(fmt, ...) TANDEM_LOG_AT_(log_info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define WARN(fmt, ...) TANDEM_LOG_AT_(log_warn, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_ERR(fmt, ...) TANDEM_LOG_AT_(log_error, fmt __VA_OPT__(, ) __VA_ARGS__)
#define FATAL(fmt, ...) TANDEM_LOG_AT_(log_fatal, fmt __VA_OPT__(, ) __VA_ARGS__)

#ifdef Expects
#undef Expects
#endif
#ifdef NDEBUG
#define Expects(condition)
#else
#define Expects(condition)                                                                         \
  do {                                                                                             \
    if (!likely(condition))                                                                        \
      FATAL("precondition failed: {}", #condition);                                                \
  } while (0)
#endif
