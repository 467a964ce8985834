
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

/**
 * @defgroup tandem-strings Strings
 * @ingroup tandem-utils
 */
namespace tandem {
// -------------------------------------------------------------------- Truncate

/**
 * @ingroup tandem-strings
 * @brief Copies at most `max_length` characters of `s`. When `s` was longer, the result ends in
 *        `...` followed by the original length, e.g., `{"jsonrpc":"2.0",... (4182 bytes)`.
 */
std::string truncate(std::string_view s, std::size_t max_length);

/// @ingroup tandem-strings
std::string truncate(std::span<const std::byte> data, std::size_t max_length);

// ------------------------------------------------- Pretty Printing binary data

/**
 * @ingroup tandem-strings
 * @brief The raw hex string of `data`, as if via the shell command `xxd`
 */
std::string str(const void* data, std::size_t sz);
std::string str(std::span<const std::byte> data);

} // namespace tandem
