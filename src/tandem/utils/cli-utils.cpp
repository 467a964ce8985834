
#include "cli-utils.hpp"

#include "base-include.hpp"

#include <cstdlib>
#include <limits>

namespace tandem::cli {
// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Get the argument after `i` from command line arguments `argc` and
 *        `argv`. `i` must be in the range `[0..argc)`. If `i+1 == argc`
 *        then an exception is thrown.
 *
 * Preconditions:
 * + `argc` and `argv` describe an array of `char *` "c" strings.
 * + `i >= 0` and `i < argc`
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`
 */
std::string safe_arg_str(int argc, char** argv, int& i) {
  Expects(argc >= 0);
  Expects(i >= 0 && i < argc);
  const std::string arg = argv[i];
  ++i;
  if (i >= argc)
    throw std::runtime_error(format("expected string after argument '{}'", arg));
  return std::string{argv[i]};
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Parse the argument (as an integer) after `i` from command line
 *        arguments `argc` and `argv`. `i` must be in the range `[0..argc)`.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as an integer.
 */
int safe_arg_int(int argc, char** argv, int& i) {
  Expects(argc >= 0);
  Expects(i >= 0 && i < argc);
  auto arg = argv[i];
  ++i;
  auto badness = (i >= argc);
  auto ret = 0;

  if (!badness) {
    char* end = nullptr;
    auto long_ret = strtol(argv[i], &end, 10);
    if (*end != '\0' or long_ret > std::numeric_limits<int>::max() or
        long_ret < std::numeric_limits<int>::lowest())
      badness = true;
    else
      ret = static_cast<int>(long_ret);
  }

  if (badness)
    throw std::runtime_error(format("expected integer after argument '{}'", arg));

  return ret;
}

// -------------------------------------------------------------- safe-arg-bytes
/**
 * @ingroup cli
 * @brief Parse a byte count after `i`, accepting an optional `K`, `M` or `G` suffix
 *        (powers of 1024), e.g., `--max-request-size 10M`.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`, or the argument is not a non-negative
 *   integer with an optional suffix.
 */
std::size_t safe_arg_bytes(int argc, char** argv, int& i) {
  Expects(argc >= 0);
  Expects(i >= 0 && i < argc);
  auto arg = argv[i];
  ++i;
  auto badness = (i >= argc) || argv[i][0] == '-';
  std::size_t ret = 0;

  if (!badness) {
    char* end = nullptr;
    const auto value = strtoull(argv[i], &end, 10);
    const bool no_digits = (end == argv[i]);
    std::size_t multiplier = 1;
    switch (*end) {
    case '\0':
      break;
    case 'k':
    case 'K':
      multiplier = 1024;
      ++end;
      break;
    case 'm':
    case 'M':
      multiplier = 1024 * 1024;
      ++end;
      break;
    case 'g':
    case 'G':
      multiplier = 1024 * 1024 * 1024;
      ++end;
      break;
    default:
      badness = true;
    }
    if (no_digits || *end != '\0' ||
        value > std::numeric_limits<std::size_t>::max() / multiplier)
      badness = true;
    else
      ret = static_cast<std::size_t>(value) * multiplier;
  }

  if (badness)
    throw std::runtime_error(format("expected byte count after argument '{}'", arg));

  return ret;
}

} // namespace tandem::cli
