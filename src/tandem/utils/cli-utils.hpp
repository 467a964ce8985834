
#pragma once

#include <cstdint>
#include <string>

/**
 * @defgroup cli Command Line Utils
 * @ingroup tandem-utils
 *
 * The `tandem` method for parsing command-line arguments.
 */

namespace tandem::cli {
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);
std::size_t safe_arg_bytes(int argc, char** argv, int& i);

} // namespace tandem::cli
