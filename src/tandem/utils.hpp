#pragma once

/**
 * @defgroup tandem Tandem
 */

/**
 * @defgroup tandem-utils Utilities
 * @ingroup tandem
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
#include "utils/string-utils.hpp"
