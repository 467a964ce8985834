
#pragma once

/**
 * @defgroup async Async
 * @ingroup tandem
 */

#include "async/bounded-channel.hpp"
#include "async/future.hpp"
#include "async/semaphore.hpp"
