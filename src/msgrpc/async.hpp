#pragma once

/**
 * @defgroup async Async
 * @ingroup msgrpc
 */

#include "async/deferred-result.hpp"
#include "async/event-loop.hpp"
