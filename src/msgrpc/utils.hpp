#pragma once

/**
 * @defgroup msgrpc msgrpc
 */

/**
 * @defgroup msgrpc-utils Utilities
 * @ingroup msgrpc
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"
#include "utils/tick-tock.hpp"
