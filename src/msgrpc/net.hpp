#pragma once

/**
 * @defgroup net Networking
 * @ingroup msgrpc
 *
 * The client side of msgpack-rpc: sessions, wire messages and transports. The
 * in-process transport serves methods to sessions in the same process, without
 * serialization.
 */

#include "net/rpc/address.hpp"
#include "net/rpc/client.hpp"
#include "net/rpc/id-generator.hpp"
#include "net/rpc/message.hpp"
#include "net/rpc/pending-calls.hpp"
#include "net/rpc/rpc-error.hpp"
#include "net/rpc/session.hpp"
#include "net/rpc/value.hpp"
#include "net/transport/in-process-transport.hpp"
#include "net/transport/transport.hpp"
