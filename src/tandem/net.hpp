#pragma once

/**
 * @defgroup net Transports
 * @ingroup tandem
 *
 * A Transport carries whole frames in both directions. `LocalTransport` pairs two ends in
 * process; the websocket server and `connect_websocket` carry frames over `ws://` and `wss://`.
 */

#include "net/asio-execution-context.hpp"
#include "net/buffer.hpp"
#include "net/local-transport.hpp"
#include "net/transport.hpp"
#include "net/websockets/websocket-client.hpp"
#include "net/websockets/websocket-server.hpp"
