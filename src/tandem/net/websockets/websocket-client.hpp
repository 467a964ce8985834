
#pragma once

#include "websocket-session.hpp"

#include "tandem/utils.hpp"

#include <functional>
#include <memory>
#include <system_error>

namespace boost::asio {
class io_context;
}

namespace tandem::net {

struct WebsocketClientConfig {
  string host = "127.0.0.1";
  uint16_t port = 0;
  string target = "/";
  bool use_tls = false;
  bool verify_peer = true; //! TLS only
  WebsocketOptions options = {};
};

/// Called once: with the connected transport, or the error that stopped the connect.
using ConnectHandler = std::function<void(std::error_code ec, std::shared_ptr<Transport>)>;

/**
 * @brief Connect to a websocket server. The transport holds inbound frames until a handler is
 *        attached.
 */
void connect_websocket(boost::asio::io_context& io_context, const WebsocketClientConfig& config,
                       ConnectHandler on_connect);

} // namespace tandem::net
