
#pragma once

#include "websocket-session.hpp"

#include "tandem/utils.hpp"

#include <functional>
#include <memory>

namespace boost::asio {
class io_context;
}

namespace tandem::net {

// --------------------------------------------------------------------------------- WebsocketServer

/**
 * @brief Listens for websocket peers, and offers each one to `acceptor` as a Transport.
 *
 * Serves `wss://` when a certificate chain is configured, and `ws://` otherwise. Reading starts
 * once the acceptor attaches a handler.
 */
class WebsocketServer {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  struct Config {
    string address = "0.0.0.0";         //! Listen address
    uint16_t port = 0;                  //! Listen port; 0 picks a free one
    string dh_file = {};                //! For key-exchange (optional)
    string certificate_chain_file = {}; //! Server certificate; enables TLS
    string private_key_file = {};       //! Private key
    WebsocketOptions options = {};

    /**
     * @brief Takes ownership of a new transport. Return FALSE to refuse it; a refused
     *        transport that is still open is closed with 1013.
     * @note Must be set, and must not throw.
     */
    std::function<bool(std::shared_ptr<Transport>)> acceptor;
  };

  /**
   * Exceptions
   * + std::bad_alloc
   * + boost::system::system_error When the TLS files cannot be loaded
   */
  WebsocketServer(boost::asio::io_context& io_context, const Config& config);
  WebsocketServer(const WebsocketServer&) = delete;
  WebsocketServer(WebsocketServer&&) = default;
  ~WebsocketServer();
  WebsocketServer& operator=(const WebsocketServer&) = delete;
  WebsocketServer& operator=(WebsocketServer&&) = default;

  /**
   * @brief Start listening on the configured port.
   */
  std::error_code run();

  /// @brief The bound port; useful when configured with port 0.
  uint16_t port() const;

  /**
   * @brief Stops listening, and closes every session with 1001.
   */
  void shutdown();
};

} // namespace tandem::net
