
#pragma once

#include "tandem/net/transport.hpp"

#include <chrono>
#include <cstddef>
#include <string_view>

namespace tandem::net {

enum class WebsocketOperation : int {
  CONNECT,   // A (client) is initiating a connection
  HANDSHAKE, // TLS or websocket handshake
  ACCEPT,    // Accepting a new connection
  READ,      // During read operation
  WRITE,     // During a write operation
  CLOSE      // The websocket stream is being closed
};

constexpr std::string_view str(WebsocketOperation op) {
#define CASE(x)                                                                                    \
  case WebsocketOperation::x:                                                                      \
    return #x
  switch (op) {
    CASE(CONNECT);
    CASE(HANDSHAKE);
    CASE(ACCEPT);
    CASE(READ);
    CASE(WRITE);
    CASE(CLOSE);
  }
#undef CASE
  return "<unknown case>";
}

/**
 * @brief Stream settings shared by both ends of a websocket.
 */
struct WebsocketOptions {
  std::size_t read_message_max = 16 * 1024 * 1024; //!< Larger frames fail the read
  std::chrono::seconds handshake_timeout{30};
  std::chrono::seconds idle_timeout{300}; //!< Silent peers are dropped
  bool keep_alive_pings = true;           //!< Ping after half the idle timeout
};

} // namespace tandem::net
