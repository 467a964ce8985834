
#pragma once

#include "tandem/net/buffer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace tandem::net {

/**
 * @brief The inbound side of a transport. Implemented by the rpc Connection (server) and
 *        Client.
 * @note Callbacks may arrive on any executor thread, but never concurrently for one transport.
 */
class TransportHandler {
public:
  virtual ~TransportHandler() = default;

  /**
   * @brief A complete frame arrived. `frame` must be consumed immediately, because the
   *        underlying buffer will be reused.
   */
  virtual void on_receive(std::span<const std::byte> frame) = 0;

  /**
   * @brief The transport is closed, for any reason. Delivered exactly once, and no
   *        `on_receive` follows it.
   */
  virtual void on_close(std::error_code ec) = 0;
};

/// Reports the outcome of writing one frame.
using SendCompletion = std::function<void(std::error_code)>;

/**
 * @brief A framed, bidirectional, persistent connection.
 *
 * Frames are written in the order `send_message` is called. Nothing is delivered to the
 * handler until `attach` is called; frames that arrived earlier are held until then.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /// @brief Sets the inbound handler. Called once.
  virtual void attach(std::weak_ptr<TransportHandler> handler) = 0;

  /**
   * @brief Queues a frame for writing.
   * @param completion If set, called once with the write outcome. Never called inline.
   */
  virtual void send_message(BufferType&& frame, SendCompletion completion = nullptr) = 0;

  /**
   * @brief Close the endpoint.
   * @param close_code sent to the peer, where the transport has a notion of one.
   * @see https://datatracker.ietf.org/doc/html/rfc6455#section-7.1.2
   */
  virtual void close(uint16_t close_code = 1000, std::string_view reason = "") = 0;

  virtual bool is_open() const = 0;

  /// @brief Human readable name of the remote end, for logging.
  virtual std::string peer() const = 0;
};

} // namespace tandem::net
