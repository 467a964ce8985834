
#pragma once

#include "tandem/net/transport.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <utility>

namespace tandem::net {

namespace detail {
  struct LocalLink;
}

/**
 * @brief One end of an in-process transport pair. Each end delivers inbound frames on its own
 *        strand, in send order. Closing either end closes both; each end's handler sees
 *        `on_close(ecode::connection_closed)` after every frame sent before the close.
 */
class LocalTransport final : public Transport {
private:
  std::shared_ptr<detail::LocalLink> link_;
  int side_;
  std::string name_;

public:
  LocalTransport(std::shared_ptr<detail::LocalLink> link, int side);
  ~LocalTransport() override;

  /**
   * @brief Make a connected pair of transports, whose strands run on `executor`.
   * @return `{first, second}`, e.g., `{client-end, server-end}`.
   */
  static std::pair<std::shared_ptr<LocalTransport>, std::shared_ptr<LocalTransport>>
  make_pair(boost::asio::any_io_executor executor);

  void attach(std::weak_ptr<TransportHandler> handler) override;
  void send_message(BufferType&& frame, SendCompletion completion = nullptr) override;
  void close(uint16_t close_code = 1000, std::string_view reason = "") override;
  bool is_open() const override;
  std::string peer() const override;
};

} // namespace tandem::net
