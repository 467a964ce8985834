
#pragma once

#include "tandem/rpc/connection.hpp"
#include "tandem/rpc/method-registry.hpp"
#include "tandem/rpc/server-config.hpp"
#include "tandem/rpc/status.hpp"
#include "tandem/rpc/subscription-id-provider.hpp"

#include "tandem/net/transport.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

/**
 * @defgroup rpc JSON-RPC 2.0 Engine
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * rpc::MethodRegistry registry;
 * registry.register_method("add", [](const rpc::Json& params) -> rpc::MethodResult {
 *   return rpc::param<int>(params, 0) + rpc::param<int>(params, 1);
 * });
 * auto server = rpc::Server::make(std::move(registry), {}, context.get_executor());
 * auto connection = server->accept(transport);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace tandem::rpc {

/**
 * @ingroup rpc
 * @brief Owns the method registry, and a Connection per accepted transport.
 */
class Server : public std::enable_shared_from_this<Server> {
private:
  std::shared_ptr<const MethodRegistry> registry_;
  const ServerConfig config_;
  boost::asio::any_io_executor executor_;
  std::shared_ptr<SubscriptionIdProvider> id_provider_;
  std::atomic<uint64_t> next_connection_id_{1};

  mutable std::mutex padlock_;
  std::unordered_map<uint64_t, std::shared_ptr<Connection>> connections_;
  bool is_shutdown_{false};

  struct PrivateToken {};

public:
  Server(PrivateToken, MethodRegistry registry, ServerConfig config,
         boost::asio::any_io_executor executor,
         std::shared_ptr<SubscriptionIdProvider> id_provider);

  static std::shared_ptr<Server> make(MethodRegistry registry, ServerConfig config,
                                      boost::asio::any_io_executor executor,
                                      std::shared_ptr<SubscriptionIdProvider> id_provider = nullptr);

  /**
   * @brief Serves `transport` on a new connection.
   *
   * Refuses with `ecode::resource_exceeded` once `max_connections` are open, closing the
   * transport with 1013 "Server is busy, try again later".
   */
  tl::expected<std::shared_ptr<Connection>, Status>
  accept(std::shared_ptr<net::Transport> transport);

  /// @brief Refuses new transports, closes every connection, and joins them.
  void shutdown();

  std::size_t connection_count() const;
  const ServerConfig& config() const noexcept { return config_; }
  const MethodRegistry& registry() const noexcept { return *registry_; }

private:
  void on_connection_closed_(uint64_t connection_id);
};

} // namespace tandem::rpc
