
#include "stdinc.hpp"

#include "server.hpp"

namespace tandem::rpc {

Server::Server(PrivateToken, MethodRegistry registry, ServerConfig config,
               boost::asio::any_io_executor executor,
               std::shared_ptr<SubscriptionIdProvider> id_provider)
    : registry_{std::make_shared<const MethodRegistry>(std::move(registry))},
      config_{std::move(config)}, executor_{std::move(executor)},
      id_provider_{id_provider ? std::move(id_provider) : default_subscription_id_provider()} {}

std::shared_ptr<Server> Server::make(MethodRegistry registry, ServerConfig config,
                                     boost::asio::any_io_executor executor,
                                     std::shared_ptr<SubscriptionIdProvider> id_provider) {
  INFO("rpc server with {} methods, max {} connections", registry.size(),
       config.max_connections);
  return std::make_shared<Server>(PrivateToken{}, std::move(registry), std::move(config),
                                  std::move(executor), std::move(id_provider));
}

tl::expected<std::shared_ptr<Connection>, Status>
Server::accept(std::shared_ptr<net::Transport> transport) {
  Expects(transport != nullptr);

  std::shared_ptr<Connection> connection;
  std::optional<Status> refusal;
  {
    std::lock_guard lock{padlock_};
    if (is_shutdown_) {
      refusal = Status{ecode::connection_closed, "server is shutting down"};
    } else if (connections_.size() >= config_.max_connections) {
      refusal = Status{ecode::resource_exceeded, "Server is busy, try again later",
                       server_is_busy()};
    } else {
      const auto connection_id = next_connection_id_++;
      connection = std::make_shared<Connection>(
          connection_id, registry_, transport, config_, executor_, id_provider_,
          [weak = weak_from_this()](uint64_t id) {
            if (auto self = weak.lock())
              self->on_connection_closed_(id);
          });
      connections_.emplace(connection_id, connection);
    }
  }

  if (refusal.has_value()) {
    WARN("refusing {}: {}", transport->peer(), refusal->to_string());
    if (refusal->code() == ecode::resource_exceeded)
      transport->close(1013, "Server is busy, try again later");
    else
      transport->close(1001, "going away");
    return tl::make_unexpected(std::move(*refusal));
  }

  INFO("accepted {} as connection #{}", transport->peer(), connection->id());
  connection->start();
  return connection;
}

void Server::shutdown() {
  decltype(connections_) connections;
  {
    std::lock_guard lock{padlock_};
    is_shutdown_ = true;
    connections = connections_;
  }
  INFO("rpc server shutting down, {} connections", connections.size());
  for (auto& [id, connection] : connections)
    connection->join();
}

std::size_t Server::connection_count() const {
  std::lock_guard lock{padlock_};
  return connections_.size();
}

void Server::on_connection_closed_(uint64_t connection_id) {
  std::shared_ptr<Connection> connection; // released outside the lock
  {
    std::lock_guard lock{padlock_};
    auto ii = connections_.find(connection_id);
    if (ii == connections_.end())
      return;
    connection = std::move(ii->second);
    connections_.erase(ii);
  }
  LOG_DEBUG("connection #{} removed", connection_id);
}

} // namespace tandem::rpc
