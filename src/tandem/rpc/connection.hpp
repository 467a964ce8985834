
#pragma once

#include "tandem/rpc/message.hpp"
#include "tandem/rpc/method-registry.hpp"
#include "tandem/rpc/server-config.hpp"
#include "tandem/rpc/subscription-id-provider.hpp"
#include "tandem/rpc/subscription-sink.hpp"

#include "tandem/async/semaphore.hpp"
#include "tandem/net/transport.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace tandem::rpc {

/**
 * @ingroup rpc
 * @brief The server's end of one transport. Decodes frames, dispatches calls onto the executor,
 *        and drains subscriptions into notifications.
 *
 * At most `max_in_flight_per_connection` calls run at once; excess calls wait for a slot in
 * arrival order, and the transport keeps reading meanwhile. Responses to independent calls may
 * be written in any order.
 */
class Connection final : public net::TransportHandler,
                         public std::enable_shared_from_this<Connection> {
public:
  using ClosedCallback = std::function<void(uint64_t connection_id)>;
  using SentHandler = std::function<void(bool is_delivered)>;
  using Responder = std::function<void(std::optional<Response> response, SentHandler on_sent)>;

private:
  struct BatchCollector;
  using SubscriptionPtr = std::shared_ptr<detail::ServerSubscription>;

  const uint64_t id_;
  std::shared_ptr<const MethodRegistry> registry_;
  std::shared_ptr<net::Transport> transport_;
  const ServerConfig config_;
  boost::asio::any_io_executor executor_;
  std::shared_ptr<SubscriptionIdProvider> id_provider_;
  ClosedCallback on_closed_;
  async::CountingSemaphore slots_;

  mutable std::mutex padlock_;
  std::condition_variable tasks_cv_;
  std::size_t in_flight_tasks_{0};
  bool closed_{false};
  std::unordered_map<Id, SubscriptionPtr> subscriptions_;
  std::size_t reserved_subscriptions_{0}; //!< Includes subscriptions being set up

public:
  Connection(uint64_t id, std::shared_ptr<const MethodRegistry> registry,
             std::shared_ptr<net::Transport> transport, ServerConfig config,
             boost::asio::any_io_executor executor,
             std::shared_ptr<SubscriptionIdProvider> id_provider, ClosedCallback on_closed);

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  ~Connection() override;

  /// @brief Attaches to the transport; frames flow after this.
  void start();

  uint64_t id() const noexcept { return id_; }
  std::string peer() const { return transport_->peer(); }
  bool is_closed() const;
  std::size_t subscription_count() const;
  std::size_t in_flight() const;

  /// @brief Asks the transport to close. Teardown follows when the transport reports it.
  void close(uint16_t close_code = 1000, std::string_view reason = "");

  /**
   * @brief Closes, then blocks until every dispatched call has been answered and every
   *        subscription drainer has finished.
   *
   * An async method counts until it answers or drops its CallContext; it can poll
   * `CallContext::is_cancelled()` to stop early.
   * @note Must not be called from an executor thread the connection depends on.
   */
  void join();

  //@{ TransportHandler
  void on_receive(std::span<const std::byte> frame) override;
  void on_close(std::error_code ec) override;
  //@}

private:
  bool begin_task_();
  void end_task_();

  void handle_batch_(Batch batch);
  void finish_batch_(const std::shared_ptr<BatchCollector>& collector);

  void dispatch_(std::string method, std::optional<Json> params, std::optional<Id> id,
                 Responder respond);
  void run_call_(const std::string& method, const Json& params, const std::optional<Id>& id,
                 Responder respond);
  void subscribe_(const std::string& method, const SubscribeMethod& entry, const Json& params,
                  const std::optional<Id>& id, Responder respond);
  void unsubscribe_(const UnsubscribeMethod& entry, const Json& params,
                    const std::optional<Id>& id, Responder respond);
  void remove_subscription_(const SubscriptionPtr& subscription);

  void start_drainer_(SubscriptionPtr subscription);
  void drain_next_(SubscriptionPtr subscription);
  void on_drained_(SubscriptionPtr subscription, async::ChannelStatus status,
                   std::optional<Json> payload);
  void finish_drainer_(const SubscriptionPtr& subscription);

  Responder make_responder_();
  void send_response_(const Response& response, SentHandler on_sent);
  void send_frame_(net::BufferType&& frame, SentHandler on_sent);
};

} // namespace tandem::rpc
