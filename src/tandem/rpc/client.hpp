
#pragma once

#include "tandem/rpc/client-config.hpp"
#include "tandem/rpc/client-subscriptions.hpp"
#include "tandem/rpc/id-allocator.hpp"
#include "tandem/rpc/message.hpp"
#include "tandem/rpc/pending-call.hpp"
#include "tandem/rpc/pending-calls.hpp"
#include "tandem/rpc/status.hpp"

#include "tandem/async/semaphore.hpp"
#include "tandem/net/asio-execution-context.hpp"
#include "tandem/net/transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tandem::rpc {

/**
 * @brief Collects the members of a batch. Notifications are sent, but get no result.
 */
class BatchRequestBuilder {
public:
  struct Entry {
    std::string method;
    std::optional<Json> params;
    bool is_notification = false;
  };

private:
  std::vector<Entry> entries_;

public:
  BatchRequestBuilder& insert(std::string method, std::optional<Json> params = std::nullopt) {
    entries_.push_back({std::move(method), std::move(params), false});
    return *this;
  }

  BatchRequestBuilder& insert_notification(std::string method,
                                           std::optional<Json> params = std::nullopt) {
    entries_.push_back({std::move(method), std::move(params), true});
    return *this;
  }

  const std::vector<Entry>& entries() const noexcept { return entries_; }
  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }

  std::size_t request_count() const {
    return std::size_t(std::count_if(cbegin(entries_), cend(entries_),
                                     [](const auto& entry) { return !entry.is_notification; }));
  }
};

/// @brief Results of a batch, in the order the requests were inserted.
struct BatchResponse {
  std::vector<tl::expected<Json, Status>> results = {};
  std::size_t num_successful = 0;
  std::size_t num_failed = 0;
};

/**
 * @ingroup rpc
 * @brief The calling side of a transport: requests, notifications, batches and subscriptions.
 *
 * Every call completes exactly once: with the result, the server's error object
 * (`ecode::call_error`), `ecode::timeout`, or `ecode::connection_closed` when the transport
 * goes away.
 */
class Client final : public net::TransportHandler, public std::enable_shared_from_this<Client> {
public:
  using CompletionHandler = std::function<void(tl::expected<Json, Status>)>;

private:
  struct PrivateToken {};

  std::shared_ptr<net::Transport> transport_;
  const ClientConfig config_;
  RequestIdManager ids_;
  std::shared_ptr<PendingCallTable> pending_;
  ClientSubscriptions subscriptions_;
  std::unique_ptr<async::CountingSemaphore> request_slots_;
  std::atomic<bool> is_closed_{false};

public:
  Client(PrivateToken, std::shared_ptr<net::Transport> transport,
         net::SteadyTimerFactory timer_factory, ClientConfig config);

  /// @brief A client attached to `transport`. Deadlines are timed with `timer_factory`.
  static std::shared_ptr<Client> make(std::shared_ptr<net::Transport> transport,
                                      net::SteadyTimerFactory timer_factory,
                                      ClientConfig config = {});

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;
  ~Client() override;

  /**
   * @brief Sends a request. `completion` runs once, on the thread that resolves the call; it
   *        runs inline if the call fails before it is sent.
   * @return The request id.
   */
  Id call(std::string method, std::optional<Json> params, CompletionHandler completion,
          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  PendingCall<Json> request(std::string method, std::optional<Json> params = std::nullopt,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /// @brief Fire and forget.
  Status notification(std::string method, std::optional<Json> params = std::nullopt);

  /**
   * @brief Sends every member of `batch` in one frame. Completes once every request has an
   *        outcome; a member that times out counts as failed.
   */
  PendingCall<BatchResponse>
  batch_request(const BatchRequestBuilder& batch,
                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /**
   * @brief Calls `subscribe_method`; on success the returned Subscription receives the
   *        server's notifications. Dropping it calls `unsubscribe_method`.
   */
  PendingCall<Subscription>
  subscribe(std::string subscribe_method, std::optional<Json> params,
            std::string unsubscribe_method,
            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /// @brief Receives the `params` of every plain notification called `notification_method`.
  tl::expected<Subscription, Status> subscribe_to_method(std::string notification_method);

  void close(uint16_t close_code = 1000, std::string_view reason = "");
  bool is_connected() const;
  std::size_t pending_count() const { return pending_->size(); }
  std::size_t subscription_count() const { return subscriptions_.size(); }
  const ClientConfig& config() const noexcept { return config_; }

  //@{ TransportHandler
  void on_receive(std::span<const std::byte> frame) override;
  void on_close(std::error_code ec) override;
  //@}

private:
  Id call_(std::string method, std::optional<Json> params, CompletionHandler completion,
           std::optional<std::chrono::milliseconds> timeout, bool takes_slot);
  tl::expected<net::BufferType, Status> encode_request_(const Message& message) const;
  thunk_type acquire_slot_();
  void send_registered_(const std::vector<Id>& ids, net::BufferType&& frame);

  void handle_response_(Response response);
  void handle_notification_(Notification notification);
  void handle_request_(const Request& request);

  thunk_type make_unsubscriber_(Id subscription_id, std::string unsubscribe_method);
  void unsubscribe_(const Id& subscription_id, const std::string& unsubscribe_method,
                    Status terminal);
};

} // namespace tandem::rpc
