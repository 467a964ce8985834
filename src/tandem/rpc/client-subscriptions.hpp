
#pragma once

#include "tandem/rpc/error-object.hpp"
#include "tandem/rpc/id.hpp"
#include "tandem/rpc/status.hpp"

#include "tandem/async/bounded-channel.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tandem::rpc {

/// A subscription payload, or the status that ended the stream.
using SubscriptionItem = tl::expected<Json, Status>;

namespace detail {
  /**
   * @brief Client-side buffer for one subscription. Filled by the client's reader, which never
   *        blocks on it: a full buffer ends the stream.
   */
  struct ClientStream {
    const Id id;                        //!< Null for method subscriptions
    const std::string method;           //!< Unsubscribe method, or the notification method
    async::BoundedChannel<Json> channel;

    mutable std::mutex padlock_;
    std::optional<Status> terminal = {};

    ClientStream(Id id_, std::string method_, std::size_t capacity)
        : id{std::move(id_)}, method{std::move(method_)}, channel{capacity} {}

    /// @brief Ends the stream once what is buffered is consumed. The first status wins.
    void terminate(Status status) {
      {
        std::lock_guard lock{padlock_};
        if (!terminal.has_value())
          terminal = std::move(status);
      }
      channel.close();
    }

    Status terminal_status() const {
      std::lock_guard lock{padlock_};
      return terminal.value_or(Status{ecode::connection_closed, "subscription closed"});
    }
  };
} // namespace detail

/**
 * @brief The caller's end of a subscription. Destroying it (or `unsubscribe()`) ends the
 *        subscription, and tells the server so.
 */
class Subscription final {
private:
  std::shared_ptr<detail::ClientStream> stream_;
  thunk_type unsubscriber_;

public:
  Subscription() = default;
  Subscription(std::shared_ptr<detail::ClientStream> stream, thunk_type unsubscriber)
      : stream_{std::move(stream)}, unsubscriber_{std::move(unsubscriber)} {}

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;
  Subscription(Subscription&& o) noexcept
      : stream_{std::move(o.stream_)}, unsubscriber_{std::move(o.unsubscriber_)} {
    o.unsubscriber_ = nullptr;
  }
  Subscription& operator=(Subscription&& o) noexcept {
    if (this != &o) {
      unsubscribe();
      stream_ = std::move(o.stream_);
      unsubscriber_ = std::move(o.unsubscriber_);
      o.unsubscriber_ = nullptr;
    }
    return *this;
  }

  ~Subscription() { unsubscribe(); }

  bool valid() const noexcept { return stream_ != nullptr; }

  /// @brief The server's subscription id; null for a method subscription.
  Id id() const { return stream_ ? stream_->id : Id{}; }

  /// @brief Blocks for the next payload. Returns the terminal status once the stream is done.
  SubscriptionItem next();

  /// @brief As `next()`, but returns `nullopt` if nothing arrived within `duration`.
  template <typename Rep, typename Period>
  std::optional<SubscriptionItem> next_for(const std::chrono::duration<Rep, Period>& duration) {
    if (!stream_)
      return SubscriptionItem{tl::make_unexpected(Status{ecode::cancelled, "no subscription"})};
    Json payload;
    const auto status = stream_->channel.receive_for(payload, duration);
    if (status == async::ChannelStatus::TIMEOUT)
      return std::nullopt;
    if (status == async::ChannelStatus::OK)
      return SubscriptionItem{std::move(payload)};
    return SubscriptionItem{tl::make_unexpected(stream_->terminal_status())};
  }

  /// @brief Never blocks; `nullopt` if nothing is buffered.
  std::optional<SubscriptionItem> try_next();

  /// @brief Idempotent. Payloads still buffered can be read afterwards.
  void unsubscribe();
};

/**
 * @brief The client's live subscriptions, keyed by subscription id, and by method name for
 *        method subscriptions.
 */
class ClientSubscriptions {
public:
  enum class DeliveryStatus : int8_t {
    DELIVERED, //!< Buffered
    UNKNOWN,   //!< Nothing is bound
    LAGGED     //!< The buffer was full; the stream was ended and unbound
  };

  struct Delivery {
    DeliveryStatus status = DeliveryStatus::UNKNOWN;
    std::string method = {}; //!< The stream's method, when it lagged
  };

  using StreamPtr = std::shared_ptr<detail::ClientStream>;

private:
  const std::size_t capacity_;
  mutable std::mutex padlock_;
  std::unordered_map<Id, StreamPtr> by_id_;
  std::unordered_map<std::string, StreamPtr> by_method_;
  std::optional<Status> closed_status_ = {};

public:
  explicit ClientSubscriptions(std::size_t capacity) : capacity_{capacity} {}

  ClientSubscriptions(const ClientSubscriptions&) = delete;
  ClientSubscriptions& operator=(const ClientSubscriptions&) = delete;

  //@{ bind: fail if closed, or already bound
  tl::expected<StreamPtr, Status> bind(const Id& subscription_id, std::string unsubscribe_method);
  tl::expected<StreamPtr, Status> bind_method(const std::string& notification_method);
  //@}

  bool contains(const Id& subscription_id) const;

  //@{ deliver
  Delivery deliver(const Id& subscription_id, Json payload);
  Delivery deliver_method(const std::string& notification_method, Json params);
  //@}

  /// @brief Ends and unbinds the stream, e.g., when the server closed it.
  bool close_stream(const Id& subscription_id, Status terminal);
  bool close_method(const std::string& notification_method, Status terminal);

  /// @brief Ends every stream with `status`, and refuses further binding.
  std::size_t close_all(const Status& status);

  std::size_t size() const;

private:
  template <typename Map, typename Key> Delivery deliver_(Map& map, const Key& key, Json payload);
  template <typename Map, typename Key> bool close_(Map& map, const Key& key, Status terminal);
};

} // namespace tandem::rpc
