
#pragma once

#include "tandem/rpc/error-object.hpp"
#include "tandem/rpc/id.hpp"

#include "tandem/async/bounded-channel.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tandem::rpc {

namespace detail {
  /**
   * @brief A live server-side subscription. The producer pushes into `channel`; the owning
   *        connection drains it into notifications.
   */
  struct ServerSubscription {
    enum class State : int8_t {
      ACTIVE,  //!< Accepting payloads
      CLOSING, //!< The producer is done; the drainer flushes what is queued
      CLOSED   //!< Unsubscribed, or torn down; nothing more is sent
    };

    const Id id;
    const std::string subscribe_method;
    const std::string notification_method;
    async::BoundedChannel<Json> channel;

    mutable std::mutex padlock_;
    State state = State::ACTIVE;
    std::optional<ErrorObject> close_reason = {};

    ServerSubscription(Id id_, std::string subscribe_method_, std::string notification_method_,
                       std::size_t capacity)
        : id{std::move(id_)}, subscribe_method{std::move(subscribe_method_)},
          notification_method{std::move(notification_method_)}, channel{capacity} {}

    /// @brief Stops the subscription, releasing a blocked producer with `CLOSED`.
    void abort() {
      {
        std::lock_guard lock{padlock_};
        state = State::CLOSED;
      }
      channel.abort();
    }

    State load_state() const {
      std::lock_guard lock{padlock_};
      return state;
    }
  };
} // namespace detail

/**
 * @brief The producer's end of a subscription. Copies share one subscription.
 *
 * Sending blocks while the subscription's queue is full, and returns `CLOSED` once the client
 * unsubscribed or the connection went away.
 */
class SubscriptionSink {
private:
  std::shared_ptr<detail::ServerSubscription> subscription_;

public:
  explicit SubscriptionSink(std::shared_ptr<detail::ServerSubscription> subscription)
      : subscription_{std::move(subscription)} {}

  const Id& subscription_id() const noexcept { return subscription_->id; }
  const std::string& notification_method() const noexcept {
    return subscription_->notification_method;
  }

  async::ChannelStatus send(Json payload) { return subscription_->channel.send(std::move(payload)); }

  template <typename Rep, typename Period>
  async::ChannelStatus send_for(Json payload, const std::chrono::duration<Rep, Period>& duration) {
    return subscription_->channel.send_for(std::move(payload), duration);
  }

  async::ChannelStatus try_send(Json payload) {
    return subscription_->channel.try_send(std::move(payload));
  }

  bool is_closed() const { return subscription_->channel.is_closed(); }

  /**
   * @brief The producer is finished. Queued payloads are still delivered, then the client is
   *        sent a closing notification carrying `reason` (or "Subscription closed").
   */
  void close(std::optional<ErrorObject> reason = std::nullopt);
};

} // namespace tandem::rpc
