
#include "stdinc.hpp"

#include "client-subscriptions.hpp"

namespace tandem::rpc {

// ------------------------------------------------------------------------------------ Subscription

SubscriptionItem Subscription::next() {
  if (!stream_)
    return tl::make_unexpected(Status{ecode::cancelled, "no subscription"});
  Json payload;
  if (stream_->channel.receive(payload) == async::ChannelStatus::OK)
    return payload;
  return tl::make_unexpected(stream_->terminal_status());
}

std::optional<SubscriptionItem> Subscription::try_next() {
  if (!stream_)
    return SubscriptionItem{tl::make_unexpected(Status{ecode::cancelled, "no subscription"})};
  Json payload;
  const auto status = stream_->channel.try_receive(payload);
  if (status == async::ChannelStatus::EMPTY)
    return std::nullopt;
  if (status == async::ChannelStatus::OK)
    return SubscriptionItem{std::move(payload)};
  return SubscriptionItem{tl::make_unexpected(stream_->terminal_status())};
}

void Subscription::unsubscribe() {
  auto unsubscriber = std::move(unsubscriber_);
  unsubscriber_ = nullptr;
  if (unsubscriber)
    unsubscriber();
}

// ----------------------------------------------------------------------------- ClientSubscriptions

tl::expected<ClientSubscriptions::StreamPtr, Status>
ClientSubscriptions::bind(const Id& subscription_id, std::string unsubscribe_method) {
  std::lock_guard lock{padlock_};
  if (closed_status_.has_value())
    return tl::make_unexpected(*closed_status_);
  if (by_id_.count(subscription_id) > 0)
    return tl::make_unexpected(Status{
        ecode::invalid_request, format("subscription {} is already bound", subscription_id.to_string())});
  auto stream =
      std::make_shared<detail::ClientStream>(subscription_id, std::move(unsubscribe_method), capacity_);
  by_id_.emplace(subscription_id, stream);
  return stream;
}

tl::expected<ClientSubscriptions::StreamPtr, Status>
ClientSubscriptions::bind_method(const std::string& notification_method) {
  std::lock_guard lock{padlock_};
  if (closed_status_.has_value())
    return tl::make_unexpected(*closed_status_);
  if (by_method_.count(notification_method) > 0)
    return tl::make_unexpected(Status{
        ecode::invalid_request, format("method '{}' is already subscribed", notification_method)});
  auto stream = std::make_shared<detail::ClientStream>(Id{}, notification_method, capacity_);
  by_method_.emplace(notification_method, stream);
  return stream;
}

bool ClientSubscriptions::contains(const Id& subscription_id) const {
  std::lock_guard lock{padlock_};
  return by_id_.count(subscription_id) > 0;
}

template <typename Map, typename Key>
ClientSubscriptions::Delivery ClientSubscriptions::deliver_(Map& map, const Key& key,
                                                            Json payload) {
  StreamPtr stream;
  {
    std::lock_guard lock{padlock_};
    auto ii = map.find(key);
    if (ii == map.end())
      return {};
    stream = ii->second;
  }

  const auto status = stream->channel.try_send(std::move(payload));
  if (status == async::ChannelStatus::OK)
    return {DeliveryStatus::DELIVERED, {}};
  if (status != async::ChannelStatus::FULL)
    return {};

  // The consumer fell behind; the stream cannot be resumed
  {
    std::lock_guard lock{padlock_};
    auto ii = map.find(key);
    if (ii != map.end() && ii->second == stream)
      map.erase(ii);
  }
  stream->terminate(Status{ecode::resource_exceeded,
                           format("subscription lagged: buffer of {} is full", capacity_)});
  return {DeliveryStatus::LAGGED, stream->method};
}

template <typename Map, typename Key>
bool ClientSubscriptions::close_(Map& map, const Key& key, Status terminal) {
  StreamPtr stream;
  {
    std::lock_guard lock{padlock_};
    auto ii = map.find(key);
    if (ii == map.end())
      return false;
    stream = std::move(ii->second);
    map.erase(ii);
  }
  stream->terminate(std::move(terminal));
  return true;
}

ClientSubscriptions::Delivery ClientSubscriptions::deliver(const Id& subscription_id,
                                                           Json payload) {
  return deliver_(by_id_, subscription_id, std::move(payload));
}

ClientSubscriptions::Delivery
ClientSubscriptions::deliver_method(const std::string& notification_method, Json params) {
  return deliver_(by_method_, notification_method, std::move(params));
}

bool ClientSubscriptions::close_stream(const Id& subscription_id, Status terminal) {
  return close_(by_id_, subscription_id, std::move(terminal));
}

bool ClientSubscriptions::close_method(const std::string& notification_method, Status terminal) {
  return close_(by_method_, notification_method, std::move(terminal));
}

std::size_t ClientSubscriptions::close_all(const Status& status) {
  decltype(by_id_) by_id;
  decltype(by_method_) by_method;
  {
    std::lock_guard lock{padlock_};
    if (!closed_status_.has_value())
      closed_status_ = status;
    by_id.swap(by_id_);
    by_method.swap(by_method_);
  }
  for (auto& [id, stream] : by_id)
    stream->terminate(status);
  for (auto& [method, stream] : by_method)
    stream->terminate(status);
  return by_id.size() + by_method.size();
}

std::size_t ClientSubscriptions::size() const {
  std::lock_guard lock{padlock_};
  return by_id_.size() + by_method_.size();
}

} // namespace tandem::rpc
