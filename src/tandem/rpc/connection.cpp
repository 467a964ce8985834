
#include "stdinc.hpp"

#include "connection.hpp"

#include "call-context.hpp"

#include <boost/asio/post.hpp>

namespace tandem::rpc {

struct Connection::BatchCollector {
  std::mutex padlock_;
  Json responses = Json::array();
  std::vector<SentHandler> on_sent;
  std::size_t remaining = 0;
};

// ------------------------------------------------------------------------------------ construction

Connection::Connection(uint64_t id, std::shared_ptr<const MethodRegistry> registry,
                       std::shared_ptr<net::Transport> transport, ServerConfig config,
                       boost::asio::any_io_executor executor,
                       std::shared_ptr<SubscriptionIdProvider> id_provider,
                       ClosedCallback on_closed)
    : id_{id}, registry_{std::move(registry)}, transport_{std::move(transport)},
      config_{std::move(config)}, executor_{std::move(executor)},
      id_provider_{std::move(id_provider)}, on_closed_{std::move(on_closed)},
      slots_{static_cast<int64_t>(std::max<std::size_t>(1, config_.max_in_flight_per_connection))} {
  Expects(registry_ != nullptr);
  Expects(transport_ != nullptr);
  if (id_provider_ == nullptr)
    id_provider_ = default_subscription_id_provider();
}

Connection::~Connection() { TRACE("connection #{} destroyed", id_); }

void Connection::start() {
  TRACE("connection #{} started, peer {}", id_, peer());
  transport_->attach(weak_from_this());
}

// ----------------------------------------------------------------------------------------- getters

bool Connection::is_closed() const {
  std::lock_guard lock{padlock_};
  return closed_;
}

std::size_t Connection::subscription_count() const {
  std::lock_guard lock{padlock_};
  return subscriptions_.size();
}

std::size_t Connection::in_flight() const {
  std::lock_guard lock{padlock_};
  return in_flight_tasks_;
}

// -------------------------------------------------------------------------------------- close/join

void Connection::close(uint16_t close_code, std::string_view reason) {
  transport_->close(close_code, reason);
}

void Connection::join() {
  close(1001, "going away");
  std::unique_lock lock{padlock_};
  tasks_cv_.wait(lock, [this]() { return closed_ && in_flight_tasks_ == 0; });
}

bool Connection::begin_task_() {
  std::lock_guard lock{padlock_};
  if (closed_)
    return false;
  ++in_flight_tasks_;
  return true;
}

void Connection::end_task_() {
  {
    std::lock_guard lock{padlock_};
    assert(in_flight_tasks_ > 0);
    --in_flight_tasks_;
  }
  tasks_cv_.notify_all();
}

void Connection::on_close(std::error_code ec) {
  decltype(subscriptions_) subscriptions;
  {
    std::lock_guard lock{padlock_};
    if (closed_)
      return;
    closed_ = true;
    subscriptions.swap(subscriptions_);
    reserved_subscriptions_ = 0;
  }

  const auto discarded = slots_.cancel_waiters();
  for (auto& [id, subscription] : subscriptions)
    subscription->abort();
  tasks_cv_.notify_all();

  LOG_DEBUG("connection #{} closed ({}), {} waiting calls discarded, {} subscriptions dropped",
            id_, ec.message(), discarded, subscriptions.size());
  (void)discarded;

  if (on_closed_)
    on_closed_(id_);
}

// ----------------------------------------------------------------------------------------- receive

void Connection::on_receive(std::span<const std::byte> frame) {
  if (is_closed())
    return;

  TRACE("#{} <- {}", id_, truncate(frame, config_.max_log_length));

  if (frame.size() > config_.max_request_body_size) {
    LOG_DEBUG("#{} request of {} bytes refused", id_, frame.size());
    send_response_(Response::failure(Id{}, oversized_request(config_.max_request_body_size)),
                   nullptr);
    return;
  }

  auto message = decode(frame);
  if (!message) {
    LOG_DEBUG("#{} undecodable frame: {}", id_, message.error().error.to_string());
    TRACE("#{} frame head:\n{}", id_,
          tandem::str(frame.first(std::min<std::size_t>(frame.size(), 64))));
    send_response_(message.error().to_response(), nullptr);
    return;
  }

  std::visit(
      [this](auto&& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, Request>) {
          dispatch_(std::move(alternative.method), std::move(alternative.params),
                    std::move(alternative.id), make_responder_());
        } else if constexpr (std::is_same_v<T, Notification>) {
          dispatch_(std::move(alternative.method), std::move(alternative.params), std::nullopt,
                    make_responder_());
        } else if constexpr (std::is_same_v<T, Response>) {
          TRACE("#{} ignoring response, id {}", id_, alternative.id.to_string());
        } else {
          handle_batch_(std::move(alternative));
        }
      },
      std::move(*message));
}

// ------------------------------------------------------------------------------------------- batch

void Connection::handle_batch_(Batch batch) {
  if (config_.max_batch_length.has_value() && batch.size() > *config_.max_batch_length) {
    send_response_(
        Response::failure(Id{}, batch_too_large(batch.size(), *config_.max_batch_length)),
        nullptr);
    return;
  }

  auto collector = std::make_shared<BatchCollector>();
  collector->remaining = batch.size();

  Responder collect = [weak = weak_from_this(), collector](std::optional<Response> response,
                                                           SentHandler on_sent) {
    bool is_complete = false;
    {
      std::lock_guard lock{collector->padlock_};
      if (response.has_value())
        collector->responses.push_back(to_json(*response));
      if (on_sent)
        collector->on_sent.push_back(std::move(on_sent));
      is_complete = (--collector->remaining == 0);
    }
    if (is_complete)
      if (auto self = weak.lock())
        self->finish_batch_(collector);
  };

  for (auto& entry : batch) {
    std::visit(
        [&](auto&& alternative) {
          using T = std::decay_t<decltype(alternative)>;
          if constexpr (std::is_same_v<T, Request>) {
            dispatch_(std::move(alternative.method), std::move(alternative.params),
                      std::move(alternative.id), collect);
          } else if constexpr (std::is_same_v<T, Notification>) {
            dispatch_(std::move(alternative.method), std::move(alternative.params), std::nullopt,
                      collect);
          } else if constexpr (std::is_same_v<T, Response>) {
            TRACE("#{} ignoring response in batch, id {}", id_, alternative.id.to_string());
            collect(std::nullopt, nullptr);
          } else {
            collect(alternative.to_response(), nullptr);
          }
        },
        std::move(entry));
  }
}

void Connection::finish_batch_(const std::shared_ptr<BatchCollector>& collector) {
  Json responses;
  std::vector<SentHandler> on_sent;
  {
    std::lock_guard lock{collector->padlock_};
    responses = std::move(collector->responses);
    on_sent = std::move(collector->on_sent);
  }

  if (responses.empty()) { // only notifications
    for (auto& handler : on_sent)
      handler(false);
    return;
  }

  auto frame = encode_json(responses);
  if (frame.size() > config_.max_response_body_size) {
    LOG_DEBUG("#{} batch response of {} bytes replaced", id_, frame.size());
    // The members never reach the peer
    for (auto& handler : on_sent)
      handler(false);
    send_frame_(
        encode(Response::failure(Id{}, oversized_response(config_.max_response_body_size))),
        nullptr);
    return;
  }

  send_frame_(std::move(frame), [on_sent = std::move(on_sent)](bool is_delivered) {
    for (auto& handler : on_sent)
      handler(is_delivered);
  });
}

// ---------------------------------------------------------------------------------------- dispatch

void Connection::dispatch_(std::string method, std::optional<Json> params, std::optional<Id> id,
                           Responder respond) {
  // The slot is released once the call is answered
  Responder release = [weak = weak_from_this(),
                       respond = std::move(respond)](std::optional<Response> response,
                                                     SentHandler on_sent) {
    if (auto self = weak.lock())
      self->slots_.post();
    respond(std::move(response), std::move(on_sent));
  };

  slots_.async_wait([weak = weak_from_this(), method = std::move(method),
                     params = std::move(params), id = std::move(id),
                     release = std::move(release)]() mutable {
    auto self = weak.lock();
    if (!self)
      return;
    boost::asio::post(self->executor_, [self, method = std::move(method),
                                        params = std::move(params), id = std::move(id),
                                        release = std::move(release)]() mutable {
      if (!self->begin_task_()) {
        self->slots_.post();
        return;
      }
      // The task ends once the call is answered, which for an async method may be long after
      // `run_call_` returns
      Responder finish = [weak = std::weak_ptr<Connection>{self},
                          release = std::move(release)](std::optional<Response> response,
                                                        SentHandler on_sent) {
        release(std::move(response), std::move(on_sent));
        if (auto connection = weak.lock())
          connection->end_task_();
      };
      self->run_call_(method, params.value_or(Json{}), id, std::move(finish));
    });
  });
}

void Connection::run_call_(const std::string& method, const Json& params,
                           const std::optional<Id>& id, Responder respond) {
  const auto* callback = registry_->find(method);
  if (callback == nullptr) {
    LOG_DEBUG("#{} method not found: '{}'", id_, method);
    if (id.has_value())
      respond(Response::failure(*id, method_not_found()), nullptr);
    else
      respond(std::nullopt, nullptr);
    return;
  }

  std::visit(
      [&](const auto& entry) {
        using T = std::decay_t<decltype(entry)>;
        if constexpr (std::is_same_v<T, SyncMethod>) {
          auto result = invoke_guarded(method, [&]() { return entry.callback(params); });
          if (!id.has_value())
            respond(std::nullopt, nullptr);
          else if (result.has_value())
            respond(Response::success(*id, std::move(*result)), nullptr);
          else
            respond(Response::failure(*id, std::move(result.error())), nullptr);

        } else if constexpr (std::is_same_v<T, AsyncMethod>) {
          auto context = std::make_shared<CallContext>(weak_from_this(), id, method, respond);
          auto started = invoke_guarded(method, [&]() -> MethodResult {
            entry.callback(params, context);
            return Json{};
          });
          if (!started)
            context->finish(std::move(started));

        } else if constexpr (std::is_same_v<T, SubscribeMethod>) {
          subscribe_(method, entry, params, id, std::move(respond));

        } else {
          unsubscribe_(entry, params, id, std::move(respond));
        }
      },
      *callback);
}

// ----------------------------------------------------------------------------------- subscriptions

void Connection::subscribe_(const std::string& method, const SubscribeMethod& entry,
                            const Json& params, const std::optional<Id>& id, Responder respond) {
  if (!id.has_value()) {
    TRACE("#{} ignoring subscribe '{}' sent as a notification", id_, method);
    respond(std::nullopt, nullptr);
    return;
  }

  {
    std::lock_guard lock{padlock_};
    if (reserved_subscriptions_ >= config_.max_subscriptions_per_connection) {
      respond(Response::failure(
                  *id, too_many_subscriptions(config_.max_subscriptions_per_connection)),
              nullptr);
      return;
    }
    ++reserved_subscriptions_;
  }

  auto subscription = std::make_shared<detail::ServerSubscription>(
      id_provider_->next_id(), method, entry.notification_method,
      config_.subscription_queue_capacity);

  {
    std::lock_guard lock{padlock_};
    if (closed_) {
      respond(std::nullopt, nullptr);
      return;
    }
    subscriptions_.emplace(subscription->id, subscription);
  }

  auto accepted = invoke_guarded(method, [&]() -> MethodResult {
    auto outcome = entry.callback(params, SubscriptionSink{subscription});
    if (!outcome)
      return tl::make_unexpected(std::move(outcome.error()));
    return Json{};
  });

  if (!accepted) {
    remove_subscription_(subscription);
    subscription->abort();
    respond(Response::failure(*id, std::move(accepted.error())), nullptr);
    return;
  }

  LOG_DEBUG("#{} subscription {} to '{}' accepted", id_, subscription->id.to_string(), method);

  // The first notification must follow the subscription id on the wire. A peer that never got
  // the id cannot unsubscribe, so the subscription goes.
  respond(Response::success(*id, subscription->id.to_json()),
          [weak = weak_from_this(), subscription](bool is_delivered) {
            auto self = weak.lock();
            if (!self)
              return;
            if (is_delivered) {
              self->start_drainer_(subscription);
            } else {
              LOG_DEBUG("#{} subscription {} dropped, its id was not delivered", self->id_,
                        subscription->id.to_string());
              self->remove_subscription_(subscription);
              subscription->abort();
            }
          });
}

void Connection::unsubscribe_(const UnsubscribeMethod& entry, const Json& params,
                              const std::optional<Id>& id, Responder respond) {
  std::optional<Id> subscription_id;
  if (params.is_array() && params.size() == 1)
    subscription_id = Id::from_json(params[0]);
  else if (params.is_object() && params.contains("subscription"))
    subscription_id = Id::from_json(params["subscription"]);

  if (!subscription_id.has_value() || subscription_id->is_null()) {
    if (id.has_value())
      respond(Response::failure(*id, invalid_params(Json("expected [subscription-id]"))),
              nullptr);
    else
      respond(std::nullopt, nullptr);
    return;
  }

  SubscriptionPtr subscription;
  {
    std::lock_guard lock{padlock_};
    auto ii = subscriptions_.find(*subscription_id);
    if (ii != subscriptions_.end() && ii->second->subscribe_method == entry.subscribe_method) {
      subscription = std::move(ii->second);
      subscriptions_.erase(ii);
      --reserved_subscriptions_;
    }
  }

  if (subscription != nullptr) {
    LOG_DEBUG("#{} unsubscribed {}", id_, subscription->id.to_string());
    subscription->abort();
  }

  if (id.has_value())
    respond(Response::success(*id, Json(subscription != nullptr)), nullptr);
  else
    respond(std::nullopt, nullptr);
}

void Connection::remove_subscription_(const SubscriptionPtr& subscription) {
  std::lock_guard lock{padlock_};
  auto ii = subscriptions_.find(subscription->id);
  if (ii != subscriptions_.end() && ii->second == subscription) {
    subscriptions_.erase(ii);
    --reserved_subscriptions_;
  }
}

// ----------------------------------------------------------------------------------------- drainer

void Connection::start_drainer_(SubscriptionPtr subscription) {
  if (!begin_task_()) {
    subscription->abort();
    return;
  }
  drain_next_(std::move(subscription));
}

void Connection::drain_next_(SubscriptionPtr subscription) {
  subscription->channel.async_receive(
      [weak = weak_from_this(), subscription](async::ChannelStatus status,
                                              std::optional<Json> payload) mutable {
        auto self = weak.lock();
        if (!self)
          return;
        // Never encode on the producer's thread
        boost::asio::post(self->executor_, [self, subscription = std::move(subscription), status,
                                            payload = std::move(payload)]() mutable {
          self->on_drained_(std::move(subscription), status, std::move(payload));
        });
      });
}

void Connection::on_drained_(SubscriptionPtr subscription, async::ChannelStatus status,
                             std::optional<Json> payload) {
  if (status != async::ChannelStatus::OK || !payload.has_value() || is_closed()) {
    finish_drainer_(subscription);
    return;
  }

  auto frame = encode_json(make_subscription_notification(
      subscription->notification_method, subscription->id, std::move(*payload)));

  if (frame.size() > config_.max_response_body_size) {
    WARN("#{} dropping notification of {} bytes for subscription {}", id_, frame.size(),
         subscription->id.to_string());
    drain_next_(std::move(subscription));
    return;
  }

  TRACE("#{} -> {}", id_, truncate(net::to_span_bytes(frame), config_.max_log_length));

  transport_->send_message(std::move(frame), [weak = weak_from_this(),
                                              subscription](std::error_code ec) mutable {
    auto self = weak.lock();
    if (!self)
      return;
    if (ec)
      self->finish_drainer_(subscription);
    else
      self->drain_next_(std::move(subscription));
  });
}

void Connection::finish_drainer_(const SubscriptionPtr& subscription) {
  std::optional<ErrorObject> close_reason;
  bool send_close = false;
  {
    std::lock_guard lock{subscription->padlock_};
    if (subscription->state == detail::ServerSubscription::State::CLOSING) {
      send_close = true;
      close_reason = std::move(subscription->close_reason);
    }
    subscription->state = detail::ServerSubscription::State::CLOSED;
  }

  remove_subscription_(subscription);

  if (send_close && !is_closed()) {
    LOG_DEBUG("#{} subscription {} closed by its producer", id_, subscription->id.to_string());
    send_frame_(encode_json(make_subscription_closed_notification(
                    subscription->notification_method, subscription->id,
                    close_reason.value_or(subscription_closed()))),
                nullptr);
  }

  end_task_();
}

// -------------------------------------------------------------------------------------------- send

Connection::Responder Connection::make_responder_() {
  return [weak = weak_from_this()](std::optional<Response> response, SentHandler on_sent) {
    auto self = weak.lock();
    if (!self)
      return;
    if (response.has_value())
      self->send_response_(*response, std::move(on_sent));
    else if (on_sent)
      on_sent(false);
  };
}

void Connection::send_response_(const Response& response, SentHandler on_sent) {
  auto frame = encode(response);
  if (frame.size() > config_.max_response_body_size) {
    LOG_DEBUG("#{} response of {} bytes replaced, id {}", id_, frame.size(),
              response.id.to_string());
    if (on_sent)
      on_sent(false);
    send_frame_(
        encode(Response::failure(response.id, oversized_response(config_.max_response_body_size))),
        nullptr);
    return;
  }
  send_frame_(std::move(frame), std::move(on_sent));
}

void Connection::send_frame_(net::BufferType&& frame, SentHandler on_sent) {
  if (is_closed()) {
    if (on_sent)
      on_sent(false);
    return;
  }
  TRACE("#{} -> {}", id_, truncate(net::to_span_bytes(frame), config_.max_log_length));
  transport_->send_message(std::move(frame), [on_sent = std::move(on_sent)](std::error_code ec) {
    if (on_sent)
      on_sent(!ec);
  });
}

} // namespace tandem::rpc
