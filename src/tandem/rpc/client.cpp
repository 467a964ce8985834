
#include "stdinc.hpp"

#include "client.hpp"

#include "tandem/async/future.hpp"

namespace tandem::rpc {

namespace {
  tl::expected<Json, Status> to_result_(PendingCallTable::Outcome outcome) {
    if (!outcome)
      return tl::make_unexpected(std::move(outcome.error()));
    if (outcome->is_success())
      return outcome->result();
    return tl::make_unexpected(Status::from_error_object(outcome->error()));
  }

  struct BatchState {
    std::mutex padlock_;
    std::vector<std::optional<tl::expected<Json, Status>>> results;
    std::size_t remaining = 0;
    async::Promise<tl::expected<BatchResponse, Status>> promise;
    thunk_type release;
  };

  void complete_batch_(BatchState& state) {
    BatchResponse response;
    response.results.reserve(state.results.size());
    for (auto& result : state.results) {
      assert(result.has_value());
      if (result->has_value())
        ++response.num_successful;
      else
        ++response.num_failed;
      response.results.push_back(std::move(*result));
    }
    if (state.release)
      state.release();
    if (!state.promise.set_value(tl::expected<BatchResponse, Status>{std::move(response)})) {
      TRACE("batch result dropped, the caller cancelled");
    }
  }
} // namespace

// ------------------------------------------------------------------------------------ construction

Client::Client(PrivateToken, std::shared_ptr<net::Transport> transport,
               net::SteadyTimerFactory timer_factory, ClientConfig config)
    : transport_{std::move(transport)}, config_{std::move(config)}, ids_{config_.id_kind},
      pending_{std::make_shared<PendingCallTable>(std::move(timer_factory))},
      subscriptions_{config_.max_buffer_capacity_per_subscription} {
  Expects(transport_ != nullptr);
  if (config_.max_concurrent_requests.has_value())
    request_slots_ = std::make_unique<async::CountingSemaphore>(
        static_cast<int64_t>(std::max<std::size_t>(1, *config_.max_concurrent_requests)));
}

std::shared_ptr<Client> Client::make(std::shared_ptr<net::Transport> transport,
                                     net::SteadyTimerFactory timer_factory, ClientConfig config) {
  auto client = std::make_shared<Client>(PrivateToken{}, std::move(transport),
                                         std::move(timer_factory), std::move(config));
  client->transport_->attach(client);
  return client;
}

Client::~Client() {
  const Status status{ecode::connection_closed, "client destroyed"};
  pending_->fail_all(status);
  subscriptions_.close_all(status);
  transport_->close(1000, "client destroyed");
}

void Client::close(uint16_t close_code, std::string_view reason) {
  transport_->close(close_code, reason);
}

bool Client::is_connected() const { return !is_closed_.load() && transport_->is_open(); }

// ------------------------------------------------------------------------------------------- calls

tl::expected<net::BufferType, Status> Client::encode_request_(const Message& message) const {
  if (is_closed_.load())
    return tl::make_unexpected(Status{ecode::connection_closed, "transport is closed"});
  auto frame = encode(message);
  if (frame.size() > config_.max_request_size)
    return tl::make_unexpected(
        Status{ecode::resource_exceeded, format("request of {} bytes exceeds the limit of {}",
                                                frame.size(), config_.max_request_size)});
  return frame;
}

thunk_type Client::acquire_slot_() {
  if (request_slots_ == nullptr)
    return nullptr;
  request_slots_->wait();
  // Released once the call completes
  auto released = std::make_shared<std::atomic<bool>>(false);
  return [weak = weak_from_this(), released]() {
    if (released->exchange(true))
      return;
    if (auto self = weak.lock())
      self->request_slots_->post();
  };
}

void Client::send_registered_(const std::vector<Id>& ids, net::BufferType&& frame) {
  TRACE("-> {}", truncate(net::to_span_bytes(frame), config_.max_log_length));
  transport_->send_message(std::move(frame),
                           [pending = std::weak_ptr<PendingCallTable>{pending_},
                            ids](std::error_code ec) {
                             if (!ec)
                               return;
                             if (auto table = pending.lock())
                               for (const auto& id : ids)
                                 table->fail(id, Status{ecode::transport_error, ec.message()});
                           });
}

Id Client::call(std::string method, std::optional<Json> params, CompletionHandler completion,
                std::optional<std::chrono::milliseconds> timeout) {
  return call_(std::move(method), std::move(params), std::move(completion), timeout, true);
}

Id Client::call_(std::string method, std::optional<Json> params, CompletionHandler completion,
                 std::optional<std::chrono::milliseconds> timeout, bool takes_slot) {
  auto id = ids_.next_request_id();
  auto frame = encode_request_(Request{std::move(method), std::move(params), id});
  if (!frame) {
    if (completion)
      completion(tl::make_unexpected(std::move(frame.error())));
    return id;
  }

  auto release = takes_slot ? acquire_slot_() : thunk_type{};
  const bool is_registered = pending_->register_call(
      id,
      [completion = std::move(completion), release](PendingCallTable::Outcome outcome) {
        if (release)
          release();
        if (completion)
          completion(to_result_(std::move(outcome)));
      },
      timeout.value_or(config_.request_timeout), release);

  if (is_registered)
    send_registered_({id}, std::move(*frame));
  return id;
}

PendingCall<Json> Client::request(std::string method, std::optional<Json> params,
                                  std::optional<std::chrono::milliseconds> timeout) {
  async::Promise<tl::expected<Json, Status>> promise;
  auto future = promise.get_future();
  auto id = call(
      std::move(method), std::move(params),
      [promise](tl::expected<Json, Status> result) mutable {
        if (!promise.set_value(std::move(result))) {
          TRACE("result dropped, the caller cancelled");
        }
      },
      timeout);
  return PendingCall<Json>{std::move(future), {std::move(id)}, pending_};
}

Status Client::notification(std::string method, std::optional<Json> params) {
  auto frame = encode_request_(Notification{std::move(method), std::move(params)});
  if (!frame)
    return frame.error();
  TRACE("-> {}", truncate(net::to_span_bytes(*frame), config_.max_log_length));
  transport_->send_message(std::move(*frame));
  return Status{};
}

// ------------------------------------------------------------------------------------------- batch

PendingCall<BatchResponse>
Client::batch_request(const BatchRequestBuilder& batch,
                      std::optional<std::chrono::milliseconds> timeout) {
  auto state = std::make_shared<BatchState>();
  auto future = state->promise.get_future();

  if (batch.empty()) {
    state->promise.set_value(tl::expected<BatchResponse, Status>{
        tl::make_unexpected(Status{ecode::invalid_request, "empty batch"})});
    return PendingCall<BatchResponse>{std::move(future), {}, pending_};
  }

  auto ids = ids_.next_id_range(batch.request_count());

  Batch members;
  members.reserve(batch.size());
  {
    auto next_id = cbegin(ids);
    for (const auto& entry : batch.entries()) {
      if (entry.is_notification)
        members.push_back(Notification{entry.method, entry.params});
      else
        members.push_back(Request{entry.method, entry.params, *next_id++});
    }
  }

  auto frame = encode_request_(Message{std::move(members)});
  if (!frame) {
    state->promise.set_value(
        tl::expected<BatchResponse, Status>{tl::make_unexpected(std::move(frame.error()))});
    return PendingCall<BatchResponse>{std::move(future), {}, pending_};
  }

  if (ids.empty()) { // only notifications, so nothing comes back
    TRACE("-> {}", truncate(net::to_span_bytes(*frame), config_.max_log_length));
    transport_->send_message(std::move(*frame));
    state->promise.set_value(tl::expected<BatchResponse, Status>{BatchResponse{}});
    return PendingCall<BatchResponse>{std::move(future), {}, pending_};
  }

  state->results.resize(ids.size());
  state->remaining = ids.size();
  state->release = acquire_slot_();

  for (std::size_t i = 0; i < ids.size(); ++i) {
    pending_->register_call(
        ids[i],
        [state, i](PendingCallTable::Outcome outcome) {
          bool is_complete = false;
          {
            std::lock_guard lock{state->padlock_};
            state->results[i] = to_result_(std::move(outcome));
            is_complete = (--state->remaining == 0);
          }
          if (is_complete)
            complete_batch_(*state);
        },
        timeout.value_or(config_.request_timeout), state->release);
  }

  if (!pending_->is_closed())
    send_registered_(ids, std::move(*frame));
  return PendingCall<BatchResponse>{std::move(future), std::move(ids), pending_};
}

// ----------------------------------------------------------------------------------- subscriptions

PendingCall<Subscription> Client::subscribe(std::string subscribe_method,
                                            std::optional<Json> params,
                                            std::string unsubscribe_method,
                                            std::optional<std::chrono::milliseconds> timeout) {
  using result_type = tl::expected<Subscription, Status>;
  async::Promise<result_type> promise;
  auto future = promise.get_future();

  // Runs on the reader, so the stream is bound before any notification is routed
  auto on_response = [weak = weak_from_this(), promise,
                      unsubscribe_method](tl::expected<Json, Status> result) mutable {
    if (!result) {
      promise.set_value(result_type{tl::make_unexpected(std::move(result.error()))});
      return;
    }

    auto subscription_id = Id::from_json(*result);
    if (!subscription_id.has_value() || subscription_id->is_null()) {
      promise.set_value(result_type{tl::make_unexpected(
          Status{ecode::invalid_request,
                 format("expected a subscription id, got {}", dump(*result))})});
      return;
    }

    auto self = weak.lock();
    if (self == nullptr) {
      promise.set_value(
          result_type{tl::make_unexpected(Status{ecode::connection_closed, "client destroyed"})});
      return;
    }

    auto stream = self->subscriptions_.bind(*subscription_id, unsubscribe_method);
    if (!stream) {
      promise.set_value(result_type{tl::make_unexpected(std::move(stream.error()))});
      return;
    }

    LOG_DEBUG("subscribed, id {}", subscription_id->to_string());
    // If the caller cancelled, the Subscription is dropped here, which unsubscribes
    promise.set_value(result_type{Subscription{
        std::move(*stream), self->make_unsubscriber_(*subscription_id, unsubscribe_method)}});
  };

  // The entry stays in the table when the caller cancels, so a late subscription id still
  // reaches `on_response` and is unsubscribed
  auto id = call(std::move(subscribe_method), std::move(params), std::move(on_response), timeout);
  return PendingCall<Subscription>{std::move(future), {std::move(id)}, pending_,
                                   PendingCall<Subscription>::KEEP_PENDING_ON_CANCEL};
}

tl::expected<Subscription, Status> Client::subscribe_to_method(std::string notification_method) {
  auto stream = subscriptions_.bind_method(notification_method);
  if (!stream)
    return tl::make_unexpected(std::move(stream.error()));
  return Subscription{std::move(*stream), make_unsubscriber_(Id{}, std::move(notification_method))};
}

thunk_type Client::make_unsubscriber_(Id subscription_id, std::string unsubscribe_method) {
  return [weak = weak_from_this(), subscription_id = std::move(subscription_id),
          unsubscribe_method = std::move(unsubscribe_method)]() {
    if (auto self = weak.lock())
      self->unsubscribe_(subscription_id, unsubscribe_method,
                         Status{ecode::cancelled, "unsubscribed"});
  };
}

void Client::unsubscribe_(const Id& subscription_id, const std::string& unsubscribe_method,
                          Status terminal) {
  if (subscription_id.is_null()) { // method subscription
    subscriptions_.close_method(unsubscribe_method, std::move(terminal));
    return;
  }

  subscriptions_.close_stream(subscription_id, std::move(terminal));
  if (!is_connected())
    return;

  // May run on the reader, so it must not wait for a request slot
  call_(
      unsubscribe_method, Json::array({subscription_id.to_json()}),
      [subscription_id](tl::expected<Json, Status> result) {
        if (!result) {
          LOG_DEBUG("unsubscribe {} failed: {}", subscription_id.to_string(),
                    result.error().to_string());
        } else if (*result != Json(true)) {
          LOG_DEBUG("server did not know subscription {}", subscription_id.to_string());
        }
      },
      std::nullopt, false);
}

// ----------------------------------------------------------------------------------------- receive

void Client::on_receive(std::span<const std::byte> frame) {
  TRACE("<- {}", truncate(frame, config_.max_log_length));

  if (frame.size() > config_.max_response_size) {
    WARN("discarding frame of {} bytes from {}, the limit is {}", frame.size(), transport_->peer(),
         config_.max_response_size);
    return;
  }

  auto message = decode(frame);
  if (!message) {
    WARN("undecodable frame from {}: {}", transport_->peer(), message.error().error.to_string());
    return;
  }

  std::visit(
      [this](auto&& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, Response>) {
          handle_response_(std::move(alternative));
        } else if constexpr (std::is_same_v<T, Notification>) {
          handle_notification_(std::move(alternative));
        } else if constexpr (std::is_same_v<T, Request>) {
          handle_request_(alternative);
        } else {
          for (auto& entry : alternative) {
            std::visit(
                [this](auto&& member) {
                  using U = std::decay_t<decltype(member)>;
                  if constexpr (std::is_same_v<U, Response>)
                    handle_response_(std::move(member));
                  else if constexpr (std::is_same_v<U, Notification>)
                    handle_notification_(std::move(member));
                  else if constexpr (std::is_same_v<U, Request>)
                    handle_request_(member);
                  else
                    WARN("invalid batch member from server: {}", member.error.to_string());
                },
                std::move(entry));
          }
        }
      },
      std::move(*message));
}

void Client::handle_response_(Response response) {
  // A miss is logged by the table, and dropped
  pending_->resolve(std::move(response));
}

void Client::handle_notification_(Notification notification) {
  if (notification.params.has_value() && notification.params->is_object()) {
    const auto& params = *notification.params;
    const auto ii = params.find("subscription");
    if (ii != params.end()) {
      const auto subscription_id = Id::from_json(*ii);
      if (subscription_id.has_value() && subscriptions_.contains(*subscription_id)) {
        if (const auto result = params.find("result"); result != params.end()) {
          auto delivery = subscriptions_.deliver(*subscription_id, *result);
          if (delivery.status == ClientSubscriptions::DeliveryStatus::LAGGED) {
            WARN("subscription {} lagged, unsubscribing", subscription_id->to_string());
            unsubscribe_(*subscription_id, delivery.method,
                         Status{ecode::resource_exceeded, "subscription lagged"});
          }
          return;
        }
        if (const auto error = params.find("error"); error != params.end()) {
          auto error_object = ErrorObject::from_json(*error).value_or(subscription_closed());
          LOG_DEBUG("server closed subscription {}: {}", subscription_id->to_string(),
                    error_object.to_string());
          subscriptions_.close_stream(*subscription_id,
                                      Status::from_error_object(std::move(error_object)));
          return;
        }
      }
    }
  }

  const auto delivery =
      subscriptions_.deliver_method(notification.method, notification.params.value_or(Json{}));
  if (delivery.status == ClientSubscriptions::DeliveryStatus::UNKNOWN) {
    TRACE("dropping notification '{}'", notification.method);
  } else if (delivery.status == ClientSubscriptions::DeliveryStatus::LAGGED) {
    WARN("method subscription '{}' lagged, and was closed", notification.method);
  }
}

void Client::handle_request_(const Request& request) {
  LOG_DEBUG("server called '{}', which clients do not serve", request.method);
  auto frame = encode(Response::failure(request.id, method_not_found()));
  transport_->send_message(std::move(frame));
}

void Client::on_close(std::error_code ec) {
  if (is_closed_.exchange(true))
    return;
  const Status status{ecode::connection_closed, ec.message()};
  const auto num_failed = pending_->fail_all(status);
  const auto num_closed = subscriptions_.close_all(status);
  INFO("client transport {} closed: {}, {} calls failed, {} subscriptions ended",
       transport_->peer(), ec.message(), num_failed, num_closed);
}

} // namespace tandem::rpc
