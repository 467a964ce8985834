
#include "stdinc.hpp"

#include "subscription-sink.hpp"

namespace tandem::rpc {

void SubscriptionSink::close(std::optional<ErrorObject> reason) {
  {
    std::lock_guard lock{subscription_->padlock_};
    if (subscription_->state != detail::ServerSubscription::State::ACTIVE)
      return;
    subscription_->state = detail::ServerSubscription::State::CLOSING;
    subscription_->close_reason = std::move(reason);
  }
  subscription_->channel.close();
}

} // namespace tandem::rpc
