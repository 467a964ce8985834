
#include "stdinc.hpp"

#include "subscription-id-provider.hpp"

#include <atomic>

namespace tandem::rpc {

static std::atomic<uint64_t> next_subscription_id{1};

Id SequentialIdProvider::next_id() {
  return Id{next_subscription_id.fetch_add(1, std::memory_order_relaxed)};
}

Id PrefixedIdProvider::next_id() {
  return Id{format("{}-{}", prefix_, next_subscription_id.fetch_add(1, std::memory_order_relaxed))};
}

std::shared_ptr<SubscriptionIdProvider> default_subscription_id_provider() {
  static auto instance = std::make_shared<SequentialIdProvider>();
  return instance;
}

} // namespace tandem::rpc
