
#pragma once

#include "tandem/rpc/id.hpp"

#include <memory>
#include <string>

namespace tandem::rpc {

/**
 * @brief Makes subscription ids. Ids must be unique within the process for as long as the
 *        subscription lives.
 */
class SubscriptionIdProvider {
public:
  virtual ~SubscriptionIdProvider() = default;
  virtual Id next_id() = 0;
};

/**
 * @brief Numbers from a single process-wide counter, so two servers in one process never hand
 *        out the same id.
 */
class SequentialIdProvider final : public SubscriptionIdProvider {
public:
  Id next_id() override;
};

/// @brief As `SequentialIdProvider`, but as strings: `<prefix>-<number>`.
class PrefixedIdProvider final : public SubscriptionIdProvider {
private:
  std::string prefix_;

public:
  explicit PrefixedIdProvider(std::string prefix) : prefix_{std::move(prefix)} {}
  Id next_id() override;
};

std::shared_ptr<SubscriptionIdProvider> default_subscription_id_provider();

} // namespace tandem::rpc
