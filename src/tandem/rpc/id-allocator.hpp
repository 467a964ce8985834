
#pragma once

#include "tandem/rpc/id.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace tandem::rpc {

/// How a client writes its request ids on the wire.
enum class IdKind : int8_t {
  NUMBER, //!< `"id":7`
  STRING  //!< `"id":"7"`
};

/**
 * @brief Hands out request ids for one client. Ids strictly increase from `1` and are never
 *        reused by the same instance.
 */
class RequestIdManager {
private:
  std::atomic<uint64_t> next_request_id_{1};
  IdKind id_kind_;

public:
  explicit RequestIdManager(IdKind id_kind = IdKind::NUMBER) : id_kind_{id_kind} {}

  RequestIdManager(const RequestIdManager&) = delete;
  RequestIdManager& operator=(const RequestIdManager&) = delete;

  IdKind id_kind() const noexcept { return id_kind_; }

  Id next_request_id() { return as_id(next_request_id_.fetch_add(1, std::memory_order_relaxed)); }

  /// @brief Reserves `n` consecutive ids in one step, e.g., for a batch.
  std::vector<Id> next_id_range(std::size_t n) {
    const auto first = next_request_id_.fetch_add(n, std::memory_order_relaxed);
    std::vector<Id> ids;
    ids.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
      ids.push_back(as_id(first + i));
    return ids;
  }

  Id as_id(uint64_t counter) const {
    if (id_kind_ == IdKind::STRING)
      return Id{std::to_string(counter)};
    return Id{counter};
  }
};

} // namespace tandem::rpc
