
#pragma once

#include "tandem/rpc/pending-calls.hpp"
#include "tandem/rpc/status.hpp"

#include "tandem/async/future.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace tandem::rpc {

/**
 * @brief The caller's handle to a call in flight.
 *
 * Destroying (or `cancel()`ing) a handle that has not been consumed removes its pending-call
 * entries; the request is not retracted on the wire, and a late response is dropped. A handle
 * made with `KEEP_PENDING_ON_CANCEL` leaves the entries in place, so that the completion still
 * sees the response (or the deadline), and only the result is discarded.
 */
template <typename R> class PendingCall final {
public:
  using result_type = tl::expected<R, Status>;
  enum CancelPolicy : bool { REMOVE_PENDING_ON_CANCEL = true, KEEP_PENDING_ON_CANCEL = false };

private:
  async::Future<result_type> future_;
  std::vector<Id> ids_;
  std::weak_ptr<PendingCallTable> table_;
  CancelPolicy policy_ = REMOVE_PENDING_ON_CANCEL;

public:
  PendingCall() = default;
  PendingCall(async::Future<result_type> future, std::vector<Id> ids,
              std::weak_ptr<PendingCallTable> table,
              CancelPolicy policy = REMOVE_PENDING_ON_CANCEL)
      : future_{std::move(future)}, ids_{std::move(ids)}, table_{std::move(table)},
        policy_{policy} {}

  PendingCall(const PendingCall&) = delete;
  PendingCall& operator=(const PendingCall&) = delete;

  PendingCall(PendingCall&& o) noexcept = default;
  PendingCall& operator=(PendingCall&& o) noexcept {
    if (this != &o) {
      cancel();
      future_ = std::move(o.future_);
      ids_ = std::move(o.ids_);
      table_ = std::move(o.table_);
      policy_ = o.policy_;
    }
    return *this;
  }

  ~PendingCall() { cancel(); }

  /// @brief The request id; the first id for a batch. Null if the call failed before sending.
  Id id() const { return ids_.empty() ? Id{} : ids_.front(); }
  const std::vector<Id>& ids() const noexcept { return ids_; }

  /// @brief FALSE after the result was consumed, or the call was cancelled.
  bool valid() const noexcept { return future_.valid() && !future_.is_cancelled(); }
  bool is_ready() const noexcept { return future_.is_ready(); }

  template <typename Rep, typename Period>
  std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration) const {
    return future_.wait_for(duration);
  }

  /**
   * @brief Blocks for the outcome, and consumes it.
   * @exception std::future_error `no_state` if already consumed or cancelled.
   */
  result_type result() { return future_.get(); }

  /**
   * @brief Blocks for the outcome, and consumes it.
   * @exception CallError carrying the Status if the call failed.
   */
  R get() {
    auto outcome = result();
    if (!outcome)
      throw CallError{std::move(outcome.error())};
    return std::move(*outcome);
  }

  /// @brief Stops waiting. A no-op once the outcome is ready or consumed.
  void cancel() {
    if (!future_.valid() || future_.is_ready() || future_.is_cancelled())
      return;
    if (policy_ == REMOVE_PENDING_ON_CANCEL)
      if (auto table = table_.lock())
        for (const auto& id : ids_)
          table->cancel(id);
    future_.cancel();
  }
};

} // namespace tandem::rpc
