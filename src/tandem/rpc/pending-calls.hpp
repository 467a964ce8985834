
#pragma once

#include "tandem/rpc/message.hpp"
#include "tandem/rpc/status.hpp"

#include "tandem/net/asio-execution-context.hpp"

#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace tandem::rpc {

/**
 * @brief The client's calls that are awaiting a response, keyed by request id.
 *
 * Each entry is completed exactly once: by the matching response (`resolve`), by deadline
 * expiry (`ecode::timeout`), or by `fail_all`. `cancel` removes an entry without completing it,
 * and runs the entry's `on_cancel` thunk instead. Completions always run outside the lock.
 */
class PendingCallTable : public std::enable_shared_from_this<PendingCallTable> {
public:
  using Outcome = tl::expected<Response, Status>;
  using Completion = std::function<void(Outcome)>;

private:
  struct Entry {
    Completion completion;
    std::shared_ptr<boost::asio::steady_timer> timer;
    thunk_type on_cancel;
  };

  net::SteadyTimerFactory timer_factory_;
  mutable std::mutex padlock_;
  std::unordered_map<Id, Entry> outstanding_calls_;
  std::optional<Status> closed_status_; //!< Set by `fail_all`

public:
  explicit PendingCallTable(net::SteadyTimerFactory timer_factory)
      : timer_factory_{std::move(timer_factory)} {}

  PendingCallTable(const PendingCallTable&) = delete;
  PendingCallTable& operator=(const PendingCallTable&) = delete;

  /**
   * @brief Records `completion` under `id`. If `timeout` is set, the call completes with
   *        `ecode::timeout` unless resolved first. `on_cancel` runs if the entry is cancelled.
   * @return FALSE if the table is already closed (the completion is called with the closing
   *         status), or `id` is already outstanding (the completion is not called).
   */
  bool register_call(const Id& id, Completion completion,
                     std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                     thunk_type on_cancel = nullptr);

  /**
   * @brief Removes and completes the entry matching `response.id`.
   * @return FALSE if there was no such entry. The response is dropped.
   */
  bool resolve(Response response);

  /**
   * @brief Removes the entry for `id` without completing it. A response that arrives later is
   *        dropped by `resolve`.
   */
  bool cancel(const Id& id);

  /// @brief Removes and completes the entry for `id` with `status`, e.g., when the write failed.
  bool fail(const Id& id, Status status);

  /**
   * @brief Completes every outstanding entry with `status`, and closes the table to further
   *        registration.
   * @return The number of entries completed.
   */
  std::size_t fail_all(const Status& status);

  std::size_t size() const;
  bool is_closed() const;

private:
  void expire_(const Id& id);
  std::optional<Entry> take_locked_(const Id& id);
  static void cancel_timer_(std::shared_ptr<boost::asio::steady_timer> timer);
};

} // namespace tandem::rpc
