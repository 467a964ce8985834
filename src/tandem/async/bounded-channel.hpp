
#pragma once

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace tandem::async {

enum class ChannelStatus : int8_t {
  OK,      //!< The item was sent or received
  FULL,    //!< `try_send` found no free slot
  EMPTY,   //!< `try_receive` found nothing queued
  CLOSED,  //!< The channel is closed (and, for receivers, drained)
  TIMEOUT  //!< A bounded wait expired
};

constexpr const char* str(ChannelStatus status) noexcept {
  switch (status) {
  case ChannelStatus::OK:
    return "OK";
  case ChannelStatus::FULL:
    return "FULL";
  case ChannelStatus::EMPTY:
    return "EMPTY";
  case ChannelStatus::CLOSED:
    return "CLOSED";
  case ChannelStatus::TIMEOUT:
    return "TIMEOUT";
  }
  return "<unknown>";
}

/**
 * @ingroup async
 * @brief A multi-producer queue of fixed capacity. Senders block while the
 *        queue is full; nothing is ever dropped.
 *
 * Items can be taken by blocking receivers, or by (at most one) parked
 * asynchronous receiver. The parked receiver is invoked outside the lock, on
 * whichever thread made the item (or the close) available.
 *
 * After `close()`, senders fail with `CLOSED`, and receivers drain whatever is
 * still queued before they see `CLOSED`. `abort()` closes and discards the
 * queue.
 */
template <typename T> class BoundedChannel {
public:
  using value_type = T;
  using receiver_type = std::function<void(ChannelStatus, std::optional<T>)>;

  static constexpr std::size_t k_default_capacity = 16;

private:
  const std::size_t capacity_;
  mutable std::mutex padlock_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T> queue_;
  receiver_type receiver_ = nullptr;
  bool closed_ = false;

public:
  explicit BoundedChannel(std::size_t capacity = k_default_capacity)
      : capacity_{capacity == 0 ? 1 : capacity} {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  std::size_t capacity() const noexcept { return capacity_; }

  std::size_t size() const {
    std::lock_guard lock{padlock_};
    return queue_.size();
  }

  bool is_closed() const {
    std::lock_guard lock{padlock_};
    return closed_;
  }

  //@{ Senders
  /// @brief Blocks while the channel is full. Returns `OK` or `CLOSED`.
  ChannelStatus send(T value) {
    std::unique_lock lock{padlock_};
    not_full_.wait(lock, [this]() { return closed_ || queue_.size() < capacity_; });
    return push_locked_(lock, std::move(value));
  }

  /// @brief As `send`, but gives up with `TIMEOUT` after `duration`.
  template <typename Rep, typename Period>
  ChannelStatus send_for(T value, const std::chrono::duration<Rep, Period>& duration) {
    std::unique_lock lock{padlock_};
    if (!not_full_.wait_for(lock, duration,
                            [this]() { return closed_ || queue_.size() < capacity_; }))
      return ChannelStatus::TIMEOUT;
    return push_locked_(lock, std::move(value));
  }

  /// @brief Never blocks. Returns `OK`, `FULL` or `CLOSED`.
  ChannelStatus try_send(T value) {
    std::unique_lock lock{padlock_};
    if (!closed_ && queue_.size() >= capacity_)
      return ChannelStatus::FULL;
    return push_locked_(lock, std::move(value));
  }
  //@}

  //@{ Receivers
  /// @brief Blocks until an item is available (`OK`), or the channel is closed and drained.
  ChannelStatus receive(T& out) {
    std::unique_lock lock{padlock_};
    not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
    return pop_locked_(lock, out);
  }

  template <typename Rep, typename Period>
  ChannelStatus receive_for(T& out, const std::chrono::duration<Rep, Period>& duration) {
    std::unique_lock lock{padlock_};
    if (!not_empty_.wait_for(lock, duration, [this]() { return closed_ || !queue_.empty(); }))
      return ChannelStatus::TIMEOUT;
    return pop_locked_(lock, out);
  }

  /// @brief Never blocks. Returns `OK`, `EMPTY` or `CLOSED`.
  ChannelStatus try_receive(T& out) {
    std::unique_lock lock{padlock_};
    if (queue_.empty() && !closed_)
      return ChannelStatus::EMPTY;
    return pop_locked_(lock, out);
  }

  /**
   * @brief Calls `receiver` with the next item, or with `CLOSED` once the channel
   *        is closed and drained. If neither is available now, `receiver` is parked.
   *        Only one receiver may be parked at a time.
   */
  void async_receive(receiver_type receiver) {
    std::unique_lock lock{padlock_};
    assert(receiver_ == nullptr);
    if (queue_.empty() && !closed_) {
      receiver_ = std::move(receiver);
      return;
    }
    T value;
    const auto status = pop_locked_(lock, value);
    lock.unlock();
    if (status == ChannelStatus::OK)
      receiver(status, std::move(value));
    else
      receiver(status, std::nullopt);
  }
  //@}

  /// @brief Unblocks every sender with `CLOSED`. Queued items remain receivable.
  void close() { close_(false); }

  /// @brief As `close()`, and discards every queued item.
  void abort() { close_(true); }

private:
  ChannelStatus push_locked_(std::unique_lock<std::mutex>& lock, T&& value) {
    if (closed_)
      return ChannelStatus::CLOSED;
    if (receiver_) { // hand straight to the parked receiver
      assert(queue_.empty());
      auto receiver = std::move(receiver_);
      receiver_ = nullptr;
      lock.unlock();
      receiver(ChannelStatus::OK, std::move(value));
      return ChannelStatus::OK;
    }
    queue_.push_back(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return ChannelStatus::OK;
  }

  ChannelStatus pop_locked_(std::unique_lock<std::mutex>& lock, T& out) {
    if (queue_.empty()) {
      assert(closed_);
      return ChannelStatus::CLOSED;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return ChannelStatus::OK;
  }

  void close_(bool discard) {
    receiver_type receiver = nullptr;
    std::deque<T> discarded;
    {
      std::lock_guard lock{padlock_};
      closed_ = true;
      if (discard)
        discarded.swap(queue_);
      if (receiver_) {
        receiver = std::move(receiver_);
        receiver_ = nullptr;
      }
    }
    not_full_.notify_all();
    not_empty_.notify_all();
    if (receiver)
      receiver(ChannelStatus::CLOSED, std::nullopt);
  }
};

} // namespace tandem::async
