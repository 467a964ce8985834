
#pragma once

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

namespace tandem::async {

/**
 * @ingroup async
 * @brief Counting semaphore that can be waited on by blocking a thread, or by
 *        parking a thunk that runs once a unit becomes available.
 *
 * Thunk waiters are served first-in first-out, and are preferred over blocked
 * threads when a unit is posted. A thunk is always invoked outside the lock, on
 * the thread that called `post()` (or `async_wait()`, if a unit was free).
 */
class CountingSemaphore {
public:
  using thunk_type = std::function<void()>;

private:
  int64_t count_;
  mutable std::mutex padlock_;
  std::condition_variable cv_;
  std::deque<thunk_type> waiters_;

public:
  /**
   * @brief Construct a new counting semaphore with the specified initial count.
   * @param count Pass `0` for a binary semaphore. Otherwise must be positive.
   */
  explicit CountingSemaphore(int64_t count) : count_{count} { assert(count >= 0); }

  CountingSemaphore(const CountingSemaphore&) = delete;
  CountingSemaphore& operator=(const CountingSemaphore&) = delete;

  /**
   * @brief Adds `1` to count, the equivalent of an `unlock`. Hands the unit
   *        directly to the oldest parked thunk, if any.
   */
  void post() {
    thunk_type thunk;
    {
      std::unique_lock lock{padlock_};
      if (!waiters_.empty()) {
        thunk = std::move(waiters_.front());
        waiters_.pop_front();
      } else {
        ++count_;
      }
    }
    if (thunk)
      thunk();
    else
      cv_.notify_one();
  }

  /**
   * @brief Decrements `1` from count, the equivalent of a `lock`. Blocks
   *        the thread while the count is zero.
   */
  void wait() {
    std::unique_lock lock{padlock_};
    cv_.wait(lock, [&]() { return count_ > 0; });
    --count_;
  }

  /// @brief As `wait()`, but gives up after `duration`. Returns TRUE iff a unit was taken.
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& duration) {
    std::unique_lock lock{padlock_};
    const bool success = cv_.wait_for(lock, duration, [&]() { return count_ > 0; });
    if (success)
      --count_;
    return success;
  }

  /// @brief Takes a unit iff one is available now.
  bool try_wait() {
    std::lock_guard lock{padlock_};
    if (count_ <= 0)
      return false;
    --count_;
    return true;
  }

  /**
   * @brief Takes a unit, then runs `thunk`. If no unit is available, `thunk` is
   *        parked until a `post()` hands it one.
   */
  void async_wait(thunk_type thunk) {
    {
      std::lock_guard lock{padlock_};
      if (count_ <= 0) {
        waiters_.push_back(std::move(thunk));
        return;
      }
      --count_;
    }
    thunk();
  }

  /**
   * @brief Discards every parked thunk without running it.
   * @return The number of thunks discarded.
   */
  std::size_t cancel_waiters() {
    std::deque<thunk_type> discarded;
    {
      std::lock_guard lock{padlock_};
      discarded.swap(waiters_);
    }
    return discarded.size();
  }

  /// @brief Units available right now.
  int64_t available() const {
    std::lock_guard lock{padlock_};
    return count_;
  }

  /// @brief Number of thunks parked in `async_wait()`.
  std::size_t waiting() const {
    std::lock_guard lock{padlock_};
    return waiters_.size();
  }
};

} // namespace tandem::async
