
#pragma once

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace tandem::async {
template <typename R> class Promise;
template <typename R> class Future;

namespace detail {

  template <typename R> class PromiseFutureSharedState {
  public:
    enum class Status : int8_t { UNSET, SET, CANCELLED };

  private:
    mutable std::mutex padlock_ = {};
    std::condition_variable cv_ = {};
    std::optional<R> value_ = {};
    std::atomic<Status> status_ = Status::UNSET;
    bool future_is_retreived_ = false;

    Status load_status_() const { return status_.load(std::memory_order_acquire); }

    template <typename WaitFunc> Status wait_with_thunk_(WaitFunc&& thunk) {
      if (promise_is_unset()) {
        std::unique_lock<std::mutex> lock{padlock_};
        while (promise_is_unset()) {
          if (!thunk(lock))
            break;
        }
      }
      return load_status_();
    }

    void notify_locked_(Status new_status) {
      status_.store(new_status, std::memory_order_release);
      cv_.notify_all();
    }

  public:
    //@{ getters
    bool promise_is_unset() const { return load_status_() == Status::UNSET; }
    bool promise_is_set() const { return load_status_() == Status::SET; }
    bool is_cancelled() const { return load_status_() == Status::CANCELLED; }
    //@}

    void flag_future_has_been_retreived() {
      std::lock_guard lock{padlock_};
      if (future_is_retreived_)
        throw std::future_error{std::future_errc::future_already_retrieved};
      future_is_retreived_ = true;
    }

    /// Cancelling a set value is a no-op.
    void cancel() {
      std::lock_guard lock{padlock_};
      if (load_status_() == Status::UNSET)
        notify_locked_(Status::CANCELLED);
    }

    //@{ wait
    Status wait() {
      return wait_with_thunk_([this](std::unique_lock<std::mutex>& lock) {
        cv_.wait(lock);
        return true;
      });
    }

    template <typename Rep, typename Period>
    std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration) {
      const auto deadline = std::chrono::steady_clock::now() + duration;
      auto status = wait_with_thunk_([this, &deadline](std::unique_lock<std::mutex>& lock) {
        return cv_.wait_until(lock, deadline) == std::cv_status::no_timeout;
      });
      return (status == Status::UNSET) ? std::future_status::timeout : std::future_status::ready;
    }
    //@}

    //@{ get/set value
    R get() {
      auto status = wait(); // noop if `is_set`
      if (status == Status::CANCELLED)
        throw std::future_error{std::future_errc::broken_promise};
      assert(value_.has_value());
      return std::move(*value_);
    }

    /// Returns FALSE (and drops `new_value`) if the future was cancelled.
    template <typename T> bool set_value(T&& new_value) {
      std::lock_guard lock{padlock_};
      auto status = load_status_();
      if (status == Status::SET)
        throw std::future_error{std::future_errc::promise_already_satisfied};
      else if (status == Status::CANCELLED)
        return false; // do nothing
      value_.emplace(std::forward<T>(new_value));
      notify_locked_(Status::SET);
      return true;
    }
    //@}
  };

} // namespace detail

// ------------------------------------------------------------------------------------------ Future

/**
 * @ingroup async
 * @brief Provides a way to access the result of an asynchronous operation set through a
 *        Promise.
 *
 * Cancelling a Future makes the associated Promise drop the value it later sets, and makes
 * `get()` throw `std::future_errc::broken_promise`.
 */
template <typename R> class Future final {
private:
  using shared_state_type = detail::PromiseFutureSharedState<R>;
  std::shared_ptr<shared_state_type> shared_state_{};

  friend class Promise<R>;

  explicit Future(std::shared_ptr<shared_state_type> shared_state)
      : shared_state_{std::move(shared_state)} {
    shared_state_->flag_future_has_been_retreived();
  }

public:
  Future() noexcept = default;
  Future(const Future&) = delete;
  Future(Future&&) noexcept = default;
  Future& operator=(const Future&) = delete;
  Future& operator=(Future&&) noexcept = default;

  //@{ getters
  /** @brief True iff the Future is still associated with a Promise. */
  bool valid() const noexcept { return shared_state_ != nullptr; }

  /** @brief True iff the value is set and can be retrieved without blocking. */
  bool is_ready() const noexcept { return valid() && shared_state_->promise_is_set(); }

  bool is_cancelled() const noexcept { return valid() && shared_state_->is_cancelled(); }
  //@}

  /** @brief Release the shared state, making `valid() == false`. */
  void reset() noexcept { shared_state_.reset(); }

  void cancel() {
    if (!valid())
      throw std::future_error{std::future_errc::no_state};
    shared_state_->cancel();
  }

  /**
   * @brief Gets the result, performing a blocking wait if not yet set. Releases the shared
   *        state.
   *
   * @exception std::future_error `no_state` if the value was already retrieved, and
   *            `broken_promise` if the Future was cancelled.
   */
  R get() {
    if (!valid())
      throw std::future_error{std::future_errc::no_state};
    auto shared_state = std::move(shared_state_);
    shared_state_ = nullptr;
    return shared_state->get();
  }

  void wait() const {
    if (!valid())
      throw std::future_error{std::future_errc::no_state};
    shared_state_->wait();
  }

  template <typename Rep, typename Period>
  std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration) const {
    if (!valid())
      throw std::future_error{std::future_errc::no_state};
    return shared_state_->wait_for(duration);
  }
};

// ----------------------------------------------------------------------------------------- Promise

/**
 * @ingroup async
 * @brief Stores a value for later asychronous retrieval. Copyable, so it can be captured in
 *        `std::function` completions; every copy refers to the same shared state.
 */
template <typename R> class Promise final {
private:
  using shared_state_type = detail::PromiseFutureSharedState<R>;
  std::shared_ptr<shared_state_type> shared_state_ = std::make_shared<shared_state_type>();

public:
  Future<R> get_future() { return Future<R>{shared_state_}; }

  /// Returns FALSE if the associated Future was cancelled, in which case the value is dropped.
  template <typename T> bool set_value(T&& value) {
    return shared_state_->set_value(std::forward<T>(value));
  }

  bool is_cancelled() const { return shared_state_->is_cancelled(); }
};

} // namespace tandem::async
