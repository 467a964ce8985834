
#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cassert>
#include <functional>
#include <optional>
#include <thread>
#include <vector>

namespace tandem::net {

/**
 * @defgroup tandem-asio Tandem Asio/Beast
 *
 * We use Asio for two things: an execution context, and managing timers.
 * Beast is used to manage websockets.
 */

using SteadyTimerFactory = std::function<boost::asio::steady_timer()>;

/**
 * @brief Type erase the creation of steady-timer objects
 */
inline SteadyTimerFactory make_steady_timer_factory(boost::asio::any_io_executor executor) {
  return [executor]() { return boost::asio::steady_timer{executor}; };
}

/**
 * @brief Runs an `io_context` on a pool of threads. The context is kept alive (even when idle)
 *        until `stop()` is called, or the execution context is destroyed.
 */
class AsioExecutionContext {
private:
  boost::asio::io_context& io_context_;
  std::size_t size_;
  std::vector<std::thread> pool_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guard_;

public:
  using ExecutorType = boost::asio::io_context::executor_type;
  using SteadyTimerType = boost::asio::steady_timer;

  AsioExecutionContext(boost::asio::io_context& io_context, std::size_t thread_pool_size = 0)
      : io_context_{io_context}, size_{thread_pool_size == 0 ? std::thread::hardware_concurrency()
                                                             : thread_pool_size} {
    pool_.reserve(size_);
  }

  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() { stop(); }

  /** @brief Run the pool */
  void run() {
    assert(!is_running());
    guard_.emplace(io_context_.get_executor());
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Stops the io_context, and joins the pool */
  void stop() {
    guard_.reset();
    io_context_.stop();
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
    pool_.clear();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Number of threads executing io requests in parallel */
  std::size_t size() const noexcept { return size_; }

  /** @brief Return the executor for running jobs on the server pool */
  ExecutorType get_executor() const { return io_context_.get_executor(); }

  /** @brief Create a new steady timer bound to this execution context */
  SteadyTimerType make_steady_timer() const { return SteadyTimerType{io_context_}; }

  SteadyTimerFactory timer_factory() const { return make_steady_timer_factory(get_executor()); }

  boost::asio::io_context& io_context() noexcept { return io_context_; }
};

} // namespace tandem::net
