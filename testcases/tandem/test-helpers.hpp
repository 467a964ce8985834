#pragma once

#include "tandem/net/asio-execution-context.hpp"
#include "tandem/net/transport.hpp"

#include <nlohmann/json.hpp>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace tandem::test {

/// Polls `predicate` until it holds, or `timeout` passes.
inline bool wait_until(std::function<bool()> predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() > deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

/// An io_context running on a small thread pool for the duration of a test.
struct IoFixture {
  boost::asio::io_context io_context;
  net::AsioExecutionContext pool;

  explicit IoFixture(std::size_t threads = 2) : pool{io_context, threads} { pool.run(); }

  boost::asio::any_io_executor executor() { return pool.get_executor(); }
  net::SteadyTimerFactory timer_factory() const { return pool.timer_factory(); }
};

/// Records every frame (as text) and the close of one transport end.
class FrameCollector final : public net::TransportHandler {
private:
  mutable std::mutex padlock_;
  std::condition_variable cv_;
  std::vector<std::string> frames_;
  std::optional<std::error_code> close_ec_;
  int close_count_ = 0;

public:
  void on_receive(std::span<const std::byte> frame) override {
    {
      std::lock_guard lock{padlock_};
      frames_.emplace_back(net::to_string_view(frame));
    }
    cv_.notify_all();
  }

  void on_close(std::error_code ec) override {
    {
      std::lock_guard lock{padlock_};
      close_ec_ = ec;
      ++close_count_;
    }
    cv_.notify_all();
  }

  bool wait_for_frames(std::size_t count,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    std::unique_lock lock{padlock_};
    return cv_.wait_for(lock, timeout, [&]() { return frames_.size() >= count; });
  }

  bool wait_for_close(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    std::unique_lock lock{padlock_};
    return cv_.wait_for(lock, timeout, [&]() { return close_count_ > 0; });
  }

  std::vector<std::string> frames() const {
    std::lock_guard lock{padlock_};
    return frames_;
  }

  std::string frame(std::size_t index) const {
    std::lock_guard lock{padlock_};
    return index < frames_.size() ? frames_[index] : std::string{};
  }

  /// Frame `index`, parsed
  nlohmann::json json(std::size_t index) const { return nlohmann::json::parse(frame(index)); }

  std::size_t size() const {
    std::lock_guard lock{padlock_};
    return frames_.size();
  }

  std::optional<std::error_code> close_ec() const {
    std::lock_guard lock{padlock_};
    return close_ec_;
  }

  int close_count() const {
    std::lock_guard lock{padlock_};
    return close_count_;
  }
};

} // namespace tandem::test
