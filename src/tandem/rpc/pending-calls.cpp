
#include "stdinc.hpp"

#include "pending-calls.hpp"

#include <boost/asio/post.hpp>

namespace tandem::rpc {

// ----------------------------------------------------------------------------------- register_call

bool PendingCallTable::register_call(const Id& id, Completion completion,
                                     std::optional<std::chrono::milliseconds> timeout,
                                     thunk_type on_cancel) {
  std::optional<Status> closed_status;
  {
    std::lock_guard lock{padlock_};
    if (closed_status_.has_value()) {
      closed_status = closed_status_;
    } else {
      if (outstanding_calls_.count(id) > 0) {
        WARN("request id {} is already outstanding", id.to_string());
        return false;
      }

      Entry entry{std::move(completion), nullptr, std::move(on_cancel)};
      if (timeout.has_value() && timer_factory_) { // Setup the timeout
        entry.timer = std::make_shared<boost::asio::steady_timer>(timer_factory_());
        entry.timer->expires_after(*timeout);
        entry.timer->async_wait([weak = weak_from_this(), id](const boost::system::error_code& ec) {
          if (!ec) {
            auto ptr = weak.lock();
            if (ptr != nullptr)
              ptr->expire_(id);
          }
        });
      }
      outstanding_calls_.insert({id, std::move(entry)});
      return true;
    }
  }

  if (completion)
    completion(tl::make_unexpected(std::move(*closed_status)));
  return false;
}

// ----------------------------------------------------------------------------------------- resolve

bool PendingCallTable::resolve(Response response) {
  std::optional<Entry> entry;
  {
    std::lock_guard lock{padlock_};
    entry = take_locked_(response.id);
  }

  if (!entry.has_value()) {
    WARN("dropping response for id {}: no pending call (late, cancelled, or duplicate)",
         response.id.to_string());
    return false;
  }

  cancel_timer_(std::move(entry->timer));
  if (entry->completion)
    entry->completion(std::move(response));
  return true;
}

// ------------------------------------------------------------------------------------------ cancel

bool PendingCallTable::cancel(const Id& id) {
  std::optional<Entry> entry;
  {
    std::lock_guard lock{padlock_};
    entry = take_locked_(id);
  }
  if (!entry.has_value())
    return false;
  TRACE("pending call {} cancelled", id.to_string());
  cancel_timer_(std::move(entry->timer));
  if (entry->on_cancel)
    entry->on_cancel();
  return true;
}

bool PendingCallTable::fail(const Id& id, Status status) {
  std::optional<Entry> entry;
  {
    std::lock_guard lock{padlock_};
    entry = take_locked_(id);
  }
  if (!entry.has_value())
    return false;
  cancel_timer_(std::move(entry->timer));
  if (entry->completion)
    entry->completion(tl::make_unexpected(std::move(status)));
  return true;
}

// ---------------------------------------------------------------------------------------- fail_all

std::size_t PendingCallTable::fail_all(const Status& status) {
  decltype(outstanding_calls_) calls;
  {
    std::lock_guard lock{padlock_};
    if (!closed_status_.has_value())
      closed_status_ = status;
    using std::swap;
    swap(calls, outstanding_calls_);
  }

  for (auto& [id, entry] : calls) {
    cancel_timer_(std::move(entry.timer));
    if (entry.completion)
      entry.completion(tl::make_unexpected(status));
  }
  return calls.size();
}

std::size_t PendingCallTable::size() const {
  std::lock_guard lock{padlock_};
  return outstanding_calls_.size();
}

bool PendingCallTable::is_closed() const {
  std::lock_guard lock{padlock_};
  return closed_status_.has_value();
}

// ----------------------------------------------------------------------------------------- private

void PendingCallTable::expire_(const Id& id) {
  std::optional<Entry> entry;
  {
    std::lock_guard lock{padlock_};
    entry = take_locked_(id);
  }
  if (!entry.has_value())
    return; // resolved, or cancelled, while the timer fired

  TRACE("pending call {} timed out", id.to_string());
  if (entry->completion)
    entry->completion(tl::make_unexpected(Status{ecode::timeout, "request timed out"}));
}

std::optional<PendingCallTable::Entry> PendingCallTable::take_locked_(const Id& id) {
  auto ii = outstanding_calls_.find(id);
  if (ii == outstanding_calls_.end())
    return std::nullopt;
  auto entry = std::move(ii->second);
  outstanding_calls_.erase(ii);
  return entry;
}

void PendingCallTable::cancel_timer_(std::shared_ptr<boost::asio::steady_timer> timer) {
  if (timer == nullptr)
    return;
  // Timers are not thread safe, so cancel on the timer's own executor
  auto executor = timer->get_executor();
  boost::asio::post(executor, [timer = std::move(timer)]() { timer->cancel(); });
}

} // namespace tandem::rpc
