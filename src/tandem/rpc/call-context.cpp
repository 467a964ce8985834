
#include "stdinc.hpp"

#include "call-context.hpp"

#include "connection.hpp"

namespace tandem::rpc {

CallContext::~CallContext() {
  if (!has_finished()) {
    WARN("method '{}' dropped its call context without answering", method_);
    finish(tl::make_unexpected(internal_error(Json("method did not answer"))));
  }
}

bool CallContext::is_cancelled() const {
  auto connection = connection_.lock();
  return connection == nullptr || connection->is_closed();
}

bool CallContext::has_finished() const {
  std::lock_guard lock{padlock_};
  return has_finished_;
}

bool CallContext::finish(MethodResult result) {
  Responder responder;
  {
    std::lock_guard lock{padlock_};
    if (has_finished_)
      return false;
    has_finished_ = true;
    responder = std::move(responder_);
  }

  if (!responder)
    return true;

  if (!request_id_.has_value()) {
    responder(std::nullopt, nullptr);
  } else if (result.has_value()) {
    responder(Response::success(*request_id_, std::move(*result)), nullptr);
  } else {
    responder(Response::failure(*request_id_, std::move(result.error())), nullptr);
  }
  return true;
}

} // namespace tandem::rpc
