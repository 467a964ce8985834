
#pragma once

#include "tandem/rpc/message.hpp"
#include "tandem/rpc/method-registry.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tandem::rpc {

class Connection;

/**
 * @brief Context for a single active call to an async method, on the server side.
 *
 * The method answers through `finish` (or `fail`) exactly once, from any thread. Later answers
 * are ignored. A context destroyed without an answer answers `internal_error`.
 */
class CallContext {
public:
  /// Told whether the answer was written as is; FALSE if it was replaced or never written.
  using SentHandler = std::function<void(bool is_delivered)>;
  /// Delivers the answer, then calls `on_sent` (if set).
  using Responder = std::function<void(std::optional<Response> response, SentHandler on_sent)>;

private:
  std::weak_ptr<Connection> connection_;
  std::optional<Id> request_id_;
  std::string method_;
  Responder responder_;
  mutable std::mutex padlock_;
  bool has_finished_{false};

public:
  CallContext(std::weak_ptr<Connection> connection, std::optional<Id> request_id,
              std::string method, Responder responder)
      : connection_{std::move(connection)}, request_id_{std::move(request_id)},
        method_{std::move(method)}, responder_{std::move(responder)} {}

  CallContext(const CallContext&) = delete;
  CallContext& operator=(const CallContext&) = delete;
  ~CallContext();

  /**
   * @brief The request-id; `nullopt` for a notification, whose answer is discarded.
   */
  const std::optional<Id>& request_id() const noexcept { return request_id_; }

  const std::string& method() const noexcept { return method_; }

  /**
   * @brief Return true iff the connection is gone, so any answer will be discarded.
   */
  bool is_cancelled() const;

  /**
   * @brief Return true iff the call has been answered
   */
  bool has_finished() const;

  /**
   * @brief Answers the call.
   * @return FALSE if the call was already answered.
   */
  bool finish(MethodResult result);

  bool fail(ErrorObject error) { return finish(tl::make_unexpected(std::move(error))); }
};

} // namespace tandem::rpc
