
#pragma once

#include "tandem/rpc/error-object.hpp"

#include "tandem/utils.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tandem::rpc {

/**
 * @brief The outcome the engine reports to clients: `ok()`, a local failure (`timeout`,
 *        `connection_closed`, ...), or `call_error` when the peer answered with an error object.
 */
class Status {
private:
  std::string error_message_{};
  std::optional<ErrorObject> error_object_{};
  ecode code_{ecode::okay};

public:
  Status(ecode code = ecode::okay, std::string error_message = "",
         std::optional<ErrorObject> error_object = {})
      : error_message_{std::move(error_message)}, error_object_{std::move(error_object)},
        code_{code} {}

  /// @brief The peer answered with `error`.
  static Status from_error_object(ErrorObject error) {
    auto message = error.message;
    return Status{ecode::call_error, std::move(message), std::move(error)};
  }

  ecode code() const { return code_; }
  std::error_code error_code() const { return make_error_code(code_); }
  std::string_view error_message() const { return error_message_; }
  const std::optional<ErrorObject>& error_object() const { return error_object_; }
  bool ok() const { return code_ == ecode::okay; }

  std::string to_string() const {
    if (error_object_.has_value())
      return format("{}: {}", error_code().message(), error_object_->to_string());
    if (error_message_.empty())
      return error_code().message();
    return format("{}: {}", error_code().message(), error_message_);
  }

  bool operator==(const Status& o) const {
    return (code_ == o.code_) && (error_message_ == o.error_message_) &&
           (error_object_ == o.error_object_);
  }
  bool operator!=(const Status& o) const { return !(*this == o); }
};

/**
 * @brief Thrown by blocking accessors (e.g., `PendingCall<R>::get()`) when the call failed.
 */
class CallError : public std::runtime_error {
private:
  Status status_;

public:
  explicit CallError(Status status)
      : std::runtime_error{status.to_string()}, status_{std::move(status)} {}

  const Status& status() const noexcept { return status_; }
};

} // namespace tandem::rpc
