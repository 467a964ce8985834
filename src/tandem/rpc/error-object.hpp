
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tandem::rpc {

using Json = nlohmann::json;

/**
 * @brief Error codes that appear on the wire. Application code may use any other integer.
 */
enum class ErrorCode : int32_t {
  PARSE_ERROR = -32700,
  INVALID_REQUEST = -32600,
  METHOD_NOT_FOUND = -32601,
  INVALID_PARAMS = -32602,
  INTERNAL_ERROR = -32603,
  CALL_EXECUTION_FAILED = -32000,
  TOO_MANY_SUBSCRIPTIONS = -32006,
  OVERSIZED_REQUEST = -32007,
  OVERSIZED_RESPONSE = -32008,
  SERVER_IS_BUSY = -32009,
  TOO_BIG_BATCH_REQUEST = -32010
};

constexpr std::string_view str(ErrorCode code) {
#define CASE(x)                                                                                    \
  case ErrorCode::x:                                                                               \
    return #x
  switch (code) {
    CASE(PARSE_ERROR);
    CASE(INVALID_REQUEST);
    CASE(METHOD_NOT_FOUND);
    CASE(INVALID_PARAMS);
    CASE(INTERNAL_ERROR);
    CASE(CALL_EXECUTION_FAILED);
    CASE(TOO_MANY_SUBSCRIPTIONS);
    CASE(OVERSIZED_REQUEST);
    CASE(OVERSIZED_RESPONSE);
    CASE(SERVER_IS_BUSY);
    CASE(TOO_BIG_BATCH_REQUEST);
  }
#undef CASE
  return "<unknown case>";
}

/**
 * @brief The `error` member of a JSON-RPC error response.
 */
struct ErrorObject {
  int64_t code = 0;
  std::string message = {};
  std::optional<Json> data = {};

  ErrorObject() = default;
  ErrorObject(int64_t code_, std::string message_, std::optional<Json> data_ = {})
      : code{code_}, message{std::move(message_)}, data{std::move(data_)} {}
  ErrorObject(ErrorCode code_, std::string message_, std::optional<Json> data_ = {})
      : code{static_cast<int64_t>(code_)}, message{std::move(message_)}, data{std::move(data_)} {}

  bool is(ErrorCode code_) const noexcept { return code == static_cast<int64_t>(code_); }

  Json to_json() const;

  /// `nullopt` unless `value` has an integer `code` and a string `message`.
  static std::optional<ErrorObject> from_json(const Json& value);

  std::string to_string() const;

  bool operator==(const ErrorObject&) const = default;
};

//@{ Factories for the errors the engine itself produces
ErrorObject parse_error();
ErrorObject invalid_request();
ErrorObject method_not_found();
ErrorObject invalid_params(std::optional<Json> data = {});
ErrorObject internal_error(std::optional<Json> data = {});
ErrorObject call_execution_failed(std::string message, std::optional<Json> data = {});
ErrorObject too_many_subscriptions(std::size_t limit);
ErrorObject oversized_request(std::size_t limit);
ErrorObject oversized_response(std::size_t limit);
ErrorObject server_is_busy();
ErrorObject batch_too_large(std::size_t length, std::size_t limit);
ErrorObject subscription_closed();
//@}

} // namespace tandem::rpc
