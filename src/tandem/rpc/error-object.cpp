
#include "stdinc.hpp"

#include "error-object.hpp"

namespace tandem::rpc {

Json ErrorObject::to_json() const {
  Json out = Json::object();
  out["code"] = code;
  out["message"] = message;
  if (data.has_value())
    out["data"] = *data;
  return out;
}

std::optional<ErrorObject> ErrorObject::from_json(const Json& value) {
  if (!value.is_object())
    return std::nullopt;
  const auto code = value.find("code");
  const auto message = value.find("message");
  if (code == value.end() || !code->is_number_integer())
    return std::nullopt;
  if (message == value.end() || !message->is_string())
    return std::nullopt;

  ErrorObject out{code->get<int64_t>(), message->get<std::string>()};
  if (const auto data = value.find("data"); data != value.end())
    out.data = *data;
  return out;
}

std::string ErrorObject::to_string() const {
  if (data.has_value())
    return format("{{code={}, message='{}', data={}}}", code, message, data->dump());
  return format("{{code={}, message='{}'}}", code, message);
}

// --------------------------------------------------------------------------------------- factories

ErrorObject parse_error() { return {ErrorCode::PARSE_ERROR, "Parse error"}; }

ErrorObject invalid_request() { return {ErrorCode::INVALID_REQUEST, "Invalid request"}; }

ErrorObject method_not_found() { return {ErrorCode::METHOD_NOT_FOUND, "Method not found"}; }

ErrorObject invalid_params(std::optional<Json> data) {
  return {ErrorCode::INVALID_PARAMS, "Invalid params", std::move(data)};
}

ErrorObject internal_error(std::optional<Json> data) {
  return {ErrorCode::INTERNAL_ERROR, "Internal error", std::move(data)};
}

ErrorObject call_execution_failed(std::string message, std::optional<Json> data) {
  return {ErrorCode::CALL_EXECUTION_FAILED, std::move(message), std::move(data)};
}

ErrorObject too_many_subscriptions(std::size_t limit) {
  return {ErrorCode::TOO_MANY_SUBSCRIPTIONS, "Too many subscriptions on the connection",
          Json(format("Exceeded max limit of {}", limit))};
}

ErrorObject oversized_request(std::size_t limit) {
  return {ErrorCode::OVERSIZED_REQUEST, "Request is too big",
          Json(format("Exceeded max limit of {}", limit))};
}

ErrorObject oversized_response(std::size_t limit) {
  return {ErrorCode::OVERSIZED_RESPONSE, "Response is too big",
          Json(format("Exceeded max limit of {}", limit))};
}

ErrorObject server_is_busy() {
  return {ErrorCode::SERVER_IS_BUSY, "Server is busy, try again later"};
}

ErrorObject batch_too_large(std::size_t length, std::size_t limit) {
  return {ErrorCode::TOO_BIG_BATCH_REQUEST, "The batch request was too large",
          Json(format("Exceeded max limit of {}, got {}", limit, length))};
}

ErrorObject subscription_closed() {
  return {ErrorCode::CALL_EXECUTION_FAILED, "Subscription closed"};
}

} // namespace tandem::rpc
