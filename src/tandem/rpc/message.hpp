
#pragma once

#include "tandem/rpc/error-object.hpp"
#include "tandem/rpc/id.hpp"

#include "tandem/net/buffer.hpp"

#include "tandem/utils.hpp"

#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

/**
 * @defgroup rpc-message JSON-RPC 2.0 Message Model
 * @ingroup rpc
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto message = rpc::decode(R"({"jsonrpc":"2.0","method":"echo","params":["x"],"id":1})");
 * if (message && std::holds_alternative<rpc::Request>(*message)) { ... }
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace tandem::rpc {

struct Request {
  std::string method = {};
  std::optional<Json> params = {}; //!< Array or object, when present
  Id id = {};

  bool operator==(const Request&) const = default;
};

struct Notification {
  std::string method = {};
  std::optional<Json> params = {};

  bool operator==(const Notification&) const = default;
};

struct Response {
  Id id = {};
  std::variant<Json, ErrorObject> payload = Json{};

  static Response success(Id id, Json result) { return {std::move(id), std::move(result)}; }
  static Response failure(Id id, ErrorObject error) { return {std::move(id), std::move(error)}; }

  bool is_success() const noexcept { return std::holds_alternative<Json>(payload); }
  const Json& result() const { return std::get<Json>(payload); }
  const ErrorObject& error() const { return std::get<ErrorObject>(payload); }

  bool operator==(const Response&) const = default;
};

/**
 * @brief A value that could not be decoded. `id` is the offending object's id when it could be
 *        recovered, and null otherwise; answer it with `Response::failure(id, error)`.
 */
struct DecodeError {
  ErrorObject error = {};
  Id id = {};

  Response to_response() const { return Response::failure(id, error); }

  bool operator==(const DecodeError&) const = default;
};

/// A batch member. Members are decoded individually, so one bad member is a `DecodeError`.
using BatchEntry = std::variant<Request, Notification, Response, DecodeError>;
using Batch = std::vector<BatchEntry>;

using Message = std::variant<Request, Notification, Response, Batch>;

//@{ decode
/**
 * @brief Decodes one wire frame.
 *
 * A frame that is not JSON is a `parse_error`. Valid JSON that is not a JSON-RPC 2.0 request,
 * notification, response, or non-empty array of these is an `invalid_request`.
 */
tl::expected<Message, DecodeError> decode(std::string_view text);
tl::expected<Message, DecodeError> decode(std::span<const std::byte> frame);

/// @brief Classifies an already parsed JSON value.
tl::expected<Message, DecodeError> decode_value(const Json& value);
//@}

//@{ encode: compact JSON, without absent `params` or `error.data`
Json to_json(const Request& request);
Json to_json(const Notification& notification);
Json to_json(const Response& response);
Json to_json(const BatchEntry& entry);
Json to_json(const Message& message);

/// Compact, with invalid UTF-8 replaced
std::string dump(const Json& value);
net::BufferType encode_json(const Json& value);

std::string encode_to_string(const Message& message);
net::BufferType encode(const Message& message);
//@}

/**
 * @brief `{"jsonrpc":"2.0","method":<method>,"params":{"subscription":<id>,"result":<payload>}}`
 */
Json make_subscription_notification(std::string_view method, const Id& subscription_id,
                                    Json payload);

/**
 * @brief As `make_subscription_notification`, but carries `"error"` instead of `"result"`,
 *        marking the end of the subscription.
 */
Json make_subscription_closed_notification(std::string_view method, const Id& subscription_id,
                                           const ErrorObject& error);

} // namespace tandem::rpc
