
#include "stdinc.hpp"

#include "message.hpp"

namespace tandem::rpc {

namespace {
  constexpr std::string_view k_version = "2.0";

  /// Recover the id of a malformed object, so the error response can carry it
  Id recover_id_(const Json& value) {
    if (!value.is_object())
      return Id{};
    const auto ii = value.find("id");
    if (ii == value.end())
      return Id{};
    return Id::from_json(*ii).value_or(Id{});
  }

  DecodeError invalid_(const Json& value) {
    return DecodeError{invalid_request(), recover_id_(value)};
  }

  /// `params` is absent, null, an array or an object
  bool decode_params_(const Json& value, std::optional<Json>& params) {
    const auto ii = value.find("params");
    if (ii == value.end() || ii->is_null())
      return true;
    if (!ii->is_array() && !ii->is_object())
      return false;
    params = *ii;
    return true;
  }

  tl::expected<BatchEntry, DecodeError> decode_object_(const Json& value) {
    if (!value.is_object())
      return tl::make_unexpected(invalid_(value));

    const auto version = value.find("jsonrpc");
    if (version == value.end() || !version->is_string() ||
        version->get_ref<const std::string&>() != k_version)
      return tl::make_unexpected(invalid_(value));

    const auto method = value.find("method");
    const auto id = value.find("id");
    const auto result = value.find("result");
    const auto error = value.find("error");

    if (method != value.end()) { // Request or Notification
      if (!method->is_string() || result != value.end() || error != value.end())
        return tl::make_unexpected(invalid_(value));

      std::optional<Json> params;
      if (!decode_params_(value, params))
        return tl::make_unexpected(invalid_(value));

      if (id == value.end())
        return Notification{method->get<std::string>(), std::move(params)};

      auto decoded_id = Id::from_json(*id);
      if (!decoded_id.has_value())
        return tl::make_unexpected(invalid_(value));
      return Request{method->get<std::string>(), std::move(params), std::move(*decoded_id)};
    }

    // Response: exactly one of `result` and `error`
    const bool has_result = (result != value.end());
    const bool has_error = (error != value.end());
    if (has_result == has_error || id == value.end())
      return tl::make_unexpected(invalid_(value));

    auto decoded_id = Id::from_json(*id);
    if (!decoded_id.has_value())
      return tl::make_unexpected(invalid_(value));

    if (has_result) {
      if (decoded_id->is_null()) // only errors may be correlated to nothing
        return tl::make_unexpected(invalid_(value));
      return Response::success(std::move(*decoded_id), *result);
    }

    auto error_object = ErrorObject::from_json(*error);
    if (!error_object.has_value())
      return tl::make_unexpected(invalid_(value));
    return Response::failure(std::move(*decoded_id), std::move(*error_object));
  }

  Json envelope_() {
    Json out = Json::object();
    out["jsonrpc"] = k_version;
    return out;
  }
} // namespace

// ------------------------------------------------------------------------------------------ decode

tl::expected<Message, DecodeError> decode_value(const Json& value) {
  if (value.is_array()) {
    if (value.empty())
      return tl::make_unexpected(DecodeError{invalid_request(), Id{}});

    Batch batch;
    batch.reserve(value.size());
    for (const auto& member : value) {
      auto entry = decode_object_(member);
      if (entry)
        batch.push_back(std::move(*entry));
      else
        batch.push_back(std::move(entry.error()));
    }
    return batch;
  }

  auto entry = decode_object_(value);
  if (!entry)
    return tl::make_unexpected(std::move(entry.error()));

  return std::visit(
      [](auto&& alternative) -> tl::expected<Message, DecodeError> {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, DecodeError>)
          return tl::make_unexpected(std::move(alternative));
        else
          return Message{std::move(alternative)};
      },
      std::move(*entry));
}

tl::expected<Message, DecodeError> decode(std::string_view text) {
  auto value = Json::parse(text.begin(), text.end(), nullptr, false);
  if (value.is_discarded())
    return tl::make_unexpected(DecodeError{parse_error(), Id{}});
  return decode_value(value);
}

tl::expected<Message, DecodeError> decode(std::span<const std::byte> frame) {
  return decode(net::to_string_view(frame));
}

// ------------------------------------------------------------------------------------------ encode

Json to_json(const Request& request) {
  Json out = envelope_();
  out["method"] = request.method;
  if (request.params.has_value())
    out["params"] = *request.params;
  out["id"] = request.id.to_json();
  return out;
}

Json to_json(const Notification& notification) {
  Json out = envelope_();
  out["method"] = notification.method;
  if (notification.params.has_value())
    out["params"] = *notification.params;
  return out;
}

Json to_json(const Response& response) {
  Json out = envelope_();
  if (response.is_success())
    out["result"] = response.result();
  else
    out["error"] = response.error().to_json();
  out["id"] = response.id.to_json();
  return out;
}

Json to_json(const BatchEntry& entry) {
  return std::visit(
      [](const auto& alternative) -> Json {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, DecodeError>)
          return to_json(alternative.to_response());
        else
          return to_json(alternative);
      },
      entry);
}

Json to_json(const Message& message) {
  return std::visit(
      [](const auto& alternative) -> Json {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, Batch>) {
          Json out = Json::array();
          for (const auto& entry : alternative)
            out.push_back(to_json(entry));
          return out;
        } else {
          return to_json(alternative);
        }
      },
      message);
}

std::string dump(const Json& value) {
  return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string encode_to_string(const Message& message) { return dump(to_json(message)); }

net::BufferType encode_json(const Json& value) { return net::make_send_buffer(dump(value)); }

net::BufferType encode(const Message& message) { return encode_json(to_json(message)); }

// ----------------------------------------------------------------------------------- subscriptions

Json make_subscription_notification(std::string_view method, const Id& subscription_id,
                                    Json payload) {
  Json params = Json::object();
  params["subscription"] = subscription_id.to_json();
  params["result"] = std::move(payload);
  return to_json(Notification{std::string{method}, std::move(params)});
}

Json make_subscription_closed_notification(std::string_view method, const Id& subscription_id,
                                           const ErrorObject& error) {
  Json params = Json::object();
  params["subscription"] = subscription_id.to_json();
  params["error"] = error.to_json();
  return to_json(Notification{std::string{method}, std::move(params)});
}

} // namespace tandem::rpc
