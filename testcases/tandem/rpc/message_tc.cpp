
#include "stdinc.hpp"

#include "tandem/rpc/message.hpp"

#include <catch2/catch_all.hpp>

namespace tandem::rpc::test {

namespace {
  template <typename T> const T& as(const tl::expected<Message, DecodeError>& decoded) {
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(std::holds_alternative<T>(*decoded));
    return std::get<T>(*decoded);
  }

  ErrorObject decode_failure(std::string_view text) {
    const auto decoded = decode(text);
    CATCH_REQUIRE(!decoded.has_value());
    return decoded.error().error;
  }
} // namespace

CATCH_TEST_CASE("Id", "[message]") {
  CATCH_REQUIRE(Id{1} != Id{"1"});
  CATCH_REQUIRE(Id{} == Id{});
  CATCH_REQUIRE(Id{7}.to_string() == "7");
  CATCH_REQUIRE(Id{"abc"}.to_string() == "\"abc\"");
  CATCH_REQUIRE(Id{}.to_string() == "null");

  CATCH_REQUIRE(Id::from_json(Json(3)) == Id{3});
  CATCH_REQUIRE(Id::from_json(Json("x")) == Id{"x"});
  CATCH_REQUIRE(Id::from_json(Json(nullptr)) == Id{});
  CATCH_REQUIRE(!Id::from_json(Json(-1)).has_value());
  CATCH_REQUIRE(!Id::from_json(Json(1.5)).has_value());
  CATCH_REQUIRE(!Id::from_json(Json::array()).has_value());

  std::unordered_set<Id> ids{Id{1}, Id{"1"}, Id{}};
  CATCH_REQUIRE(ids.size() == 3);
}

CATCH_TEST_CASE("Decode", "[message]") {
  CATCH_SECTION("request") {
    const auto decoded = decode(R"({"jsonrpc":"2.0","method":"echo","params":["x"],"id":1})");
    const auto& request = as<Request>(decoded);
    CATCH_REQUIRE(request.method == "echo");
    CATCH_REQUIRE(request.params.has_value());
    CATCH_REQUIRE(*request.params == Json::array({"x"}));
    CATCH_REQUIRE(request.id == Id{1});
  }

  CATCH_SECTION("notification") {
    const auto decoded = decode(R"({"jsonrpc":"2.0","method":"ping"})");
    const auto& notification = as<Notification>(decoded);
    CATCH_REQUIRE(notification.method == "ping");
    CATCH_REQUIRE(!notification.params.has_value());
  }

  CATCH_SECTION("null-params-is-absent") {
    const auto decoded = decode(R"({"jsonrpc":"2.0","method":"ping","params":null,"id":"a"})");
    const auto& request = as<Request>(decoded);
    CATCH_REQUIRE(!request.params.has_value());
    CATCH_REQUIRE(request.id == Id{"a"});
  }

  CATCH_SECTION("responses") {
    const auto& success = as<Response>(decode(R"({"jsonrpc":"2.0","result":{"a":1},"id":2})"));
    CATCH_REQUIRE(success.is_success());
    CATCH_REQUIRE(success.result() == Json{{"a", 1}});

    const auto decoded = decode(
        R"({"jsonrpc":"2.0","error":{"code":-32601,"message":"Method not found"},"id":null})");
    const auto& failure = as<Response>(decoded);
    CATCH_REQUIRE(!failure.is_success());
    CATCH_REQUIRE(failure.error().is(ErrorCode::METHOD_NOT_FOUND));
    CATCH_REQUIRE(failure.id.is_null());
  }

  CATCH_SECTION("parse-error") {
    CATCH_REQUIRE(decode_failure(R"({"jsonrpc":"2.0","method")").is(ErrorCode::PARSE_ERROR));
    CATCH_REQUIRE(decode_failure("").is(ErrorCode::PARSE_ERROR));
  }

  CATCH_SECTION("invalid-request") {
    CATCH_REQUIRE(decode_failure("1").is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(decode_failure("[]").is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(decode_failure(R"({"method":"x","id":1})").is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(
        decode_failure(R"({"jsonrpc":"1.0","method":"x","id":1})").is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(
        decode_failure(R"({"jsonrpc":"2.0","method":1,"id":1})").is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(decode_failure(R"({"jsonrpc":"2.0","method":"x","params":3,"id":1})")
                      .is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(decode_failure(R"({"jsonrpc":"2.0","method":"x","id":{"a":1}})")
                      .is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(decode_failure(R"({"jsonrpc":"2.0","result":1,"error":{},"id":1})")
                      .is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(
        decode_failure(R"({"jsonrpc":"2.0","result":1,"id":null})").is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(decode_failure(R"({"jsonrpc":"2.0","error":{"code":1.5,"message":"m"},"id":1})")
                      .is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(decode_failure(R"({"jsonrpc":"2.0","error":{"code":-1},"id":1})")
                      .is(ErrorCode::INVALID_REQUEST));
  }

  CATCH_SECTION("invalid-request-keeps-id") {
    const auto decoded = decode(R"({"jsonrpc":"2.0","method":"x","params":"bad","id":9})");
    CATCH_REQUIRE(!decoded.has_value());
    CATCH_REQUIRE(decoded.error().id == Id{9});
    const auto response = to_json(decoded.error().to_response());
    CATCH_REQUIRE(response["id"] == 9);
    CATCH_REQUIRE(response["error"]["code"] == -32600);
  }

  CATCH_SECTION("batch") {
    const auto decoded = decode(R"([{"jsonrpc":"2.0","method":"a","id":1},
                                    {"jsonrpc":"2.0","method":"b"},
                                    1,
                                    {"jsonrpc":"2.0","result":true,"id":4}])");
    const auto& batch = as<Batch>(decoded);
    CATCH_REQUIRE(batch.size() == 4);
    CATCH_REQUIRE(std::holds_alternative<Request>(batch[0]));
    CATCH_REQUIRE(std::holds_alternative<Notification>(batch[1]));
    CATCH_REQUIRE(std::holds_alternative<DecodeError>(batch[2]));
    CATCH_REQUIRE(std::get<DecodeError>(batch[2]).error.is(ErrorCode::INVALID_REQUEST));
    CATCH_REQUIRE(std::holds_alternative<Response>(batch[3]));
  }
}

CATCH_TEST_CASE("Encode", "[message]") {
  CATCH_SECTION("request") {
    CATCH_REQUIRE(encode_to_string(Request{"echo", Json::array({1, 2}), Id{5}}) ==
                  R"({"id":5,"jsonrpc":"2.0","method":"echo","params":[1,2]})");
    CATCH_REQUIRE(encode_to_string(Notification{"ping", std::nullopt}) ==
                  R"({"jsonrpc":"2.0","method":"ping"})");
  }

  CATCH_SECTION("response") {
    CATCH_REQUIRE(encode_to_string(Response::success(Id{"a"}, Json(true))) ==
                  R"({"id":"a","jsonrpc":"2.0","result":true})");
    CATCH_REQUIRE(encode_to_string(Response::failure(Id{}, method_not_found())) ==
                  R"({"error":{"code":-32601,"message":"Method not found"},"id":null,)"
                  R"("jsonrpc":"2.0"})");
  }

  CATCH_SECTION("error-data") {
    const auto json = oversized_request(100).to_json();
    CATCH_REQUIRE(json["code"] == -32007);
    CATCH_REQUIRE(json["message"] == "Request is too big");
    CATCH_REQUIRE(json["data"] == "Exceeded max limit of 100");
    CATCH_REQUIRE(ErrorObject::from_json(json) == oversized_request(100));
    CATCH_REQUIRE(!ErrorObject::from_json(Json{{"code", "x"}, {"message", "m"}}).has_value());
  }

  CATCH_SECTION("subscription-notifications") {
    const auto notification = make_subscription_notification("ticks", Id{3}, Json(42));
    CATCH_REQUIRE(dump(notification) ==
                  R"({"jsonrpc":"2.0","method":"ticks","params":{"result":42,"subscription":3}})");

    const auto closed = make_subscription_closed_notification("ticks", Id{3}, subscription_closed());
    CATCH_REQUIRE(closed["params"]["subscription"] == 3);
    CATCH_REQUIRE(closed["params"]["error"]["code"] == -32000);
    CATCH_REQUIRE(!closed["params"].contains("result"));
  }

  CATCH_SECTION("decode-of-encoded-request") {
    const Request request{"sum", Json{{"a", 1}}, Id{"r-1"}};
    CATCH_REQUIRE(as<Request>(decode(encode_to_string(request))) == request);
  }
}

} // namespace tandem::rpc::test
