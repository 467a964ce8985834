
#include "stdinc.hpp"

#include "tandem/rpc/method-registry.hpp"
#include "tandem/rpc/subscription-sink.hpp"

#include <catch2/catch_all.hpp>

namespace tandem::rpc::test {

CATCH_TEST_CASE("MethodRegistry", "[method-registry]") {
  MethodRegistry registry;
  registry.register_method("echo", [](const Json& params) -> MethodResult { return params; });
  registry.register_subscription(
      "subscribe_ticks", "ticks", "unsubscribe_ticks",
      [](const Json&, SubscriptionSink) -> tl::expected<void, ErrorObject> { return {}; });

  CATCH_SECTION("lookup") {
    CATCH_REQUIRE(registry.size() == 3);
    CATCH_REQUIRE(registry.contains("echo"));
    CATCH_REQUIRE(!registry.contains("Echo"));
    CATCH_REQUIRE(registry.find("missing") == nullptr);
    CATCH_REQUIRE(registry.method_names() ==
                  std::vector<std::string>{"echo", "subscribe_ticks", "unsubscribe_ticks"});

    const auto* subscribe = registry.find("subscribe_ticks");
    CATCH_REQUIRE(subscribe != nullptr);
    CATCH_REQUIRE(std::holds_alternative<SubscribeMethod>(*subscribe));
    CATCH_REQUIRE(std::get<SubscribeMethod>(*subscribe).notification_method == "ticks");
    CATCH_REQUIRE(std::get<SubscribeMethod>(*subscribe).unsubscribe_method == "unsubscribe_ticks");

    const auto* unsubscribe = registry.find("unsubscribe_ticks");
    CATCH_REQUIRE(std::get<UnsubscribeMethod>(*unsubscribe).subscribe_method == "subscribe_ticks");
  }

  CATCH_SECTION("duplicates-are-rejected") {
    CATCH_REQUIRE_THROWS_AS(
        registry.register_method("echo", [](const Json&) -> MethodResult { return Json{}; }),
        std::system_error);
    CATCH_REQUIRE_THROWS_AS(registry.register_async_method(
                                "unsubscribe_ticks", [](const Json&, std::shared_ptr<CallContext>) {}),
                            std::system_error);

    MethodRegistry other;
    other.register_method("echo", [](const Json&) -> MethodResult { return Json{}; });
    CATCH_REQUIRE_THROWS_AS(registry.merge(std::move(other)), std::system_error);
    CATCH_REQUIRE(registry.size() == 3);
  }

  CATCH_SECTION("merge") {
    MethodRegistry other;
    other.register_method("add", [](const Json&) -> MethodResult { return Json(0); });
    registry.merge(std::move(other));
    CATCH_REQUIRE(registry.contains("add"));
    CATCH_REQUIRE(registry.size() == 4);
  }

  CATCH_SECTION("invoke-guarded") {
    auto ok = invoke_guarded("add", []() -> MethodResult { return Json(3); });
    CATCH_REQUIRE(ok.has_value());
    CATCH_REQUIRE(*ok == 3);

    const Json params = Json::array({"not a number"});
    auto bad_type = invoke_guarded("add", [&]() -> MethodResult { return param<int>(params, 0); });
    CATCH_REQUIRE(!bad_type.has_value());
    CATCH_REQUIRE(bad_type.error().is(ErrorCode::INVALID_PARAMS));

    auto missing = invoke_guarded("add", [&]() -> MethodResult { return param<int>(params, 3); });
    CATCH_REQUIRE(missing.error().is(ErrorCode::INVALID_PARAMS));

    auto named = invoke_guarded(
        "add", [&]() -> MethodResult { return param<int>(Json{{"a", 2}}, "a"); });
    CATCH_REQUIRE(*named == 2);

    auto threw = invoke_guarded("add", []() -> MethodResult { throw std::logic_error("boom"); });
    CATCH_REQUIRE(threw.error().is(ErrorCode::INTERNAL_ERROR));
    CATCH_REQUIRE(threw.error().data.has_value());
    CATCH_REQUIRE(*threw.error().data == "boom");
  }
}

} // namespace tandem::rpc::test
