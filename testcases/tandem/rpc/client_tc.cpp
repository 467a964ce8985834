
#include "stdinc.hpp"

#include "tandem/net/local-transport.hpp"
#include "tandem/rpc/client.hpp"
#include "tandem/rpc/server.hpp"
#include "tandem/test-helpers.hpp"

#include <catch2/catch_all.hpp>

#include <future>

namespace tandem::rpc::test {

using tandem::test::FrameCollector;
using tandem::test::IoFixture;
using tandem::test::wait_until;

namespace {
  struct Sinks {
    std::mutex padlock;
    std::vector<SubscriptionSink> sinks;

    std::optional<SubscriptionSink> at(std::size_t index) {
      std::lock_guard lock{padlock};
      if (index >= sinks.size())
        return std::nullopt;
      return sinks[index];
    }
  };

  MethodRegistry make_registry(std::shared_ptr<Sinks> sinks) {
    MethodRegistry registry;
    registry.register_method("echo", [](const Json& params) -> MethodResult { return params; });
    registry.register_subscription(
        "subscribe_numbers", "numbers", "unsubscribe_numbers",
        [sinks](const Json&, SubscriptionSink sink) -> tl::expected<void, ErrorObject> {
          sink.try_send(Json("first"));
          std::lock_guard lock{sinks->padlock};
          sinks->sinks.push_back(std::move(sink));
          return {};
        });
    return registry;
  }

  /// A client connected to a real server
  struct ServerHarness {
    IoFixture io{4};
    std::shared_ptr<Sinks> sinks = std::make_shared<Sinks>();
    std::shared_ptr<Server> server;
    std::shared_ptr<Client> client;

    explicit ServerHarness(ClientConfig config = {})
        : server{Server::make(make_registry(sinks), {}, io.executor())} {
      auto [client_end, server_end] = net::LocalTransport::make_pair(io.executor());
      CATCH_REQUIRE(server->accept(server_end).has_value());
      client = Client::make(client_end, io.timer_factory(), std::move(config));
    }

    ~ServerHarness() {
      client.reset();
      server->shutdown();
    }
  };

  /// A client whose peer is scripted by the test
  struct ScriptedHarness {
    IoFixture io{2};
    std::shared_ptr<net::LocalTransport> server_end;
    std::shared_ptr<FrameCollector> received = std::make_shared<FrameCollector>();
    std::shared_ptr<Client> client;

    explicit ScriptedHarness(ClientConfig config = {}) {
      auto [client_end, peer_end] = net::LocalTransport::make_pair(io.executor());
      server_end = peer_end;
      server_end->attach(received);
      client = Client::make(client_end, io.timer_factory(), std::move(config));
    }

    ~ScriptedHarness() { client.reset(); }

    void send(const Json& value) { server_end->send_message(encode_json(value)); }

    /// Answers received frame `index` with `result`
    void answer(std::size_t index, Json result) {
      CATCH_REQUIRE(received->wait_for_frames(index + 1));
      const auto request = received->json(index);
      send(Json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", std::move(result)}});
    }
  };

  SubscriptionItem next_item(Subscription& subscription) {
    auto item = subscription.next_for(std::chrono::milliseconds(2000));
    CATCH_REQUIRE(item.has_value());
    return std::move(*item);
  }
} // namespace

CATCH_TEST_CASE("ClientCalls", "[client]") {
  ServerHarness harness;
  auto& client = harness.client;

  CATCH_SECTION("request") {
    auto call = client->request("echo", Json::array({"x"}));
    CATCH_REQUIRE(call.id() == Id{1});
    CATCH_REQUIRE(call.get() == Json::array({"x"}));
    CATCH_REQUIRE(!call.valid());
    CATCH_REQUIRE(client->pending_count() == 0);
  }

  CATCH_SECTION("error-object") {
    auto call = client->request("missing");
    auto outcome = call.result();
    CATCH_REQUIRE(!outcome.has_value());
    CATCH_REQUIRE(outcome.error().code() == ecode::call_error);
    CATCH_REQUIRE(outcome.error().error_object()->is(ErrorCode::METHOD_NOT_FOUND));

    auto again = client->request("missing");
    CATCH_REQUIRE_THROWS_AS(again.get(), CallError);
  }

  CATCH_SECTION("completion-handler") {
    std::mutex padlock;
    std::optional<tl::expected<Json, Status>> outcome;
    client->call("echo", Json{{"k", "v"}}, [&](tl::expected<Json, Status> result) {
      std::lock_guard lock{padlock};
      outcome = std::move(result);
    });
    CATCH_REQUIRE(wait_until([&]() {
      std::lock_guard lock{padlock};
      return outcome.has_value();
    }));
    CATCH_REQUIRE(outcome->value() == Json{{"k", "v"}});
  }

  CATCH_SECTION("notification") {
    CATCH_REQUIRE(client->notification("echo", Json::array({1})).ok());
    CATCH_REQUIRE(client->request("echo", Json::array({2})).get() == Json::array({2}));
  }

  CATCH_SECTION("batch") {
    BatchRequestBuilder batch;
    batch.insert("echo", Json::array({1}))
        .insert_notification("echo", Json::array({2}))
        .insert("missing")
        .insert("echo", Json::array({3}));
    CATCH_REQUIRE(batch.size() == 4);
    CATCH_REQUIRE(batch.request_count() == 3);

    auto response = client->batch_request(batch).get();
    CATCH_REQUIRE(response.results.size() == 3);
    CATCH_REQUIRE(response.num_successful == 2);
    CATCH_REQUIRE(response.num_failed == 1);
    CATCH_REQUIRE(*response.results[0] == Json::array({1}));
    CATCH_REQUIRE(response.results[1].error().code() == ecode::call_error);
    CATCH_REQUIRE(*response.results[2] == Json::array({3}));
  }

  CATCH_SECTION("degenerate-batches") {
    auto empty = client->batch_request(BatchRequestBuilder{}).result();
    CATCH_REQUIRE(!empty.has_value());
    CATCH_REQUIRE(empty.error().code() == ecode::invalid_request);

    BatchRequestBuilder notifications;
    notifications.insert_notification("echo").insert_notification("echo");
    auto quiet = client->batch_request(notifications).get();
    CATCH_REQUIRE(quiet.results.empty());
  }

  CATCH_SECTION("oversized-request-fails-locally") {
    ClientConfig config;
    config.max_request_size = 64;
    ServerHarness small{config};
    auto outcome = small.client->request("echo", Json::array({std::string(100, 'x')})).result();
    CATCH_REQUIRE(outcome.error().code() == ecode::resource_exceeded);
    CATCH_REQUIRE(small.client->pending_count() == 0);
  }

  CATCH_SECTION("concurrent-request-limit") {
    ClientConfig config;
    config.max_concurrent_requests = 2;
    ServerHarness limited{config};
    std::vector<PendingCall<Json>> calls;
    for (int i = 0; i < 10; ++i)
      calls.push_back(limited.client->request("echo", Json::array({i})));
    for (int i = 0; i < 10; ++i)
      CATCH_REQUIRE(calls[std::size_t(i)].get() == Json::array({i}));
  }
}

CATCH_TEST_CASE("ClientSubscriptions", "[client]") {
  CATCH_SECTION("subscribe-next-close") {
    ServerHarness harness;
    auto subscription =
        harness.client->subscribe("subscribe_numbers", std::nullopt, "unsubscribe_numbers").get();
    CATCH_REQUIRE(subscription.valid());
    CATCH_REQUIRE(!subscription.id().is_null());
    CATCH_REQUIRE(harness.client->subscription_count() == 1);
    CATCH_REQUIRE(*next_item(subscription) == "first");

    CATCH_REQUIRE(wait_until([&]() { return harness.sinks->at(0).has_value(); }));
    auto sink = *harness.sinks->at(0);
    CATCH_REQUIRE(sink.subscription_id() == subscription.id());
    for (int i = 0; i < 5; ++i)
      CATCH_REQUIRE(sink.send(Json(i)) == async::ChannelStatus::OK);
    for (int i = 0; i < 5; ++i)
      CATCH_REQUIRE(*next_item(subscription) == i);

    sink.close();
    const auto last = next_item(subscription);
    CATCH_REQUIRE(!last.has_value());
    CATCH_REQUIRE(last.error().code() == ecode::call_error);
    CATCH_REQUIRE(last.error().error_object()->code == -32000);
    CATCH_REQUIRE(wait_until([&]() { return harness.client->subscription_count() == 0; }));
  }

  CATCH_SECTION("dropping-the-subscription-unsubscribes") {
    ServerHarness harness;
    {
      auto subscription =
          harness.client->subscribe("subscribe_numbers", std::nullopt, "unsubscribe_numbers")
              .get();
      CATCH_REQUIRE(*next_item(subscription) == "first");
    }
    CATCH_REQUIRE(wait_until([&]() { return harness.sinks->at(0).has_value(); }));
    auto sink = *harness.sinks->at(0);
    CATCH_REQUIRE(wait_until([&]() { return sink.is_closed(); }));
    CATCH_REQUIRE(harness.client->subscription_count() == 0);
  }

  CATCH_SECTION("explicit-unsubscribe-keeps-buffered-items") {
    ServerHarness harness;
    auto subscription =
        harness.client->subscribe("subscribe_numbers", std::nullopt, "unsubscribe_numbers").get();
    CATCH_REQUIRE(*next_item(subscription) == "first");
    CATCH_REQUIRE(wait_until([&]() { return harness.sinks->at(0).has_value(); }));
    CATCH_REQUIRE(harness.sinks->at(0)->send(Json("buffered")) == async::ChannelStatus::OK);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    subscription.unsubscribe();
    subscription.unsubscribe();
    CATCH_REQUIRE(*next_item(subscription) == "buffered");
    const auto item = next_item(subscription);
    CATCH_REQUIRE(item.error().code() == ecode::cancelled);
  }

  CATCH_SECTION("refused-subscribe") {
    ServerHarness harness;
    auto outcome = harness.client->subscribe("missing", std::nullopt, "unsubscribe_missing").result();
    CATCH_REQUIRE(!outcome.has_value());
    CATCH_REQUIRE(outcome.error().error_object()->is(ErrorCode::METHOD_NOT_FOUND));
  }
}

CATCH_TEST_CASE("ClientScripted", "[client]") {
  CATCH_SECTION("timeout-then-late-response") {
    ScriptedHarness harness;
    auto call = harness.client->request("slow", std::nullopt, std::chrono::milliseconds(20));
    auto outcome = call.result();
    CATCH_REQUIRE(outcome.error().code() == ecode::timeout);

    harness.answer(0, Json("too late"));
    CATCH_REQUIRE(harness.client->request("slow", std::nullopt, std::chrono::milliseconds(20))
                      .result()
                      .error()
                      .code() == ecode::timeout);
    CATCH_REQUIRE(harness.client->pending_count() == 0);
  }

  CATCH_SECTION("string-ids") {
    ClientConfig config;
    config.id_kind = IdKind::STRING;
    ScriptedHarness harness{config};
    auto call = harness.client->request("anything");
    CATCH_REQUIRE(harness.received->wait_for_frames(1));
    CATCH_REQUIRE(harness.received->json(0)["id"] == "1");
    CATCH_REQUIRE(call.id() == Id{"1"});
    harness.answer(0, Json(42));
    CATCH_REQUIRE(call.get() == 42);
  }

  CATCH_SECTION("method-subscription") {
    ScriptedHarness harness;
    auto news = harness.client->subscribe_to_method("news");
    CATCH_REQUIRE(news.has_value());
    CATCH_REQUIRE(news->id().is_null());
    CATCH_REQUIRE(!news->try_next().has_value());
    CATCH_REQUIRE(!harness.client->subscribe_to_method("news").has_value());

    harness.send(Json{{"jsonrpc", "2.0"}, {"method", "weather"}, {"params", {{"rain", true}}}});
    harness.send(Json{{"jsonrpc", "2.0"}, {"method", "news"}, {"params", {{"headline", "x"}}}});
    CATCH_REQUIRE((*next_item(*news))["headline"] == "x");

    news->unsubscribe();
    CATCH_REQUIRE(harness.client->subscription_count() == 0);
    CATCH_REQUIRE(harness.client->subscribe_to_method("news").has_value());
  }

  CATCH_SECTION("lagging-subscription-is-dropped") {
    ClientConfig config;
    config.max_buffer_capacity_per_subscription = 2;
    ScriptedHarness harness{config};

    auto pending = harness.client->subscribe("subscribe_x", std::nullopt, "unsubscribe_x");
    harness.answer(0, Json("sub-1"));
    auto subscription = pending.get();
    CATCH_REQUIRE(subscription.id() == Id{"sub-1"});

    for (int i = 0; i < 3; ++i)
      harness.send(make_subscription_notification("x", Id{"sub-1"}, Json(i)));

    CATCH_REQUIRE(harness.received->wait_for_frames(2));
    const auto unsubscribe = harness.received->json(1);
    CATCH_REQUIRE(unsubscribe["method"] == "unsubscribe_x");
    CATCH_REQUIRE(unsubscribe["params"] == Json::array({"sub-1"}));

    CATCH_REQUIRE(*next_item(subscription) == 0);
    CATCH_REQUIRE(*next_item(subscription) == 1);
    const auto end = next_item(subscription);
    CATCH_REQUIRE(end.error().code() == ecode::resource_exceeded);
  }

  CATCH_SECTION("server-requests-are-refused") {
    ScriptedHarness harness;
    harness.send(Json{{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 99}});
    CATCH_REQUIRE(harness.received->wait_for_frames(1));
    const auto reply = harness.received->json(0);
    CATCH_REQUIRE(reply["id"] == 99);
    CATCH_REQUIRE(reply["error"]["code"] == -32601);
  }

  CATCH_SECTION("dropped-call-frees-its-slot") {
    ClientConfig config;
    config.max_concurrent_requests = 1;
    ScriptedHarness harness{config};
    {
      auto abandoned = harness.client->request("unanswered");
      CATCH_REQUIRE(harness.received->wait_for_frames(1));
    }
    CATCH_REQUIRE(harness.client->pending_count() == 0);

    // Blocks forever if the dropped call still held the only slot
    auto next = std::async(std::launch::async,
                           [&harness]() { return harness.client->request("next"); });
    CATCH_REQUIRE(next.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    auto call = next.get();
    harness.answer(0, Json("ignored"));
    harness.answer(1, Json("answered"));
    CATCH_REQUIRE(call.get() == "answered");
    CATCH_REQUIRE(harness.client->pending_count() == 0);
  }

  CATCH_SECTION("cancelled-call-leaves-the-other-intact") {
    ClientConfig config;
    config.max_concurrent_requests = 2;
    ScriptedHarness harness{config};
    auto first = harness.client->request("first");
    auto second = harness.client->request("second");
    CATCH_REQUIRE(harness.received->wait_for_frames(2));

    first.cancel();
    CATCH_REQUIRE(!first.valid());
    CATCH_REQUIRE(harness.client->pending_count() == 1);

    harness.answer(0, Json("dropped"));
    harness.answer(1, Json("kept"));
    CATCH_REQUIRE(second.get() == "kept");
    CATCH_REQUIRE(harness.client->pending_count() == 0);

    // Both slots are free again
    auto third = harness.client->request("third");
    auto fourth = harness.client->request("fourth");
    harness.answer(2, Json(3));
    harness.answer(3, Json(4));
    CATCH_REQUIRE(third.get() == 3);
    CATCH_REQUIRE(fourth.get() == 4);
  }

  CATCH_SECTION("dropped-subscribe-unsubscribes-late-id") {
    ScriptedHarness harness;
    {
      auto pending = harness.client->subscribe("subscribe_x", std::nullopt, "unsubscribe_x");
      CATCH_REQUIRE(harness.received->wait_for_frames(1));
    }
    harness.answer(0, Json("sub-late"));

    CATCH_REQUIRE(harness.received->wait_for_frames(2));
    const auto unsubscribe = harness.received->json(1);
    CATCH_REQUIRE(unsubscribe["method"] == "unsubscribe_x");
    CATCH_REQUIRE(unsubscribe["params"] == Json::array({"sub-late"}));
    CATCH_REQUIRE(wait_until([&]() { return harness.client->subscription_count() == 0; }));
  }

  CATCH_SECTION("oversized-response-is-discarded") {
    ClientConfig config;
    config.max_response_size = 64;
    ScriptedHarness harness{config};
    auto large = harness.client->request("large", std::nullopt, std::chrono::milliseconds(100));
    harness.answer(0, Json(std::string(256, 'x')));
    CATCH_REQUIRE(large.result().error().code() == ecode::timeout);

    auto small = harness.client->request("small");
    harness.answer(1, Json("ok"));
    CATCH_REQUIRE(small.get() == "ok");
  }

  CATCH_SECTION("close-fails-everything") {
    ScriptedHarness harness;
    auto pending = harness.client->subscribe("subscribe_x", std::nullopt, "unsubscribe_x");
    harness.answer(0, Json(5));
    auto subscription = pending.get();
    auto call = harness.client->request("never-answered");
    auto other = harness.client->request("also-never-answered");
    CATCH_REQUIRE(harness.received->wait_for_frames(3));
    CATCH_REQUIRE(harness.client->pending_count() == 2);

    harness.server_end->close();
    CATCH_REQUIRE(call.result().error().code() == ecode::connection_closed);
    CATCH_REQUIRE(other.result().error().code() == ecode::connection_closed);
    CATCH_REQUIRE(harness.client->pending_count() == 0);
    CATCH_REQUIRE(next_item(subscription).error().code() == ecode::connection_closed);
    CATCH_REQUIRE(wait_until([&]() { return !harness.client->is_connected(); }));

    auto after = harness.client->request("echo").result();
    CATCH_REQUIRE(after.error().code() == ecode::connection_closed);
    CATCH_REQUIRE(!harness.client->subscribe_to_method("news").has_value());
  }
}

} // namespace tandem::rpc::test
