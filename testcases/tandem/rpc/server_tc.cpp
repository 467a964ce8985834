
#include "stdinc.hpp"

#include "tandem/net/local-transport.hpp"
#include "tandem/rpc/call-context.hpp"
#include "tandem/rpc/server.hpp"
#include "tandem/test-helpers.hpp"

#include <catch2/catch_all.hpp>

#include <future>

namespace tandem::rpc::test {

using tandem::test::FrameCollector;
using tandem::test::IoFixture;
using tandem::test::wait_until;

namespace {
  /// State shared between the registered methods and the test body
  struct Shared {
    std::mutex padlock;
    std::vector<SubscriptionSink> sinks;
    std::vector<std::shared_ptr<CallContext>> held;

    std::size_t held_count() {
      std::lock_guard lock{padlock};
      return held.size();
    }

    std::shared_ptr<CallContext> held_at(std::size_t index) {
      std::lock_guard lock{padlock};
      return held.at(index);
    }

    std::optional<SubscriptionSink> sink_at(std::size_t index) {
      std::lock_guard lock{padlock};
      if (index >= sinks.size())
        return std::nullopt;
      return sinks[index];
    }
  };

  MethodRegistry make_registry(std::shared_ptr<Shared> shared, IoFixture& io) {
    MethodRegistry registry;

    registry.register_method("echo", [](const Json& params) -> MethodResult { return params; });

    registry.register_method("add", [](const Json& params) -> MethodResult {
      return param<int>(params, 0) + param<int>(params, 1);
    });

    registry.register_method("refuse", [](const Json&) -> MethodResult {
      return tl::make_unexpected(ErrorObject{-1, "refused", Json("not allowed")});
    });

    registry.register_async_method(
        "delayed", [&io](const Json& params, std::shared_ptr<CallContext> context) {
          auto timer = std::make_shared<boost::asio::steady_timer>(io.executor());
          timer->expires_after(std::chrono::milliseconds(20));
          timer->async_wait([timer, context, params](const boost::system::error_code&) {
            context->finish(params);
          });
        });

    registry.register_async_method("hold",
                                   [shared](const Json&, std::shared_ptr<CallContext> context) {
                                     std::lock_guard lock{shared->padlock};
                                     shared->held.push_back(std::move(context));
                                   });

    registry.register_async_method("forget", [](const Json&, std::shared_ptr<CallContext>) {});

    registry.register_subscription(
        "subscribe_numbers", "numbers", "unsubscribe_numbers",
        [shared](const Json& params, SubscriptionSink sink) -> tl::expected<void, ErrorObject> {
          if (params.is_array() && !params.empty() && params[0] == "refuse")
            return tl::make_unexpected(ErrorObject{-5, "not today"});
          sink.try_send(Json("first"));
          std::lock_guard lock{shared->padlock};
          shared->sinks.push_back(std::move(sink));
          return {};
        });

    registry.register_subscription(
        "subscribe_other", "other", "unsubscribe_other",
        [](const Json&, SubscriptionSink) -> tl::expected<void, ErrorObject> { return {}; });

    return registry;
  }

  /// A server, with client ends connected over local transports
  struct Harness {
    IoFixture io{4};
    std::shared_ptr<Shared> shared = std::make_shared<Shared>();
    std::shared_ptr<Server> server;

    struct Peer {
      std::shared_ptr<net::LocalTransport> transport;
      std::shared_ptr<FrameCollector> frames;

      void send(std::string_view text) { transport->send_message(net::make_send_buffer(text)); }
    };

    explicit Harness(ServerConfig config = {},
                     std::shared_ptr<SubscriptionIdProvider> id_provider = nullptr)
        : server{Server::make(make_registry(shared, io), std::move(config), io.executor(),
                              std::move(id_provider))} {}

    ~Harness() { server->shutdown(); }

    Peer connect() {
      auto [client_end, server_end] = net::LocalTransport::make_pair(io.executor());
      Peer peer{client_end, std::make_shared<FrameCollector>()};
      client_end->attach(peer.frames);
      auto accepted = server->accept(server_end);
      CATCH_REQUIRE(accepted.has_value());
      return peer;
    }
  };

  /// The member of a batch response carrying `id`
  Json member_with_id(const Json& batch, const Json& id) {
    for (const auto& member : batch)
      if (member["id"] == id)
        return member;
    return Json{};
  }
} // namespace

CATCH_TEST_CASE("ServerCalls", "[server]") {
  Harness harness;
  auto peer = harness.connect();

  CATCH_SECTION("request") {
    peer.send(R"({"jsonrpc":"2.0","method":"echo","params":["x"],"id":1})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    CATCH_REQUIRE(peer.frames->frame(0) == R"({"id":1,"jsonrpc":"2.0","result":["x"]})");
  }

  CATCH_SECTION("params-are-passed-through") {
    peer.send(R"({"jsonrpc":"2.0","method":"add","params":[2,3],"id":"sum"})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    const auto reply = peer.frames->json(0);
    CATCH_REQUIRE(reply["id"] == "sum");
    CATCH_REQUIRE(reply["result"] == 5);
  }

  CATCH_SECTION("notification-gets-no-reply") {
    peer.send(R"({"jsonrpc":"2.0","method":"echo","params":["quiet"]})");
    peer.send(R"({"jsonrpc":"2.0","method":"missing"})");
    peer.send(R"({"jsonrpc":"2.0","method":"echo","params":["loud"],"id":2})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CATCH_REQUIRE(peer.frames->size() == 1);
    CATCH_REQUIRE(peer.frames->json(0)["id"] == 2);
  }

  CATCH_SECTION("errors") {
    peer.send(R"({"jsonrpc":"2.0","method":"missing","id":3})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    CATCH_REQUIRE(peer.frames->frame(0) ==
                  R"({"error":{"code":-32601,"message":"Method not found"},"id":3,"jsonrpc":"2.0"})");

    peer.send(R"({"jsonrpc":"2.0","method":"echo",)");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    CATCH_REQUIRE(peer.frames->frame(1) ==
                  R"({"error":{"code":-32700,"message":"Parse error"},"id":null,"jsonrpc":"2.0"})");

    peer.send(R"({"jsonrpc":"2.0","method":1,"id":4})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(3));
    CATCH_REQUIRE(peer.frames->json(2)["error"]["code"] == -32600);
    CATCH_REQUIRE(peer.frames->json(2)["id"] == 4);

    peer.send(R"({"jsonrpc":"2.0","method":"add","params":["a"],"id":5})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(4));
    CATCH_REQUIRE(peer.frames->json(3)["error"]["code"] == -32602);

    peer.send(R"({"jsonrpc":"2.0","method":"refuse","id":6})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(5));
    const auto refused = peer.frames->json(4);
    CATCH_REQUIRE(refused["error"]["code"] == -1);
    CATCH_REQUIRE(refused["error"]["message"] == "refused");
    CATCH_REQUIRE(refused["error"]["data"] == "not allowed");
  }

  CATCH_SECTION("responses-are-ignored") {
    peer.send(R"({"jsonrpc":"2.0","result":1,"id":7})");
    peer.send(R"({"jsonrpc":"2.0","method":"echo","id":8})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CATCH_REQUIRE(peer.frames->size() == 1);
    CATCH_REQUIRE(peer.frames->json(0)["id"] == 8);
    CATCH_REQUIRE(peer.frames->json(0)["result"].is_null());
  }

  CATCH_SECTION("batch") {
    peer.send(R"([{"jsonrpc":"2.0","method":"echo","params":[1],"id":1},
                  {"jsonrpc":"2.0","method":"echo","params":[2]},
                  {"jsonrpc":"2.0","method":"missing","id":2},
                  {"jsonrpc":"2.0","method":"delayed","params":{"late":true},"id":3},
                  7])");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    const auto batch = peer.frames->json(0);
    CATCH_REQUIRE(batch.is_array());
    CATCH_REQUIRE(batch.size() == 4);
    CATCH_REQUIRE(member_with_id(batch, 1)["result"] == Json::array({1}));
    CATCH_REQUIRE(member_with_id(batch, 2)["error"]["code"] == -32601);
    CATCH_REQUIRE(member_with_id(batch, 3)["result"]["late"] == true);
    CATCH_REQUIRE(member_with_id(batch, nullptr)["error"]["code"] == -32600);
  }

  CATCH_SECTION("notification-only-batch-gets-no-reply") {
    peer.send(R"([{"jsonrpc":"2.0","method":"echo"},{"jsonrpc":"2.0","method":"echo"}])");
    peer.send(R"({"jsonrpc":"2.0","method":"echo","id":9})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CATCH_REQUIRE(peer.frames->size() == 1);
    CATCH_REQUIRE(peer.frames->json(0)["id"] == 9);
  }

  CATCH_SECTION("empty-batch") {
    peer.send("[]");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    CATCH_REQUIRE(peer.frames->json(0)["error"]["code"] == -32600);
  }

  CATCH_SECTION("async-methods") {
    peer.send(R"({"jsonrpc":"2.0","method":"delayed","params":["later"],"id":10})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    CATCH_REQUIRE(peer.frames->json(0)["result"] == Json::array({"later"}));

    peer.send(R"({"jsonrpc":"2.0","method":"forget","id":11})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    const auto forgotten = peer.frames->json(1);
    CATCH_REQUIRE(forgotten["id"] == 11);
    CATCH_REQUIRE(forgotten["error"]["code"] == -32603);
  }

  CATCH_SECTION("answered-once") {
    peer.send(R"({"jsonrpc":"2.0","method":"hold","id":12})");
    CATCH_REQUIRE(wait_until([&]() { return harness.shared->held_count() == 1; }));
    auto context = harness.shared->held_at(0);
    CATCH_REQUIRE(context->request_id() == Id{12});
    CATCH_REQUIRE(context->method() == "hold");
    CATCH_REQUIRE(!context->is_cancelled());
    CATCH_REQUIRE(context->finish(Json("once")));
    CATCH_REQUIRE(!context->fail(internal_error()));
    CATCH_REQUIRE(context->has_finished());
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CATCH_REQUIRE(peer.frames->size() == 1);
    CATCH_REQUIRE(peer.frames->json(0)["result"] == "once");
  }
}

CATCH_TEST_CASE("ServerLimits", "[server]") {
  CATCH_SECTION("oversized-request") {
    ServerConfig config;
    config.max_request_body_size = 64;
    Harness harness{config};
    auto peer = harness.connect();

    peer.send(format(R"({{"jsonrpc":"2.0","method":"echo","params":["{}"],"id":1}})",
                     std::string(100, 'x')));
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    const auto reply = peer.frames->json(0);
    CATCH_REQUIRE(reply["id"].is_null());
    CATCH_REQUIRE(reply["error"]["code"] == -32007);
    CATCH_REQUIRE(reply["error"]["message"] == "Request is too big");
  }

  CATCH_SECTION("oversized-response") {
    ServerConfig config;
    config.max_response_body_size = 100;
    Harness harness{config};
    auto peer = harness.connect();

    peer.send(format(R"({{"jsonrpc":"2.0","method":"echo","params":["{}"],"id":2}})",
                     std::string(200, 'x')));
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    const auto reply = peer.frames->json(0);
    CATCH_REQUIRE(reply["id"] == 2);
    CATCH_REQUIRE(reply["error"]["code"] == -32008);
  }

  CATCH_SECTION("batch-too-large") {
    ServerConfig config;
    config.max_batch_length = 2;
    Harness harness{config};
    auto peer = harness.connect();

    peer.send(R"([{"jsonrpc":"2.0","method":"echo","id":1},
                  {"jsonrpc":"2.0","method":"echo","id":2},
                  {"jsonrpc":"2.0","method":"echo","id":3}])");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    const auto reply = peer.frames->json(0);
    CATCH_REQUIRE(reply.is_object());
    CATCH_REQUIRE(reply["id"].is_null());
    CATCH_REQUIRE(reply["error"]["code"] == -32010);

    peer.send(R"([{"jsonrpc":"2.0","method":"echo","id":1},
                  {"jsonrpc":"2.0","method":"echo","id":2}])");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    CATCH_REQUIRE(peer.frames->json(1).size() == 2);
  }

  CATCH_SECTION("in-flight-calls-wait-for-a-slot") {
    ServerConfig config;
    config.max_in_flight_per_connection = 1;
    Harness harness{config};
    auto peer = harness.connect();

    peer.send(R"({"jsonrpc":"2.0","method":"hold","id":1})");
    peer.send(R"({"jsonrpc":"2.0","method":"hold","id":2})");
    CATCH_REQUIRE(wait_until([&]() { return harness.shared->held_count() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CATCH_REQUIRE(harness.shared->held_count() == 1); // the second waits

    harness.shared->held_at(0)->finish(Json(1));
    CATCH_REQUIRE(wait_until([&]() { return harness.shared->held_count() == 2; }));
    CATCH_REQUIRE(harness.shared->held_at(1)->request_id() == Id{2});
    harness.shared->held_at(1)->finish(Json(2));

    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    CATCH_REQUIRE(peer.frames->json(0)["result"] == 1);
    CATCH_REQUIRE(peer.frames->json(1)["result"] == 2);
  }

  CATCH_SECTION("max-connections") {
    ServerConfig config;
    config.max_connections = 1;
    Harness harness{config};
    auto first = harness.connect();

    auto [client_end, server_end] = net::LocalTransport::make_pair(harness.io.executor());
    auto frames = std::make_shared<FrameCollector>();
    client_end->attach(frames);
    auto refused = harness.server->accept(server_end);
    CATCH_REQUIRE(!refused.has_value());
    CATCH_REQUIRE(refused.error().code() == ecode::resource_exceeded);
    CATCH_REQUIRE(refused.error().error_object()->is(ErrorCode::SERVER_IS_BUSY));
    CATCH_REQUIRE(frames->wait_for_close());

    first.transport->close();
    CATCH_REQUIRE(wait_until([&]() { return harness.server->connection_count() == 0; }));
    auto second = harness.connect();
    second.send(R"({"jsonrpc":"2.0","method":"echo","id":1})");
    CATCH_REQUIRE(second.frames->wait_for_frames(1));
  }

  CATCH_SECTION("shutdown-waits-for-async-methods") {
    Harness harness;
    auto peer = harness.connect();
    peer.send(R"({"jsonrpc":"2.0","method":"hold","id":1})");
    CATCH_REQUIRE(wait_until([&]() { return harness.shared->held_count() == 1; }));
    auto context = harness.shared->held_at(0);

    auto shutdown = std::async(std::launch::async, [&harness]() { harness.server->shutdown(); });
    CATCH_REQUIRE(wait_until([&]() { return context->is_cancelled(); }));
    CATCH_REQUIRE(shutdown.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);

    CATCH_REQUIRE(context->finish(Json("too late")));
    CATCH_REQUIRE(shutdown.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    CATCH_REQUIRE(harness.server->connection_count() == 0);
  }

  CATCH_SECTION("shutdown-refuses-new-transports") {
    Harness harness;
    auto peer = harness.connect();
    harness.server->shutdown();
    CATCH_REQUIRE(peer.frames->wait_for_close());
    CATCH_REQUIRE(harness.server->connection_count() == 0);

    auto [client_end, server_end] = net::LocalTransport::make_pair(harness.io.executor());
    auto refused = harness.server->accept(server_end);
    CATCH_REQUIRE(!refused.has_value());
    CATCH_REQUIRE(refused.error().code() == ecode::connection_closed);
  }
}

CATCH_TEST_CASE("ServerSubscriptions", "[server]") {
  CATCH_SECTION("notifications-follow-the-subscription-id") {
    Harness harness;
    auto peer = harness.connect();

    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_numbers","id":1})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    const auto subscription_id = peer.frames->json(0)["result"];
    CATCH_REQUIRE(peer.frames->json(0)["id"] == 1);
    CATCH_REQUIRE(!subscription_id.is_null());

    const auto first = peer.frames->json(1);
    CATCH_REQUIRE(first["method"] == "numbers");
    CATCH_REQUIRE(first["params"]["subscription"] == subscription_id);
    CATCH_REQUIRE(first["params"]["result"] == "first");

    auto sink = harness.shared->sink_at(0);
    CATCH_REQUIRE(sink.has_value());
    CATCH_REQUIRE(sink->subscription_id().to_json() == subscription_id);
    CATCH_REQUIRE(sink->notification_method() == "numbers");
    for (int i = 0; i < 20; ++i)
      CATCH_REQUIRE(sink->send(Json(i)) == async::ChannelStatus::OK);

    CATCH_REQUIRE(peer.frames->wait_for_frames(22));
    for (int i = 0; i < 20; ++i)
      CATCH_REQUIRE(peer.frames->json(std::size_t(i + 2))["params"]["result"] == i);

    sink->close();
    CATCH_REQUIRE(peer.frames->wait_for_frames(23));
    const auto closed = peer.frames->json(22);
    CATCH_REQUIRE(closed["method"] == "numbers");
    CATCH_REQUIRE(closed["params"]["subscription"] == subscription_id);
    CATCH_REQUIRE(closed["params"]["error"]["code"] == -32000);
    CATCH_REQUIRE(closed["params"]["error"]["message"] == "Subscription closed");
    CATCH_REQUIRE(sink->send(Json("after close")) == async::ChannelStatus::CLOSED);

    // The closed subscription is gone
    peer.send(format(R"({{"jsonrpc":"2.0","method":"unsubscribe_numbers","params":[{}],"id":2}})",
                     subscription_id.dump()));
    CATCH_REQUIRE(peer.frames->wait_for_frames(24));
    CATCH_REQUIRE(peer.frames->json(23)["result"] == false);
  }

  CATCH_SECTION("close-with-reason") {
    Harness harness;
    auto peer = harness.connect();
    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_numbers","id":1})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    harness.shared->sink_at(0)->close(ErrorObject{-7, "producer stopped"});
    CATCH_REQUIRE(peer.frames->wait_for_frames(3));
    CATCH_REQUIRE(peer.frames->json(2)["params"]["error"]["code"] == -7);
  }

  CATCH_SECTION("unsubscribe") {
    Harness harness;
    auto peer = harness.connect();
    auto stranger = harness.connect();

    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_numbers","id":1})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    const auto subscription_id = peer.frames->json(0)["result"].dump();

    // Another connection cannot cancel it
    stranger.send(format(
        R"({{"jsonrpc":"2.0","method":"unsubscribe_numbers","params":[{}],"id":5}})",
        subscription_id));
    CATCH_REQUIRE(stranger.frames->wait_for_frames(1));
    CATCH_REQUIRE(stranger.frames->json(0)["result"] == false);

    // Nor can the unsubscribe method of another subscription
    peer.send(format(R"({{"jsonrpc":"2.0","method":"unsubscribe_other","params":[{}],"id":2}})",
                     subscription_id));
    CATCH_REQUIRE(peer.frames->wait_for_frames(3));
    CATCH_REQUIRE(peer.frames->json(2)["result"] == false);

    peer.send(format(
        R"({{"jsonrpc":"2.0","method":"unsubscribe_numbers","params":{{"subscription":{}}},"id":3}})",
        subscription_id));
    CATCH_REQUIRE(peer.frames->wait_for_frames(4));
    CATCH_REQUIRE(peer.frames->json(3)["result"] == true);

    auto sink = harness.shared->sink_at(0);
    CATCH_REQUIRE(wait_until([&]() { return sink->is_closed(); }));
    CATCH_REQUIRE(sink->try_send(Json(1)) == async::ChannelStatus::CLOSED);

    peer.send(format(R"({{"jsonrpc":"2.0","method":"unsubscribe_numbers","params":[{}],"id":4}})",
                     subscription_id));
    CATCH_REQUIRE(peer.frames->wait_for_frames(5));
    CATCH_REQUIRE(peer.frames->json(4)["result"] == false);

    peer.send(R"({"jsonrpc":"2.0","method":"unsubscribe_numbers","params":[],"id":6})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(6));
    CATCH_REQUIRE(peer.frames->json(5)["error"]["code"] == -32602);

    // No notification ever followed the unsubscribe
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CATCH_REQUIRE(peer.frames->size() == 6);
  }

  CATCH_SECTION("refused-subscription") {
    Harness harness;
    auto peer = harness.connect();
    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_numbers","params":["refuse"],"id":1})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    CATCH_REQUIRE(peer.frames->json(0)["error"]["code"] == -5);
    CATCH_REQUIRE(peer.frames->json(0)["error"]["message"] == "not today");
  }

  CATCH_SECTION("too-many-subscriptions") {
    ServerConfig config;
    config.max_subscriptions_per_connection = 1;
    Harness harness{config};
    auto peer = harness.connect();

    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_other","id":1})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    CATCH_REQUIRE(peer.frames->json(0).contains("result"));

    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_other","id":2})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    const auto reply = peer.frames->json(1);
    CATCH_REQUIRE(reply["error"]["code"] == -32006);
    CATCH_REQUIRE(reply["error"]["message"] == "Too many subscriptions on the connection");

    // Unsubscribing frees the slot
    peer.send(format(R"({{"jsonrpc":"2.0","method":"unsubscribe_other","params":[{}],"id":3}})",
                     peer.frames->json(0)["result"].dump()));
    CATCH_REQUIRE(peer.frames->wait_for_frames(3));
    CATCH_REQUIRE(peer.frames->json(2)["result"] == true);
    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_other","id":4})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(4));
    CATCH_REQUIRE(peer.frames->json(3).contains("result"));
  }

  CATCH_SECTION("subscription-in-oversized-batch-is-dropped") {
    ServerConfig config;
    config.max_response_body_size = 100;
    config.max_subscriptions_per_connection = 1;
    Harness harness{config};
    auto peer = harness.connect();

    peer.send(format(R"([{{"jsonrpc":"2.0","method":"subscribe_numbers","id":1}},
                         {{"jsonrpc":"2.0","method":"echo","params":["{}"],"id":2}}])",
                     std::string(200, 'x')));
    CATCH_REQUIRE(peer.frames->wait_for_frames(1));
    const auto reply = peer.frames->json(0);
    CATCH_REQUIRE(reply.is_object());
    CATCH_REQUIRE(reply["error"]["code"] == -32008);

    // The peer never learned the id, so nothing is streamed under it
    auto sink = harness.shared->sink_at(0);
    CATCH_REQUIRE(sink.has_value());
    CATCH_REQUIRE(wait_until([&]() { return sink->is_closed(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CATCH_REQUIRE(peer.frames->size() == 1);

    // and its slot is free again
    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_other","id":3})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    CATCH_REQUIRE(peer.frames->json(1)["id"] == 3);
    CATCH_REQUIRE(peer.frames->json(1).contains("result"));
  }

  CATCH_SECTION("subscription-ids-are-unique") {
    Harness harness;
    auto a = harness.connect();
    auto b = harness.connect();
    a.send(R"({"jsonrpc":"2.0","method":"subscribe_other","id":1})");
    b.send(R"({"jsonrpc":"2.0","method":"subscribe_other","id":1})");
    CATCH_REQUIRE(a.frames->wait_for_frames(1));
    CATCH_REQUIRE(b.frames->wait_for_frames(1));
    CATCH_REQUIRE(a.frames->json(0)["result"] != b.frames->json(0)["result"]);
  }

  CATCH_SECTION("pluggable-subscription-ids") {
    Harness harness{{}, std::make_shared<PrefixedIdProvider>("peer")};
    auto peer = harness.connect();
    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_other","id":1})");
    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_other","id":2})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    const auto first = peer.frames->json(0)["result"];
    const auto second = peer.frames->json(1)["result"];
    CATCH_REQUIRE(first.is_string());
    CATCH_REQUIRE(first.get<std::string>().starts_with("peer-"));
    CATCH_REQUIRE(first != second);
  }

  CATCH_SECTION("closing-the-connection-stops-producers") {
    Harness harness;
    auto peer = harness.connect();
    peer.send(R"({"jsonrpc":"2.0","method":"subscribe_numbers","id":1})");
    CATCH_REQUIRE(peer.frames->wait_for_frames(2));
    auto sink = harness.shared->sink_at(0);

    peer.transport->close();
    CATCH_REQUIRE(wait_until([&]() { return sink->is_closed(); }));
    CATCH_REQUIRE(sink->send(Json(1)) == async::ChannelStatus::CLOSED);
    CATCH_REQUIRE(wait_until([&]() { return harness.server->connection_count() == 0; }));
  }
}

} // namespace tandem::rpc::test
