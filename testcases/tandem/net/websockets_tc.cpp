
#include "stdinc.hpp"

#include "tandem/net/websockets/websocket-client.hpp"
#include "tandem/net/websockets/websocket-server.hpp"
#include "tandem/rpc/client.hpp"
#include "tandem/rpc/server.hpp"
#include "tandem/test-helpers.hpp"

#include <catch2/catch_all.hpp>

#include <future>

namespace tandem::net::test {

using tandem::test::FrameCollector;
using tandem::test::IoFixture;
using tandem::test::wait_until;

namespace {
  /// Echoes every frame back to the peer
  class EchoHandler final : public TransportHandler {
  private:
    std::weak_ptr<Transport> transport_;

  public:
    explicit EchoHandler(std::weak_ptr<Transport> transport) : transport_{std::move(transport)} {}

    void on_receive(std::span<const std::byte> frame) override {
      if (auto transport = transport_.lock())
        transport->send_message(make_send_buffer(frame));
    }

    void on_close(std::error_code ec) override { TRACE("echo session closed: {}", ec.message()); }
  };

  std::shared_ptr<Transport> connect_to(IoFixture& io, uint16_t port) {
    std::promise<std::pair<std::error_code, std::shared_ptr<Transport>>> promise;
    auto future = promise.get_future();

    WebsocketClientConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    connect_websocket(io.io_context, config,
                      [&promise](std::error_code ec, std::shared_ptr<Transport> transport) {
                        promise.set_value({ec, std::move(transport)});
                      });

    CATCH_REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    auto [ec, transport] = future.get();
    CATCH_REQUIRE(!ec);
    CATCH_REQUIRE(transport != nullptr);
    return transport;
  }
} // namespace

CATCH_TEST_CASE("websockets", "[websockets]") {
  IoFixture io{2};

  CATCH_SECTION("echo") {
    std::mutex padlock;
    std::vector<std::shared_ptr<EchoHandler>> handlers;

    WebsocketServer::Config config;
    config.address = "127.0.0.1";
    config.port = 0;
    config.acceptor = [&](std::shared_ptr<Transport> transport) {
      auto handler = std::make_shared<EchoHandler>(transport);
      {
        std::lock_guard lock{padlock};
        handlers.push_back(handler);
      }
      transport->attach(handler);
      return true;
    };

    WebsocketServer server{io.io_context, config};
    CATCH_REQUIRE(!server.run());
    CATCH_REQUIRE(server.port() != 0);

    auto transport = connect_to(io, server.port());
    auto frames = std::make_shared<FrameCollector>();
    transport->attach(frames);
    CATCH_REQUIRE(transport->is_open());
    CATCH_REQUIRE(!transport->peer().empty());

    for (int i = 0; i < 10; ++i)
      transport->send_message(make_send_buffer(format("frame {}", i)));
    CATCH_REQUIRE(frames->wait_for_frames(10));
    for (int i = 0; i < 10; ++i)
      CATCH_REQUIRE(frames->frame(std::size_t(i)) == format("frame {}", i));

    server.shutdown();
    CATCH_REQUIRE(frames->wait_for_close(std::chrono::seconds(5)));
    CATCH_REQUIRE(frames->close_count() == 1);
  }

  CATCH_SECTION("refused-transport-is-closed") {
    WebsocketServer::Config config;
    config.address = "127.0.0.1";
    config.acceptor = [](std::shared_ptr<Transport>) { return false; };

    WebsocketServer server{io.io_context, config};
    CATCH_REQUIRE(!server.run());

    auto transport = connect_to(io, server.port());
    auto frames = std::make_shared<FrameCollector>();
    transport->attach(frames);
    CATCH_REQUIRE(frames->wait_for_close(std::chrono::seconds(5)));
    CATCH_REQUIRE(!transport->is_open());
    server.shutdown();
  }

  CATCH_SECTION("connect-failure") {
    std::promise<std::error_code> promise;
    auto future = promise.get_future();
    WebsocketClientConfig config;
    config.port = 1; // nothing listens here
    connect_websocket(io.io_context, config,
                      [&promise](std::error_code ec, std::shared_ptr<Transport> transport) {
                        promise.set_value(transport == nullptr ? ec : std::error_code{});
                      });
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    CATCH_REQUIRE(future.get());
  }

  CATCH_SECTION("rpc-over-websockets") {
    rpc::MethodRegistry registry;
    registry.register_method("add", [](const rpc::Json& params) -> rpc::MethodResult {
      return rpc::param<int>(params, 0) + rpc::param<int>(params, 1);
    });

    rpc::ServerConfig server_config;
    server_config.max_connections = 1;
    auto rpc_server = rpc::Server::make(std::move(registry), server_config, io.executor());

    WebsocketServer::Config config;
    config.address = "127.0.0.1";
    config.acceptor = [rpc_server](std::shared_ptr<Transport> transport) {
      return rpc_server->accept(std::move(transport)).has_value();
    };
    WebsocketServer server{io.io_context, config};
    CATCH_REQUIRE(!server.run());

    auto client = rpc::Client::make(connect_to(io, server.port()), io.timer_factory());
    CATCH_REQUIRE(client->request("add", rpc::Json::array({2, 40})).get() == 42);

    // Only one connection is allowed, so a second client is turned away
    auto refused = rpc::Client::make(connect_to(io, server.port()), io.timer_factory());
    CATCH_REQUIRE(wait_until([&]() { return !refused->is_connected(); }, std::chrono::seconds(5)));
    CATCH_REQUIRE(refused->request("add", rpc::Json::array({1, 1})).result().error().code() ==
                  ecode::connection_closed);

    client.reset();
    refused.reset();
    server.shutdown();
    rpc_server->shutdown();
  }
}

} // namespace tandem::net::test
