
#include "stdinc.hpp"

#include "tandem/net/local-transport.hpp"
#include "tandem/test-helpers.hpp"
#include "tandem/utils/error-codes.hpp"

#include <catch2/catch_all.hpp>

namespace tandem::net::test {

using tandem::test::FrameCollector;
using tandem::test::IoFixture;
using tandem::test::wait_until;

CATCH_TEST_CASE("LocalTransport", "[local-transport]") {
  IoFixture io;

  CATCH_SECTION("frames-arrive-in-order") {
    auto [a, b] = LocalTransport::make_pair(io.executor());
    auto receiver = std::make_shared<FrameCollector>();
    b->attach(receiver);

    std::atomic<int> completed{0};
    for (int i = 0; i < 50; ++i)
      a->send_message(make_send_buffer(std::to_string(i)), [&](std::error_code ec) {
        if (!ec)
          ++completed;
      });

    CATCH_REQUIRE(receiver->wait_for_frames(50));
    const auto frames = receiver->frames();
    for (int i = 0; i < 50; ++i)
      CATCH_REQUIRE(frames[std::size_t(i)] == std::to_string(i));
    CATCH_REQUIRE(wait_until([&]() { return completed == 50; }));
  }

  CATCH_SECTION("frames-held-until-attach") {
    auto [a, b] = LocalTransport::make_pair(io.executor());
    a->send_message(make_send_buffer("first"));
    a->send_message(make_send_buffer("second"));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto receiver = std::make_shared<FrameCollector>();
    b->attach(receiver);
    a->send_message(make_send_buffer("third"));

    CATCH_REQUIRE(receiver->wait_for_frames(3));
    CATCH_REQUIRE(receiver->frames() == std::vector<std::string>{"first", "second", "third"});
  }

  CATCH_SECTION("close-reaches-both-ends-once") {
    auto [a, b] = LocalTransport::make_pair(io.executor());
    auto left = std::make_shared<FrameCollector>();
    auto right = std::make_shared<FrameCollector>();
    a->attach(left);
    b->attach(right);

    a->send_message(make_send_buffer("last words"));
    a->close(1000, "bye");
    b->close(); // already closed; no second notification

    CATCH_REQUIRE(left->wait_for_close());
    CATCH_REQUIRE(right->wait_for_close());
    CATCH_REQUIRE(right->frames() == std::vector<std::string>{"last words"});
    CATCH_REQUIRE(*right->close_ec() == make_error_code(ecode::connection_closed));
    CATCH_REQUIRE(!a->is_open());
    CATCH_REQUIRE(!b->is_open());

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CATCH_REQUIRE(left->close_count() == 1);
    CATCH_REQUIRE(right->close_count() == 1);
  }

  CATCH_SECTION("send-after-close-fails") {
    auto [a, b] = LocalTransport::make_pair(io.executor());
    auto receiver = std::make_shared<FrameCollector>();
    b->attach(receiver);
    a->close();

    std::mutex padlock;
    std::optional<std::error_code> result;
    a->send_message(make_send_buffer("too late"), [&](std::error_code ec) {
      std::lock_guard lock{padlock};
      result = ec;
    });
    CATCH_REQUIRE(wait_until([&]() {
      std::lock_guard lock{padlock};
      return result.has_value();
    }));
    CATCH_REQUIRE(*result == make_error_code(ecode::connection_closed));
    CATCH_REQUIRE(receiver->wait_for_close());
    CATCH_REQUIRE(receiver->size() == 0);
  }

  CATCH_SECTION("close-before-attach-is-delivered-on-attach") {
    auto [a, b] = LocalTransport::make_pair(io.executor());
    a->send_message(make_send_buffer("held"));
    a->close();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto receiver = std::make_shared<FrameCollector>();
    b->attach(receiver);
    CATCH_REQUIRE(receiver->wait_for_close());
    CATCH_REQUIRE(receiver->frames() == std::vector<std::string>{"held"});
  }

  CATCH_SECTION("peer-names") {
    auto [a, b] = LocalTransport::make_pair(io.executor());
    CATCH_REQUIRE(a->peer() != b->peer());
    CATCH_REQUIRE(a->peer().starts_with("local:"));
  }
}

} // namespace tandem::net::test
