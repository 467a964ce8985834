
#include "stdinc.hpp"

#include "tandem/async/bounded-channel.hpp"

#include <catch2/catch_all.hpp>

namespace tandem::async::test {

CATCH_TEST_CASE("BoundedChannel", "[bounded-channel]") {
  CATCH_SECTION("fifo") {
    BoundedChannel<int> channel{4};
    for (int i = 0; i < 4; ++i)
      CATCH_REQUIRE(channel.try_send(i) == ChannelStatus::OK);
    CATCH_REQUIRE(channel.try_send(4) == ChannelStatus::FULL);
    CATCH_REQUIRE(channel.size() == 4);

    int value = -1;
    for (int i = 0; i < 4; ++i) {
      CATCH_REQUIRE(channel.try_receive(value) == ChannelStatus::OK);
      CATCH_REQUIRE(value == i);
    }
    CATCH_REQUIRE(channel.try_receive(value) == ChannelStatus::EMPTY);
    CATCH_REQUIRE(channel.receive_for(value, std::chrono::milliseconds(5)) ==
                  ChannelStatus::TIMEOUT);
  }

  CATCH_SECTION("zero-capacity-holds-one") {
    BoundedChannel<int> channel{0};
    CATCH_REQUIRE(channel.capacity() == 1);
  }

  CATCH_SECTION("sender-blocks-while-full") {
    BoundedChannel<int> channel{1};
    CATCH_REQUIRE(channel.send(1) == ChannelStatus::OK);
    CATCH_REQUIRE(channel.send_for(2, std::chrono::milliseconds(5)) == ChannelStatus::TIMEOUT);

    std::atomic<bool> sent{false};
    ChannelStatus producer_status = ChannelStatus::TIMEOUT;
    std::thread producer{[&]() {
      producer_status = channel.send(2);
      sent = true;
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    CATCH_REQUIRE(!sent);

    int value = 0;
    CATCH_REQUIRE(channel.receive(value) == ChannelStatus::OK);
    CATCH_REQUIRE(value == 1);
    producer.join();
    CATCH_REQUIRE(sent);
    CATCH_REQUIRE(producer_status == ChannelStatus::OK);
    CATCH_REQUIRE(channel.receive(value) == ChannelStatus::OK);
    CATCH_REQUIRE(value == 2);
  }

  CATCH_SECTION("close-drains-then-reports-closed") {
    BoundedChannel<std::string> channel{2};
    CATCH_REQUIRE(channel.try_send("a") == ChannelStatus::OK);
    channel.close();
    CATCH_REQUIRE(channel.is_closed());
    CATCH_REQUIRE(channel.try_send("b") == ChannelStatus::CLOSED);
    CATCH_REQUIRE(channel.send("b") == ChannelStatus::CLOSED);

    std::string value;
    CATCH_REQUIRE(channel.receive(value) == ChannelStatus::OK);
    CATCH_REQUIRE(value == "a");
    CATCH_REQUIRE(channel.receive(value) == ChannelStatus::CLOSED);
  }

  CATCH_SECTION("abort-discards") {
    BoundedChannel<int> channel{2};
    CATCH_REQUIRE(channel.try_send(1) == ChannelStatus::OK);
    channel.abort();
    int value = 0;
    CATCH_REQUIRE(channel.try_receive(value) == ChannelStatus::CLOSED);
    CATCH_REQUIRE(channel.size() == 0);
  }

  CATCH_SECTION("async-receive") {
    BoundedChannel<int> channel{2};
    std::vector<int> received;
    std::vector<ChannelStatus> statuses;
    auto receiver = [&](ChannelStatus status, std::optional<int> value) {
      statuses.push_back(status);
      if (value)
        received.push_back(*value);
    };

    channel.async_receive(receiver); // parked
    CATCH_REQUIRE(statuses.empty());
    CATCH_REQUIRE(channel.try_send(7) == ChannelStatus::OK);
    CATCH_REQUIRE(received == std::vector<int>{7});
    CATCH_REQUIRE(channel.size() == 0);

    CATCH_REQUIRE(channel.try_send(8) == ChannelStatus::OK);
    channel.async_receive(receiver); // item already queued
    CATCH_REQUIRE(received == std::vector<int>{7, 8});

    channel.async_receive(receiver); // parked, then released by close
    channel.close();
    CATCH_REQUIRE(statuses.size() == 3);
    CATCH_REQUIRE(statuses.back() == ChannelStatus::CLOSED);
  }
}

} // namespace tandem::async::test
