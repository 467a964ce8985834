
#include "stdinc.hpp"

#include "tandem/async/semaphore.hpp"

#include <catch2/catch_all.hpp>

namespace tandem::async::test {

CATCH_TEST_CASE("CountingSemaphore", "[semaphore]") {
  CATCH_SECTION("wait-and-post") {
    CountingSemaphore sem{2};
    CATCH_REQUIRE(sem.try_wait());
    CATCH_REQUIRE(sem.try_wait());
    CATCH_REQUIRE(!sem.try_wait());
    CATCH_REQUIRE(!sem.wait_for(std::chrono::milliseconds(5)));
    sem.post();
    CATCH_REQUIRE(sem.available() == 1);
    sem.wait();
    CATCH_REQUIRE(sem.available() == 0);
  }

  CATCH_SECTION("blocked-thread-is-released") {
    CountingSemaphore sem{0};
    std::atomic<bool> woken{false};
    std::thread waiter{[&]() {
      sem.wait();
      woken = true;
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    CATCH_REQUIRE(!woken);
    sem.post();
    waiter.join();
    CATCH_REQUIRE(woken);
    CATCH_REQUIRE(sem.available() == 0);
  }

  CATCH_SECTION("thunks-run-in-order") {
    CountingSemaphore sem{1};
    std::vector<int> order;
    sem.async_wait([&]() { order.push_back(0); }); // takes the free unit immediately
    CATCH_REQUIRE(order == std::vector<int>{0});

    sem.async_wait([&]() { order.push_back(1); });
    sem.async_wait([&]() { order.push_back(2); });
    CATCH_REQUIRE(sem.waiting() == 2);
    CATCH_REQUIRE(order.size() == 1);

    sem.post();
    CATCH_REQUIRE(order == std::vector<int>{0, 1});
    sem.post();
    CATCH_REQUIRE(order == std::vector<int>{0, 1, 2});
    CATCH_REQUIRE(sem.available() == 0);

    sem.post();
    CATCH_REQUIRE(sem.available() == 1);
  }

  CATCH_SECTION("cancel-waiters") {
    CountingSemaphore sem{0};
    bool ran = false;
    sem.async_wait([&]() { ran = true; });
    sem.async_wait([&]() { ran = true; });
    CATCH_REQUIRE(sem.cancel_waiters() == 2);
    sem.post();
    CATCH_REQUIRE(!ran);
    CATCH_REQUIRE(sem.available() == 1);
  }
}

} // namespace tandem::async::test
