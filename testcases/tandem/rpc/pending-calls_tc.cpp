
#include "stdinc.hpp"

#include "tandem/rpc/pending-calls.hpp"
#include "tandem/test-helpers.hpp"

#include <catch2/catch_all.hpp>

namespace tandem::rpc::test {

using tandem::test::IoFixture;
using tandem::test::wait_until;

namespace {
  struct Recorder {
    std::mutex padlock;
    std::vector<PendingCallTable::Outcome> outcomes;

    PendingCallTable::Completion completion() {
      return [this](PendingCallTable::Outcome outcome) {
        std::lock_guard lock{padlock};
        outcomes.push_back(std::move(outcome));
      };
    }

    std::size_t size() {
      std::lock_guard lock{padlock};
      return outcomes.size();
    }
  };
} // namespace

CATCH_TEST_CASE("PendingCallTable", "[pending-calls]") {
  IoFixture io;
  Recorder recorder;
  auto table = std::make_shared<PendingCallTable>(io.timer_factory());

  CATCH_SECTION("resolve") {
    CATCH_REQUIRE(table->register_call(Id{1}, recorder.completion()));
    CATCH_REQUIRE(!table->register_call(Id{1}, recorder.completion())); // duplicate
    CATCH_REQUIRE(table->size() == 1);

    CATCH_REQUIRE(table->resolve(Response::success(Id{1}, Json("ok"))));
    CATCH_REQUIRE(recorder.size() == 1);
    CATCH_REQUIRE(recorder.outcomes[0].has_value());
    CATCH_REQUIRE(recorder.outcomes[0]->result() == "ok");

    CATCH_REQUIRE(!table->resolve(Response::success(Id{1}, Json("late"))));
    CATCH_REQUIRE(recorder.size() == 1);
    CATCH_REQUIRE(table->size() == 0);
  }

  CATCH_SECTION("ids-are-structural") {
    CATCH_REQUIRE(table->register_call(Id{"1"}, recorder.completion()));
    CATCH_REQUIRE(!table->resolve(Response::success(Id{1}, Json(1))));
    CATCH_REQUIRE(table->resolve(Response::success(Id{"1"}, Json(1))));
  }

  CATCH_SECTION("timeout") {
    CATCH_REQUIRE(
        table->register_call(Id{2}, recorder.completion(), std::chrono::milliseconds(10)));
    CATCH_REQUIRE(wait_until([&]() { return recorder.size() == 1; }));
    CATCH_REQUIRE(!recorder.outcomes[0].has_value());
    CATCH_REQUIRE(recorder.outcomes[0].error().code() == ecode::timeout);

    // The response arrives after the deadline
    CATCH_REQUIRE(!table->resolve(Response::success(Id{2}, Json(true))));
    CATCH_REQUIRE(recorder.size() == 1);
  }

  CATCH_SECTION("resolved-before-deadline") {
    CATCH_REQUIRE(
        table->register_call(Id{3}, recorder.completion(), std::chrono::milliseconds(30)));
    CATCH_REQUIRE(table->resolve(Response::failure(Id{3}, method_not_found())));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    CATCH_REQUIRE(recorder.size() == 1);
    CATCH_REQUIRE(recorder.outcomes[0].has_value());
    CATCH_REQUIRE(!recorder.outcomes[0]->is_success());
  }

  CATCH_SECTION("cancel-and-fail") {
    CATCH_REQUIRE(table->register_call(Id{4}, recorder.completion()));
    CATCH_REQUIRE(table->cancel(Id{4}));
    CATCH_REQUIRE(!table->cancel(Id{4}));
    CATCH_REQUIRE(recorder.size() == 0);

    CATCH_REQUIRE(table->register_call(Id{5}, recorder.completion()));
    CATCH_REQUIRE(table->fail(Id{5}, Status{ecode::transport_error, "write failed"}));
    CATCH_REQUIRE(recorder.size() == 1);
    CATCH_REQUIRE(recorder.outcomes[0].error().code() == ecode::transport_error);
  }

  CATCH_SECTION("cancel-runs-on-cancel") {
    int cancelled = 0;
    auto on_cancel = [&cancelled]() { ++cancelled; };
    CATCH_REQUIRE(table->register_call(Id{6}, recorder.completion(), std::nullopt, on_cancel));
    CATCH_REQUIRE(table->register_call(Id{7}, recorder.completion(), std::nullopt, on_cancel));

    CATCH_REQUIRE(table->cancel(Id{6}));
    CATCH_REQUIRE(cancelled == 1);
    CATCH_REQUIRE(table->resolve(Response::success(Id{7}, Json(7))));
    CATCH_REQUIRE(cancelled == 1); // only on cancel
    CATCH_REQUIRE(recorder.size() == 1);
  }

  CATCH_SECTION("fail-all-closes-the-table") {
    CATCH_REQUIRE(table->register_call(Id{6}, recorder.completion()));
    CATCH_REQUIRE(table->register_call(Id{7}, recorder.completion()));
    CATCH_REQUIRE(table->fail_all(Status{ecode::connection_closed}) == 2);
    CATCH_REQUIRE(table->is_closed());
    CATCH_REQUIRE(recorder.size() == 2);

    CATCH_REQUIRE(!table->register_call(Id{8}, recorder.completion()));
    CATCH_REQUIRE(recorder.size() == 3);
    CATCH_REQUIRE(recorder.outcomes[2].error().code() == ecode::connection_closed);
  }
}

} // namespace tandem::rpc::test
