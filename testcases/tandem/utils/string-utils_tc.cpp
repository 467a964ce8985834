
#include "stdinc.hpp"

#include "tandem/utils/string-utils.hpp"

#include <catch2/catch_all.hpp>

namespace tandem::tests {

CATCH_TEST_CASE("StrUtils", "[str-utils]") {
  CATCH_SECTION("truncate") {
    CATCH_REQUIRE(truncate("", 5) == "");
    CATCH_REQUIRE(truncate("hello", 5) == "hello");
    CATCH_REQUIRE(truncate("hello world", 5) == "hello... (11 bytes)");

    const std::string_view text = "abcdef";
    const auto bytes = std::as_bytes(std::span{text.data(), text.size()});
    CATCH_REQUIRE(truncate(bytes, 3) == "abc... (6 bytes)");
  }

  CATCH_SECTION("str") {
    CATCH_REQUIRE(str(nullptr, 0) == "");

    const std::string_view line = R"({"jsonrpc":"2.0")";
    CATCH_REQUIRE(str(line.data(), line.size()) ==
                  "00000000: 7b22 6a73 6f6e 7270 6322 3a22 322e 3022  {\"jsonrpc\":\"2.0\"\n");

    const std::string_view partial = "ab\n";
    const auto dump = str(partial.data(), partial.size());
    CATCH_REQUIRE(dump.size() == 68);
    CATCH_REQUIRE(dump.substr(0, 17) == "00000000: 6162 0a");
    CATCH_REQUIRE(dump.substr(51, 3) == "ab.");
    CATCH_REQUIRE(dump.back() == '\n');

    const std::string two_rows(17, 'x');
    const auto dump2 = str(two_rows.data(), two_rows.size());
    CATCH_REQUIRE(dump2.size() == 2 * 68);
    CATCH_REQUIRE(dump2.substr(68, 12) == "00000010: 78");
  }
}

} // namespace tandem::tests
