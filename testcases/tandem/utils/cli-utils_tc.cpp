
#include "stdinc.hpp"

#include "tandem/utils/cli-utils.hpp"

#include <catch2/catch_all.hpp>

namespace tandem::cli::test {

namespace {
  struct Argv {
    std::vector<std::string> args;
    std::vector<char*> pointers;

    Argv(std::initializer_list<const char*> list) : args{list.begin(), list.end()} {
      for (auto& arg : args)
        pointers.push_back(arg.data());
    }

    int argc() const { return int(pointers.size()); }
    char** argv() { return pointers.data(); }
  };
} // namespace

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("cli-utils") {
    Argv args{"exec-name", "1", "two", "three"};
    const int argc = args.argc();
    char** argv = args.argv();

    {
      int i = 0;
      CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 1);
      CATCH_REQUIRE(i == 1);
      CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "two");
      CATCH_REQUIRE(i == 2);
      CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "three");
      CATCH_REQUIRE(i == 3);
    }

    {
      int i = 3; // nothing after the last argument
      CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);
    }

    {
      int i = 1; // "two" is not an integer
      CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i), std::runtime_error);
    }
  }

  CATCH_SECTION("safe-arg-bytes") {
    Argv args{"tandem-server", "--size", "512", "--size", "10K", "--size", "3M", "--size",
              "1G",            "--size", "M",   "--size", "12Q"};
    const int argc = args.argc();
    char** argv = args.argv();

    int i = 1;
    CATCH_REQUIRE(safe_arg_bytes(argc, argv, i) == 512);
    i += 1;
    CATCH_REQUIRE(safe_arg_bytes(argc, argv, i) == 10 * 1024);
    i += 1;
    CATCH_REQUIRE(safe_arg_bytes(argc, argv, i) == 3 * 1024 * 1024);
    i += 1;
    CATCH_REQUIRE(safe_arg_bytes(argc, argv, i) == std::size_t(1024) * 1024 * 1024);
    i += 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_bytes(argc, argv, i), std::runtime_error);
    i += 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_bytes(argc, argv, i), std::runtime_error);
  }
}

} // namespace tandem::cli::test
