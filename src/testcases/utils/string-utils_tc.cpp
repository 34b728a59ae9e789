
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace vocmark
{
CATCH_TEST_CASE("Explode", "[explode]")
{
   CATCH_SECTION("explode")
   {
      CATCH_REQUIRE(explode("10,20,30,40", ",")
                    == vector<string>{"10", "20", "30", "40"});
      CATCH_REQUIRE(explode("", ",").empty());
      CATCH_REQUIRE(explode("a,,b", ",") == vector<string>{"a", "", "b"});
      CATCH_REQUIRE(explode("a,,b", ",", true) == vector<string>{"a", "b"});
      CATCH_REQUIRE(explode("a b\tc", " \t") == vector<string>{"a", "b", "c"});
   }
}

CATCH_TEST_CASE("TrimAndCase", "[string-utils]")
{
   CATCH_SECTION("trim")
   {
      CATCH_REQUIRE(trim_copy("  red roomba \n") == "red roomba"s);
      CATCH_REQUIRE(trim_copy("\t\n ") == ""s);
      CATCH_REQUIRE(trim_copy("") == ""s);
      CATCH_REQUIRE(trim_copy("x") == "x"s);
   }

   CATCH_SECTION("case-conversion")
   {
      CATCH_REQUIRE(string_to_lowercase(".JPG") == ".jpg"s);
      CATCH_REQUIRE(string_to_lowercase("Roomba 2") == "roomba 2"s);
      CATCH_REQUIRE(string_to_lowercase("") == ""s);
   }

   CATCH_SECTION("str")
   {
      CATCH_REQUIRE(str(true) == "true"s);
      CATCH_REQUIRE(str(42) == "42"s);
      CATCH_REQUIRE(str(size_t(7)) == "7"s);
      CATCH_REQUIRE(str('q') == "q"s);
   }

   CATCH_SECTION("implode")
   {
      const vector<int> xs{1, 2, 3};
      CATCH_REQUIRE(implode(cbegin(xs), cend(xs), ", ") == "1, 2, 3"s);
      const vector<string> empty;
      CATCH_REQUIRE(implode(cbegin(empty), cend(empty), ", ") == ""s);
   }
}

} // namespace vocmark
