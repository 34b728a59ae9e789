
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include "vocmark/annotation/box-arguments.hpp"

#include <catch2/catch.hpp>

namespace vocmark
{
CATCH_TEST_CASE("ParseBoxArgument", "[box-arguments]")
{
   CATCH_SECTION("four integers")
   {
      CATCH_REQUIRE(parse_box_argument("548,472,878,753")
                    == BoundingBox(548, 472, 878, 753));
      CATCH_REQUIRE(parse_box_argument(" 1, 2 ,3,4 ")
                    == BoundingBox(1, 2, 3, 4));
      CATCH_REQUIRE(parse_box_argument("50,40,10,5")
                    == BoundingBox(50, 40, 10, 5));
      CATCH_REQUIRE(parse_box_argument("-3,0,7,9") == BoundingBox(-3, 0, 7, 9));
   }

   CATCH_SECTION("anything else is rejected")
   {
      CATCH_REQUIRE_THROWS_AS(parse_box_argument(""), std::invalid_argument);
      CATCH_REQUIRE_THROWS_AS(parse_box_argument("1,2,3"),
                              std::invalid_argument);
      CATCH_REQUIRE_THROWS_AS(parse_box_argument("1,2,3,4,5"),
                              std::invalid_argument);
      CATCH_REQUIRE_THROWS_AS(parse_box_argument("1,2,,4"),
                              std::invalid_argument);
      CATCH_REQUIRE_THROWS_AS(parse_box_argument("1,2,3.5,4"),
                              std::invalid_argument);
      CATCH_REQUIRE_THROWS_AS(parse_box_argument("a,b,c,d"),
                              std::invalid_argument);
   }
}

CATCH_TEST_CASE("LabelsForBoxes", "[box-arguments]")
{
   CATCH_SECTION("one label per box")
   {
      const vector<string> labels{"red roomba", "green roomba"};
      CATCH_REQUIRE(labels_for_boxes(labels, 2) == labels);
   }

   CATCH_SECTION("a single label goes to every box")
   {
      CATCH_REQUIRE(labels_for_boxes({"cat"}, 3)
                    == vector<string>{"cat", "cat", "cat"});
      CATCH_REQUIRE(labels_for_boxes({"cat"}, 1) == vector<string>{"cat"});
   }

   CATCH_SECTION("other counts are rejected")
   {
      CATCH_REQUIRE_THROWS_AS(labels_for_boxes({}, 2), std::invalid_argument);
      CATCH_REQUIRE_THROWS_AS(labels_for_boxes({"a", "b"}, 3),
                              std::invalid_argument);
      CATCH_REQUIRE_THROWS_AS(labels_for_boxes({"a", "b", "c"}, 2),
                              std::invalid_argument);
   }
}

} // namespace vocmark
