
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/utils/string-utils.hpp"

namespace anthro
{
CATCH_TEST_CASE("StringUtils", "[string-utils]")
{
   CATCH_SECTION("explode")
   {
      CATCH_REQUIRE(explode("", ",").empty());
      CATCH_REQUIRE(explode("a,b,,c", ",") == vector<string>{"a", "b", "", "c"});
      CATCH_REQUIRE(explode("a,b,,c", ",", true)
                    == vector<string>{"a", "b", "c"});
      CATCH_REQUIRE(explode("r_knee l_knee", " _")
                    == vector<string>{"r", "knee", "l", "knee"});
      CATCH_REQUIRE(explode("abc", ",") == vector<string>{"abc"});
   }

   CATCH_SECTION("implode")
   {
      const vector<string> joints = {"neck", "mid_hip"};
      CATCH_REQUIRE(implode(cbegin(joints), cend(joints), ", ")
                    == "neck, mid_hip"s);
      const vector<int> xs = {1, 2, 3};
      CATCH_REQUIRE(implode(cbegin(xs), cend(xs), "+", [](int x) {
                       return format("[{}]", x);
                    }) == "[1]+[2]+[3]"s);
      CATCH_REQUIRE(implode(cbegin(xs), cbegin(xs), "+").empty());
   }

   CATCH_SECTION("trim-and-case")
   {
      CATCH_REQUIRE(trim_copy("  head_top \t\n") == "head_top"s);
      CATCH_REQUIRE(trim_copy("   ").empty());
      CATCH_REQUIRE(to_snake_case("Shoulder Width") == "shoulder_width"s);
      CATCH_REQUIRE(to_snake_case("dump-default-params")
                    == "dump_default_params"s);
      CATCH_REQUIRE(begins_with("waist_circumference"s, "waist"s));
      CATCH_REQUIRE(!begins_with("hip"s, "hip_width"s));
      CATCH_REQUIRE(ends_with("waist_circumference"s, "_circumference"s));
   }
}

} // namespace anthro
