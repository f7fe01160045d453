
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/utils/math.hpp"

namespace anthro
{
CATCH_TEST_CASE("MathStuff", "[math]")
{
   CATCH_SECTION("inclusive-between")
   {
      CATCH_REQUIRE(inclusive_between(0.0, 0.0, 1.0));
      CATCH_REQUIRE(inclusive_between(0.0, 1.0, 1.0));
      CATCH_REQUIRE(!inclusive_between(0.0, 1.0001, 1.0));
      CATCH_REQUIRE(!inclusive_between(0.0, dNAN, 1.0));
   }

   CATCH_SECTION("is-close")
   {
      CATCH_REQUIRE(is_close(45.0, 45.0 + 1e-8));
      CATCH_REQUIRE(!is_close(45.0, 45.1));
      CATCH_REQUIRE(is_close(45.0, 45.1, 0.01));
      CATCH_REQUIRE(!is_close(dNAN, dNAN));
   }

   CATCH_SECTION("relative-spread")
   {
      const vector<real> one = {80.0};
      const vector<real> xs  = {95.0, 80.0, 84.0};
      const vector<real> zs  = {0.0, 1.0};
      CATCH_REQUIRE(relative_spread(cbegin(one), cend(one)) == 0.0);
      CATCH_REQUIRE(relative_spread(cbegin(one), cbegin(one)) == 0.0);
      CATCH_REQUIRE(std::fabs(relative_spread(cbegin(xs), cend(xs)) - 0.1875)
                    < 1e-12);
      CATCH_REQUIRE(std::isinf(relative_spread(cbegin(zs), cend(zs))));
   }

   CATCH_SECTION("ellipse-perimeter")
   {
      // Exact for circles
      CATCH_REQUIRE(std::fabs(ellipse_perimeter(10.0, 10.0) - 20.0 * M_PI)
                    < 1e-9);
      CATCH_REQUIRE(ellipse_perimeter(12.0, 8.0) == ellipse_perimeter(8.0, 12.0));

      // Within 0.01% of the series value for a 3:2 ellipse
      CATCH_REQUIRE(std::fabs(ellipse_perimeter(15.0, 10.0) - 79.3272)
                    < 1e-3);
      CATCH_REQUIRE(ellipse_perimeter(10.0, 0.0) > 39.0);
   }
}

} // namespace anthro
