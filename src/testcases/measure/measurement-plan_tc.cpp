
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/io/json-io.hpp"
#include "anthro/measure/measurement-plan.hpp"

namespace anthro
{
CATCH_TEST_CASE("MeasurementPlan", "[measurement-plan]")
{
   const auto& plan = default_measurement_plan();

   CATCH_SECTION("default-plan")
   {
      CATCH_REQUIRE_NOTHROW(plan.validate());
      CATCH_REQUIRE(plan.find("shoulder_width") != nullptr);
      CATCH_REQUIRE(plan.find("waist_circumference")->model
                    == MeasurementModel::CIRCUMFERENCE);
      CATCH_REQUIRE(plan.find("inseam") == nullptr);

      const auto side = plan.required_joints(PoseType::SIDE);
      CATCH_REQUIRE(std::binary_search(cbegin(side), cend(side), "waist_front"s));
      CATCH_REQUIRE(!std::binary_search(cbegin(side), cend(side), "l_shoulder"s));

      const auto front = plan.required_joints(PoseType::FRONT);
      CATCH_REQUIRE(std::binary_search(cbegin(front), cend(front), "l_shoulder"s));
      CATCH_REQUIRE(!std::binary_search(cbegin(front), cend(front), "waist_front"s));
   }

   CATCH_SECTION("plan-json")
   {
      MeasurementPlan p;
      read(p, plan.to_json());
      CATCH_REQUIRE(p == plan);
   }

   CATCH_SECTION("plan-file-matches-default")
   {
      MeasurementPlan p;
      load(p, format("{}/default-plan.json", ANTHRO_TESTDATA_DIR));
      CATCH_REQUIRE(p == plan);
   }

   CATCH_SECTION("plan-rejects-malformed-entries")
   {
      auto o = plan.to_json();
      o["entries"][0]["joints"].append("neck"); // 3 joints on a linear entry
      MeasurementPlan p;
      CATCH_REQUIRE_THROWS(read(p, o));

      o = plan.to_json();
      o["entries"][1]["name"] = "shoulder_width"; // duplicate
      CATCH_REQUIRE_THROWS(read(p, o));

      o = plan.to_json();
      o["entries"][2]["views"].append("combined");
      CATCH_REQUIRE_THROWS(read(p, o));

      o = plan.to_json();
      o["entries"][5]["model"] = "volume";
      CATCH_REQUIRE_THROWS(read(p, o));

      CATCH_REQUIRE_THROWS(load(p, "/no/such/plan.json"));
   }
}

} // namespace anthro
