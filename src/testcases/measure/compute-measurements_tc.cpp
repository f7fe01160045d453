
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/measure/compute-measurements.hpp"

#include "testcases/testcase-helpers.hpp"

namespace anthro
{
static CalibratedFrame calibrated(const KeypointFrame& frame)
{
   CalibrationReference ref;
   ref.physical_length = 170.0;
   auto ret            = calibrate_frame(frame, ref, CalibrationParams{});
   CATCH_REQUIRE(ret.is_ok());
   return *ret.calibrated;
}

CATCH_TEST_CASE("ComputeMeasurements", "[compute-measurements]")
{
   const auto& plan = default_measurement_plan();
   const ComputeParams params;
   const MeasurementContext ctx{"user-1", "session-1", Timestamp(1600000000)};

   const auto front = calibrated(testing::make_front_frame());
   const auto side  = calibrated(testing::make_side_frame());

   CATCH_SECTION("ellipse-perimeter")
   {
      CATCH_REQUIRE(std::fabs(ellipse_perimeter(10.0, 10.0) - 20.0 * M_PI)
                    < 1e-9);
      // Ramanujan is within 1e-4 relative for a 2:1 ellipse
      CATCH_REQUIRE(std::fabs(ellipse_perimeter(2.0, 1.0) - 9.688448220547675)
                    < 1e-3);
   }

   CATCH_SECTION("compute-front-view")
   {
      const auto s = compute_view_measurements(front, plan, params, ctx);
      CATCH_REQUIRE(s.set_id == "session-1/front-0");
      CATCH_REQUIRE(s.view_id == "front-0");
      CATCH_REQUIRE(s.pose_type == PoseType::FRONT);
      CATCH_REQUIRE(s.user_id == "user-1");
      CATCH_REQUIRE(s.calibration_ratio == front.scale_factor);
      CATCH_REQUIRE(s.created_at == ctx.timestamp);
      CATCH_REQUIRE(s.fields.size() == plan.entries.size());

      const auto sw = s.find("shoulder_width");
      CATCH_REQUIRE(sw != nullptr);
      CATCH_REQUIRE(std::fabs(sw->value - 45.0) < 1e-6);
      CATCH_REQUIRE(sw->confidence == 0.9);
      CATCH_REQUIRE(sw->model == MeasurementModel::LINEAR);
      CATCH_REQUIRE(!sw->estimated_from_front_only);

      CATCH_REQUIRE(std::fabs(s.find("hip_width")->value - 28.0) < 1e-6);
      CATCH_REQUIRE(std::fabs(s.find("torso_length")->value - 60.0) < 1e-6);

      const real arm = (std::hypot(17.5, 150.0) + std::hypot(10.0, 130.0)) * 0.2;
      CATCH_REQUIRE(s.find("arm_length")->model == MeasurementModel::PATH);
      CATCH_REQUIRE(std::fabs(s.find("arm_length")->value - arm) < 1e-6);
   }

   CATCH_SECTION("compute-front-only-circumference")
   {
      const auto s = compute_view_measurements(front, plan, params, ctx);
      const auto c = s.find("chest_circumference");
      CATCH_REQUIRE(c != nullptr);
      CATCH_REQUIRE(c->estimated_from_front_only);
      CATCH_REQUIRE(c->model == MeasurementModel::CIRCUMFERENCE);

      const real a = 0.5 * 0.85 * 45.0;
      CATCH_REQUIRE(std::fabs(c->value - ellipse_perimeter(a, 0.7 * a)) < 1e-6);
      CATCH_REQUIRE(std::fabs(c->confidence - 0.45) < 1e-12);
      CATCH_REQUIRE(!s.is_accurate);
   }

   CATCH_SECTION("compute-side-view")
   {
      const auto s = compute_view_measurements(side, plan, params, ctx);
      CATCH_REQUIRE(s.pose_type == PoseType::SIDE);
      CATCH_REQUIRE(s.find("shoulder_width") == nullptr); // front only
      CATCH_REQUIRE(s.find("chest_circumference") == nullptr);
      CATCH_REQUIRE(s.find("torso_length") != nullptr);
      CATCH_REQUIRE(s.fields.size() == 3);
      CATCH_REQUIRE(s.is_accurate);
   }

   CATCH_SECTION("compute-combined")
   {
      const auto s
          = compute_combined_measurements(front, side, plan, params, ctx);
      CATCH_REQUIRE(s.pose_type == PoseType::COMBINED);
      CATCH_REQUIRE(s.view_id == "front-0+side-0");
      CATCH_REQUIRE(s.fields.size() == 3);
      CATCH_REQUIRE(s.is_accurate);

      const auto w = s.find("waist_circumference");
      CATCH_REQUIRE(w != nullptr);
      CATCH_REQUIRE(!w->estimated_from_front_only);
      const real a = 0.5 * 1.20 * 28.0;
      const real b = 0.5 * 1.0 * 20.0;
      CATCH_REQUIRE(std::fabs(w->value - ellipse_perimeter(a, b)) < 1e-6);

      CATCH_REQUIRE_THROWS(
          compute_combined_measurements(side, front, plan, params, ctx));
   }

   CATCH_SECTION("compute-is-deterministic")
   {
      const auto a = compute_view_measurements(front, plan, params, ctx);
      const auto b = compute_view_measurements(front, plan, params, ctx);
      CATCH_REQUIRE(a == b);
      CATCH_REQUIRE(front.frame == testing::make_front_frame());
   }

   CATCH_SECTION("compute-missing-joint-throws")
   {
      CalibratedFrame cf{front.frame.without_joint("r_elbow"),
                         front.scale_factor};
      CATCH_REQUIRE_THROWS(compute_view_measurements(cf, plan, params, ctx));

      cf = CalibratedFrame{front.frame, 0.0};
      CATCH_REQUIRE_THROWS(compute_view_measurements(cf, plan, params, ctx));
   }

   CATCH_SECTION("compute-validates-against-plan")
   {
      auto s = compute_view_measurements(front, plan, params, ctx);
      CATCH_REQUIRE_NOTHROW(validate_against_plan(s, plan));

      s.fields["inseam"] = s.fields["hip_width"];
      CATCH_REQUIRE_THROWS(validate_against_plan(s, plan));
      s.fields.erase("inseam");

      s.fields["hip_width"].value = -1.0;
      CATCH_REQUIRE_THROWS(validate_against_plan(s, plan));
   }

   CATCH_SECTION("compute-accuracy-threshold-is-exclusive")
   {
      const auto f5 = calibrated(testing::make_front_frame("f", 0.5));
      const auto s5 = calibrated(testing::make_side_frame("s", 0.5));
      const auto c  = compute_combined_measurements(f5, s5, plan, params, ctx);
      CATCH_REQUIRE(!c.fields.empty());
      for(const auto& [name, m] : c.fields) CATCH_REQUIRE(m.confidence == 0.5);
      CATCH_REQUIRE(!c.is_accurate);
      CATCH_REQUIRE(!compute_view_measurements(s5, plan, params, ctx).is_accurate);

      const auto f6 = calibrated(testing::make_front_frame("f", 0.51));
      const auto s6 = calibrated(testing::make_side_frame("s", 0.51));
      CATCH_REQUIRE(
          compute_combined_measurements(f6, s6, plan, params, ctx).is_accurate);
   }

   CATCH_SECTION("compute-degenerate-fields")
   {
      CATCH_REQUIRE(
          degenerate_fields(compute_view_measurements(front, plan, params, ctx))
              .empty());

      const auto r_shoulder = *front.frame.find("r_shoulder");
      const CalibratedFrame cf{
          testing::with_joint(front.frame, "l_shoulder", r_shoulder),
          front.scale_factor};
      const auto s   = compute_view_measurements(cf, plan, params, ctx);
      const auto bad = degenerate_fields(s);
      CATCH_REQUIRE(s.find("shoulder_width")->value == 0.0);
      CATCH_REQUIRE(std::count(cbegin(bad), cend(bad), "shoulder_width"s) == 1);
      CATCH_REQUIRE(std::is_sorted(cbegin(bad), cend(bad)));
      CATCH_REQUIRE_THROWS(validate_against_plan(s, plan));
   }
}

} // namespace anthro
