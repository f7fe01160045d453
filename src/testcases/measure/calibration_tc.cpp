
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/measure/calibration.hpp"

#include "testcases/testcase-helpers.hpp"

namespace anthro
{
CATCH_TEST_CASE("Calibration", "[calibration]")
{
   const CalibrationParams params;
   const auto frame = testing::make_front_frame();

   CATCH_SECTION("calibration-scale-factor")
   {
      CalibrationReference ref;
      ref.physical_length = 170.0;
      const auto ret      = calibrate_frame(frame, ref, params);
      CATCH_REQUIRE(ret.is_ok());
      CATCH_REQUIRE(std::fabs(ret.calibrated->scale_factor - 0.2) < 1e-12);
      CATCH_REQUIRE(ret.calibrated->frame == frame);
   }

   CATCH_SECTION("calibration-is-linear")
   {
      CalibrationReference ref;
      for(auto len : {50.0, 120.0, 170.0, 201.5}) {
         ref.physical_length = len;
         const auto s1       = calibrate_frame(frame, ref, params);
         ref.physical_length = 2.0 * len;
         const auto s2       = calibrate_frame(frame, ref, params);
         CATCH_REQUIRE(s1.is_ok());
         CATCH_REQUIRE(s2.is_ok());
         CATCH_REQUIRE(std::fabs(s2.calibrated->scale_factor
                                 - 2.0 * s1.calibrated->scale_factor)
                       < 1e-12);
      }
   }

   CATCH_SECTION("calibration-zero-distance")
   {
      KeypointFrame::joint_map_type j;
      j["head_top"] = Keypoint(100.0, 100.0, 0.9);
      j["r_ankle"]  = Keypoint(100.0, 100.0, 0.9);
      const KeypointFrame f("degenerate", PoseType::FRONT, 640, 480, j);

      CalibrationReference ref;
      ref.physical_length = 170.0;
      const auto ret      = calibrate_frame(f, ref, params);
      CATCH_REQUIRE(!ret.is_ok());
      CATCH_REQUIRE(ret.error == ErrorKind::INVALID_CALIBRATION);
      CATCH_REQUIRE(!ret.message.empty());
   }

   CATCH_SECTION("calibration-min-pixels")
   {
      KeypointFrame::joint_map_type j;
      j["head_top"] = Keypoint(100.0, 100.0, 0.9);
      j["r_ankle"]  = Keypoint(100.0, 119.0, 0.9);
      const KeypointFrame f("tiny", PoseType::FRONT, 640, 480, j);

      CalibrationReference ref;
      ref.physical_length = 170.0;
      CATCH_REQUIRE(!calibrate_frame(f, ref, params).is_ok());

      CalibrationParams p2;
      p2.min_calibration_pixels = 10.0;
      CATCH_REQUIRE(calibrate_frame(f, ref, p2).is_ok());
   }

   CATCH_SECTION("calibration-bad-reference")
   {
      CalibrationReference ref;
      ref.physical_length = 0.0;
      CATCH_REQUIRE(calibrate_frame(frame, ref, params).error
                    == ErrorKind::INVALID_CALIBRATION);
      ref.physical_length = dNAN;
      CATCH_REQUIRE(!calibrate_frame(frame, ref, params).is_ok());

      ref.physical_length = 170.0;
      ref.joint_b         = "l_ankle"; // not in the frame
      CATCH_REQUIRE(!calibrate_frame(frame, ref, params).is_ok());
   }

   CATCH_SECTION("calibration-reference-json")
   {
      CalibrationReference ref, u;
      ref.physical_length = 182.0;
      ref.joint_a         = "nose";
      u.read(ref.to_json());
      CATCH_REQUIRE(ref == u);

      Json::Value o{Json::objectValue};
      o["physical_length"] = 160.0;
      u.read(o);
      CATCH_REQUIRE(u.joint_a == "head_top");
      CATCH_REQUIRE(u.joint_b == "r_ankle");
   }
}

} // namespace anthro
