
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/measure/frame-validator.hpp"
#include "anthro/measure/measurement-plan.hpp"

#include "testcases/testcase-helpers.hpp"

namespace anthro
{
CATCH_TEST_CASE("FrameValidator", "[frame-validator]")
{
   const ValidatorParams params;
   const auto& plan    = default_measurement_plan();
   const auto required = plan.required_joints(PoseType::FRONT);

   CATCH_SECTION("validator-accepts-confident-frames")
   {
      const auto frame = testing::make_front_frame("f", 0.5);
      const auto ret   = validate_frame(frame, required, params);
      CATCH_REQUIRE(ret.is_valid());
      CATCH_REQUIRE(ret.frame_id == "f");
   }

   CATCH_SECTION("validator-missing-joint")
   {
      const auto frame = testing::make_front_frame();
      for(const auto& joint : required) {
         const auto ret
             = validate_frame(frame.without_joint(joint), required, params);
         CATCH_REQUIRE(!ret.is_valid());
         CATCH_REQUIRE(ret.rejections.size() == 1);
         CATCH_REQUIRE(ret.reason().reason == ErrorKind::MISSING_JOINT);
         CATCH_REQUIRE(ret.reason().joint == joint);
      }
   }

   CATCH_SECTION("validator-low-confidence")
   {
      const auto frame = testing::make_front_frame("f", 0.49);
      const auto ret   = validate_frame(frame, required, params);
      CATCH_REQUIRE(!ret.is_valid());
      CATCH_REQUIRE(ret.rejections.size() == required.size());
      CATCH_REQUIRE(ret.reason().reason == ErrorKind::LOW_CONFIDENCE);

      ValidatorParams lenient;
      lenient.min_confidence = 0.4;
      CATCH_REQUIRE(validate_frame(frame, required, lenient).is_valid());
   }

   CATCH_SECTION("validator-out-of-bounds")
   {
      KeypointFrame::joint_map_type j;
      j["l_hip"] = Keypoint(100.0, 50.0, 0.9);
      j["neck"]  = Keypoint(100.0, 0.0, 0.9);
      j["r_hip"] = Keypoint(640.0, 50.0, 0.9); // x == width
      j["nose"]  = Keypoint(-0.5, 10.0, 0.9);
      j["mid_hip"] = Keypoint(dNAN, 10.0, 0.9);
      const KeypointFrame frame("f", PoseType::FRONT, 640, 480, j);

      const auto ret = validate_frame(
          frame, {"r_hip", "nose", "neck", "l_hip", "mid_hip"}, params);
      CATCH_REQUIRE(ret.rejections.size() == 3);
      for(const auto& r : ret.rejections)
         CATCH_REQUIRE(r.reason == ErrorKind::OUT_OF_BOUNDS);

      // Rejections come in joint-name order
      CATCH_REQUIRE(ret.rejections[0].joint == "mid_hip");
      CATCH_REQUIRE(ret.rejections[1].joint == "nose");
      CATCH_REQUIRE(ret.rejections[2].joint == "r_hip");
   }

   CATCH_SECTION("validator-reports-every-problem")
   {
      auto frame     = testing::make_front_frame().without_joint("neck");
      const auto ret = validate_frame(frame, {"neck", "neck", "l_hip"}, params);
      CATCH_REQUIRE(ret.rejections.size() == 1); // duplicates collapse
      CATCH_REQUIRE(ret.reason().joint == "neck");
      CATCH_REQUIRE(validate_frame(frame, {}, params).is_valid());
   }
}

} // namespace anthro
