
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/body/keypoint-frame.hpp"
#include "anthro/io/json-io.hpp"

#include "testcases/testcase-helpers.hpp"

namespace anthro
{
CATCH_TEST_CASE("KeypointName", "[keypoint-name]")
{
   CATCH_SECTION("keypoint-names")
   {
      CATCH_REQUIRE(k_n_body25_keypoints == 25);
      CATCH_REQUIRE(joint_name(KeypointName::R_SHOULDER) == "r_shoulder");
      CATCH_REQUIRE(joint_name(KeypointName::HEAD_TOP) == "head_top");
      CATCH_REQUIRE(to_keypoint_name("MID_HIP") == KeypointName::MID_HIP);
      CATCH_REQUIRE(to_keypoint_name("l_ankle") == KeypointName::L_ANKLE);
      CATCH_REQUIRE_THROWS(to_keypoint_name("left_foot"));
      CATCH_REQUIRE_THROWS(int_to_keypoint_name(k_n_keypoints));

      for(auto i = 0; i < k_n_keypoints; ++i) {
         const auto k = int_to_keypoint_name(i);
         CATCH_REQUIRE(to_keypoint_name(joint_name(k)) == k);
      }
   }
}

CATCH_TEST_CASE("KeypointFrame", "[keypoint-frame]")
{
   CATCH_SECTION("keypoint-frame-from-indexed")
   {
      vector<Keypoint> dets(static_cast<size_t>(k_n_body25_keypoints));
      dets[size_t(KeypointName::NECK)]       = Keypoint(10.0, 20.0, 0.8);
      dets[size_t(KeypointName::R_SHOULDER)] = Keypoint(5.0, 22.0, 0.7);
      dets[size_t(KeypointName::L_SHOULDER)] = Keypoint(15.0, 22.0, 0.0);

      const auto f
          = KeypointFrame::from_indexed("f0", PoseType::FRONT, 64, 48, dets);
      CATCH_REQUIRE(f.size() == 2);
      CATCH_REQUIRE(f.has_joint("neck"));
      CATCH_REQUIRE(f.has_joint("r_shoulder"));
      CATCH_REQUIRE(!f.has_joint("l_shoulder")); // zero confidence
      CATCH_REQUIRE(f.find("neck")->xy() == Vector2(10.0, 20.0));
      CATCH_REQUIRE(!f.find("neck")->is_3d());

      dets.resize(size_t(k_n_keypoints + 1));
      CATCH_REQUIRE_THROWS(
          KeypointFrame::from_indexed("f1", PoseType::FRONT, 64, 48, dets));
   }

   CATCH_SECTION("keypoint-frame-is-immutable")
   {
      const auto f = testing::make_front_frame();
      const auto g = f.without_joint("l_shoulder");
      CATCH_REQUIRE(f.has_joint("l_shoulder"));
      CATCH_REQUIRE(!g.has_joint("l_shoulder"));
      CATCH_REQUIRE(g.size() + 1 == f.size());
      CATCH_REQUIRE(f.without_joint("no_such_joint") == f);
   }

   CATCH_SECTION("keypoint-frame-json")
   {
      const auto f = testing::make_side_frame();
      KeypointFrame g;
      read(g, f.to_json());
      CATCH_REQUIRE(f == g);
      CATCH_REQUIRE(g.pose_type() == PoseType::SIDE);
   }

   CATCH_SECTION("keypoint-frame-flat-detector-output")
   {
      const auto s = R"V0G0N(
{
   "frame_id": "op-7",
   "pose_type": "front",
   "width": 640,
   "height": 480,
   "pose_keypoints_2d": [320.0, 100.0, 0.9, 320.0, 140.0, 0.8, 280.0, 150.0, 0.0]
}
)V0G0N"s;
      KeypointFrame f;
      read(f, parse_json(s));
      CATCH_REQUIRE(f.frame_id() == "op-7");
      CATCH_REQUIRE(f.width() == 640);
      CATCH_REQUIRE(f.size() == 2);
      CATCH_REQUIRE(f.find("nose")->confidence == 0.9);
      CATCH_REQUIRE(f.find("neck")->y == 140.0);

      Json::Value o = parse_json(s);
      o["pose_keypoints_2d"].append(1.0);
      CATCH_REQUIRE_THROWS(read(f, o));
   }

   CATCH_SECTION("keypoint-frame-3d")
   {
      Keypoint k(1.0, 2.0, 3.0, 0.5);
      Keypoint l;
      l.read(k.to_json());
      CATCH_REQUIRE(l.is_3d());
      CATCH_REQUIRE(k == l);
   }
}

} // namespace anthro
