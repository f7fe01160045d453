
#pragma once

#include "anthro/foundation.hpp"

namespace anthro
{
// The BODY_25 layout, indexed the way the detector emits it, plus HEAD_TOP,
// which some detectors report as a 26th landmark.
enum class KeypointName : int8_t {
   NOSE = 0,
   NECK,
   R_SHOULDER,
   R_ELBOW,
   R_WRIST,
   L_SHOULDER,
   L_ELBOW,
   L_WRIST,
   MID_HIP,
   R_HIP,
   R_KNEE,
   R_ANKLE,
   L_HIP,
   L_KNEE,
   L_ANKLE,
   R_EYE,
   L_EYE,
   R_EAR,
   L_EAR,
   L_BIG_TOE,
   L_SMALL_TOE,
   L_HEEL,
   R_BIG_TOE,
   R_SMALL_TOE,
   R_HEEL,
   HEAD_TOP
};

constexpr int k_n_body25_keypoints = int(KeypointName::R_HEEL) + 1;
constexpr int k_n_keypoints        = int(KeypointName::HEAD_TOP) + 1;

KeypointName int_to_keypoint_name(int) noexcept(false);
const char* str(const KeypointName) noexcept;

// The joint identifier used in frames and plans, ie, "r_shoulder".
string joint_name(const KeypointName) noexcept;

// Accepts "R_SHOULDER" and "r_shoulder"
KeypointName to_keypoint_name(const string_view val) noexcept(false);

} // namespace anthro
