
#include "stdinc.hpp"

#include "keypoint-name.hpp"

#include <cctype>

namespace anthro
{
// -------------------------------------------------------- int to keypoint name
//
KeypointName int_to_keypoint_name(int val) noexcept(false)
{
   if(val < 0 or val >= k_n_keypoints)
      throw std::runtime_error(format("keypoint index {} out of range", val));
   return KeypointName(val);
}

// ------------------------------------------------------------------------- str
//
const char* str(const KeypointName r) noexcept
{
   switch(r) {
#define E(x) \
   case KeypointName::x: return #x;
      E(NOSE);
      E(NECK);
      E(R_SHOULDER);
      E(R_ELBOW);
      E(R_WRIST);
      E(L_SHOULDER);
      E(L_ELBOW);
      E(L_WRIST);
      E(MID_HIP);
      E(R_HIP);
      E(R_KNEE);
      E(R_ANKLE);
      E(L_HIP);
      E(L_KNEE);
      E(L_ANKLE);
      E(R_EYE);
      E(L_EYE);
      E(R_EAR);
      E(L_EAR);
      E(L_BIG_TOE);
      E(L_SMALL_TOE);
      E(L_HEEL);
      E(R_BIG_TOE);
      E(R_SMALL_TOE);
      E(R_HEEL);
      E(HEAD_TOP);
#undef E
   }
   return "<unknown>";
}

// ------------------------------------------------------------------ joint name
//
string joint_name(const KeypointName r) noexcept
{
   string s = str(r);
   std::transform(
       begin(s), end(s), begin(s), [](char c) { return char(std::tolower(c)); });
   return s;
}

// ------------------------------------------------------------ to keypoint name
//
KeypointName to_keypoint_name(const string_view val) noexcept(false)
{
   string s(val);
   std::transform(
       begin(s), end(s), begin(s), [](char c) { return char(std::toupper(c)); });

#define E(x) \
   if(s == #x) return KeypointName::x;
   E(NOSE);
   E(NECK);
   E(R_SHOULDER);
   E(R_ELBOW);
   E(R_WRIST);
   E(L_SHOULDER);
   E(L_ELBOW);
   E(L_WRIST);
   E(MID_HIP);
   E(R_HIP);
   E(R_KNEE);
   E(R_ANKLE);
   E(L_HIP);
   E(L_KNEE);
   E(L_ANKLE);
   E(R_EYE);
   E(L_EYE);
   E(R_EAR);
   E(L_EAR);
   E(L_BIG_TOE);
   E(L_SMALL_TOE);
   E(L_HEEL);
   E(R_BIG_TOE);
   E(R_SMALL_TOE);
   E(R_HEEL);
   E(HEAD_TOP);
#undef E

   throw std::runtime_error(format("could not convert '{}' to a keypoint", val));
}

} // namespace anthro
