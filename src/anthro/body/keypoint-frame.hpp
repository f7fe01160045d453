
#pragma once

#include "keypoint-name.hpp"

#include "anthro/geometry/vector.hpp"
#include "anthro/utils/math.hpp"
#include "json/json.h"

namespace anthro
{
// -------------------------------------------------------------------- PoseType
//
enum class PoseType : int8_t { FRONT = 0, SIDE, COMBINED };

const char* str(const PoseType) noexcept; // "front", "side", "combined"
PoseType to_pose_type(const string_view val) noexcept(false);

// -------------------------------------------------------------------- Keypoint
//
struct Keypoint
{
   real x          = dNAN;
   real y          = dNAN;
   real z          = dNAN; // NAN for 2D detections
   real confidence = 0.0;

   Keypoint() = default;
   Keypoint(real x_, real y_, real confidence_)
       : x(x_)
       , y(y_)
       , confidence(confidence_)
   {}
   Keypoint(real x_, real y_, real z_, real confidence_)
       : x(x_)
       , y(y_)
       , z(z_)
       , confidence(confidence_)
   {}

   bool operator==(const Keypoint& o) const noexcept;
   bool operator!=(const Keypoint& o) const noexcept { return !(*this == o); }

   bool is_3d() const noexcept { return std::isfinite(z); }
   Vector2 xy() const noexcept { return Vector2(x, y); }

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);

   string to_string() const noexcept;
   friend string str(const Keypoint& o) noexcept { return o.to_string(); }
};

// --------------------------------------------------------------- KeypointFrame
//
// One pose detection. Immutable: the joint map is fixed at construction.
//
class KeypointFrame
{
 public:
   using joint_map_type = std::map<string, Keypoint, std::less<>>;

 private:
   string frame_id_     = ""s;
   PoseType pose_type_  = PoseType::FRONT;
   unsigned width_      = 0;
   unsigned height_     = 0;
   joint_map_type joints_;

 public:
   KeypointFrame() = default;
   KeypointFrame(string frame_id,
                 PoseType pose_type,
                 unsigned width,
                 unsigned height,
                 joint_map_type joints);
   KeypointFrame(const KeypointFrame&) = default;
   KeypointFrame(KeypointFrame&&)      = default;
   ~KeypointFrame()                    = default;
   KeypointFrame& operator=(const KeypointFrame&) = default;
   KeypointFrame& operator=(KeypointFrame&&) = default;

   // 'detections' is indexed by KeypointName. A detection with zero
   // confidence is treated as absent.
   static KeypointFrame from_indexed(string frame_id,
                                     PoseType pose_type,
                                     unsigned width,
                                     unsigned height,
                                     const vector<Keypoint>& detections) noexcept(false);

   bool operator==(const KeypointFrame& o) const noexcept;
   bool operator!=(const KeypointFrame& o) const noexcept
   {
      return !(*this == o);
   }

   const string& frame_id() const noexcept { return frame_id_; }
   PoseType pose_type() const noexcept { return pose_type_; }
   unsigned width() const noexcept { return width_; }
   unsigned height() const noexcept { return height_; }
   const joint_map_type& joints() const noexcept { return joints_; }
   size_t size() const noexcept { return joints_.size(); }

   // nullptr if the joint was not detected
   const Keypoint* find(const string_view joint) const noexcept;
   bool has_joint(const string_view joint) const noexcept
   {
      return find(joint) != nullptr;
   }

   // A copy of this frame with 'joint' removed.
   KeypointFrame without_joint(const string_view joint) const noexcept;

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;
   friend string str(const KeypointFrame& o) noexcept { return o.to_string(); }
};

void read(KeypointFrame& frame, const Json::Value& node) noexcept(false);

} // namespace anthro
