
#pragma once

#include "anthro/body/keypoint-frame.hpp"
#include "json/json.h"

namespace anthro
{
// ------------------------------------------------------------ MeasurementModel
//
enum class MeasurementModel : int8_t {
   LINEAR = 0,   // distance between two joints
   PATH,         // summed segment lengths along a chain of joints
   CIRCUMFERENCE // ellipse from front-view width and side-view depth
};

const char* str(const MeasurementModel) noexcept; // "linear", ...
MeasurementModel to_measurement_model(const string_view val) noexcept(false);

// -------------------------------------------------------- MeasurementPlanEntry
//
struct MeasurementPlanEntry
{
   string name             = ""s;
   MeasurementModel model  = MeasurementModel::LINEAR;
   vector<string> joints   = {}; // CIRCUMFERENCE: the front-view width pair
   vector<string> depth_joints = {}; // CIRCUMFERENCE: the side-view depth pair
   vector<PoseType> views  = {PoseType::FRONT};

   // CIRCUMFERENCE: body width = width_scale * joint span, and likewise depth
   real width_scale = 1.0;
   real depth_scale = 1.0;

   bool applies_to(PoseType view) const noexcept;

   bool operator==(const MeasurementPlanEntry& o) const noexcept;
   bool operator!=(const MeasurementPlanEntry& o) const noexcept
   {
      return !(*this == o);
   }

   // Throws if the entry is malformed, ie, a LINEAR entry without two joints.
   void validate() const noexcept(false);

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);

   string to_string() const noexcept;
   friend string str(const MeasurementPlanEntry& o) noexcept
   {
      return o.to_string();
   }
};

// ------------------------------------------------------------- MeasurementPlan
//
struct MeasurementPlan
{
   string name                          = ""s;
   vector<MeasurementPlanEntry> entries = {};

   // nullptr if there's no such entry
   const MeasurementPlanEntry* find(const string_view name) const noexcept;

   // The joints a frame of 'view' must carry to compute every entry that
   // applies to it. Sorted, unique.
   vector<string> required_joints(PoseType view) const noexcept;

   bool operator==(const MeasurementPlan& o) const noexcept;
   bool operator!=(const MeasurementPlan& o) const noexcept
   {
      return !(*this == o);
   }

   // Validates every entry, and checks that names are unique.
   void validate() const noexcept(false);

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;
   friend string str(const MeasurementPlan& o) noexcept { return o.to_string(); }
};

void read(MeasurementPlan& plan, const Json::Value& node) noexcept(false);
void load(MeasurementPlan& plan, const string& fname) noexcept(false);

// Shoulder, hip, arm, leg, and torso spans, with chest, waist, and hip
// circumferences.
const MeasurementPlan& default_measurement_plan() noexcept;

} // namespace anthro
