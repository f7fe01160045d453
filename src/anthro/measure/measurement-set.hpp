
#pragma once

#include "measurement-plan.hpp"

#include "anthro/utils/timestamp.hpp"

namespace anthro
{
// ----------------------------------------------------------------- Measurement
//
struct Measurement
{
   real value                     = dNAN; // cm
   real confidence                = 0.0;  // [0, 1]
   MeasurementModel model         = MeasurementModel::LINEAR;
   bool estimated_from_front_only = false;
   bool conflicting               = false;

   bool operator==(const Measurement& o) const noexcept;
   bool operator!=(const Measurement& o) const noexcept { return !(*this == o); }

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);

   string to_string() const noexcept;
   friend string str(const Measurement& o) noexcept { return o.to_string(); }
};

// -------------------------------------------------------------- MeasurementSet
//
// The measurements of one view (or the reconciliation of several). Persisted
// by collaborators under (user_id, capture_session_id).
//
struct MeasurementSet
{
   using field_map_type = std::map<string, Measurement, std::less<>>;

   string set_id             = ""s;
   string user_id            = ""s;
   string capture_session_id = ""s;
   string view_id            = ""s;
   PoseType pose_type        = PoseType::FRONT;
   real calibration_ratio    = dNAN; // cm per pixel
   field_map_type fields     = {};
   bool is_accurate          = false;
   bool verified_by_user     = false;
   Timestamp created_at      = {};
   Timestamp updated_at      = {};

   // nullptr if there's no such field
   const Measurement* find(const string_view name) const noexcept;

   bool operator==(const MeasurementSet& o) const noexcept;
   bool operator!=(const MeasurementSet& o) const noexcept
   {
      return !(*this == o);
   }

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);

   string to_string() const noexcept;
   friend string str(const MeasurementSet& o) noexcept { return o.to_string(); }
};

// Throws unless every field names a plan entry, carries that entry's model,
// and has a finite positive value and a confidence in [0, 1].
void validate_against_plan(const MeasurementSet& set,
                           const MeasurementPlan& plan) noexcept(false);

// ---------------------------------------------------- ReconciledMeasurementSet
//
struct ReconciledMeasurementSet
{
   MeasurementSet set; // pose_type is COMBINED

   // field -> the view ids that contributed to it
   std::map<string, vector<string>, std::less<>> provenance = {};
   vector<string> conflicting_fields                        = {};
   vector<string> source_set_ids                            = {};

   bool has_conflicts() const noexcept { return !conflicting_fields.empty(); }

   bool operator==(const ReconciledMeasurementSet& o) const noexcept;
   bool operator!=(const ReconciledMeasurementSet& o) const noexcept
   {
      return !(*this == o);
   }

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);

   string to_string() const noexcept;
   friend string str(const ReconciledMeasurementSet& o) noexcept
   {
      return o.to_string();
   }
};

} // namespace anthro
