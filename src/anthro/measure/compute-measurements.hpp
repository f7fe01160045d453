
#pragma once

#include "calibration.hpp"
#include "measurement-set.hpp"
#include "params.hpp"

namespace anthro
{
// Identifies the sets a computation produces.
struct MeasurementContext
{
   string user_id            = ""s;
   string capture_session_id = ""s;
   Timestamp timestamp       = {}; // becomes 'created_at' and 'updated_at'
};

// Every LINEAR and PATH entry that applies to the frame's view. A FRONT frame
// also yields each CIRCUMFERENCE entry, estimated from the front view alone.
// Throws if the frame lacks a joint the plan needs.
MeasurementSet compute_view_measurements(const CalibratedFrame& frame,
                                         const MeasurementPlan& plan,
                                         const ComputeParams& params,
                                         const MeasurementContext& ctx) noexcept(false);

// The CIRCUMFERENCE entries, from a front frame's widths and a side frame's
// depths. The result's pose-type is COMBINED.
MeasurementSet
compute_combined_measurements(const CalibratedFrame& front,
                              const CalibratedFrame& side,
                              const MeasurementPlan& plan,
                              const ComputeParams& params,
                              const MeasurementContext& ctx) noexcept(false);

// 'is_accurate' holds iff every field's confidence exceeds
// 'min_field_confidence' and no field is estimated from the front only.
bool is_accurate(const MeasurementSet::field_map_type& fields,
                 const real min_field_confidence) noexcept;

// Fields whose value is not finite and positive, ie, measured between
// coinciding joints. Sorted.
vector<string> degenerate_fields(const MeasurementSet& set) noexcept;

} // namespace anthro
