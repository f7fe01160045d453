
#pragma once

#include "error-kind.hpp"
#include "params.hpp"

#include "anthro/body/keypoint-frame.hpp"

namespace anthro
{
// ------------------------------------------------------- CalibrationReference
//
// A known physical length, and the two joints whose pixel distance spans it.
//
struct CalibrationReference
{
   real physical_length = dNAN;        // cm, ie, the user's height
   string joint_a       = "head_top"s;
   string joint_b       = "r_ankle"s;

   bool operator==(const CalibrationReference& o) const noexcept;
   bool operator!=(const CalibrationReference& o) const noexcept
   {
      return !(*this == o);
   }

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);

   string to_string() const noexcept;
   friend string str(const CalibrationReference& o) noexcept
   {
      return o.to_string();
   }
};

// ------------------------------------------------------------ CalibratedFrame
//
struct CalibratedFrame
{
   KeypointFrame frame;
   real scale_factor = dNAN; // cm per pixel, always > 0
};

struct CalibrationResult
{
   std::optional<CalibratedFrame> calibrated = {};
   ErrorKind error  = ErrorKind::INVALID_CALIBRATION; // when !is_ok()
   string message   = ""s;

   bool is_ok() const noexcept { return calibrated.has_value(); }
};

// scale_factor = physical_length / |joint_a - joint_b|, in the image plane.
// Fails with InvalidCalibration on a missing joint, a non-positive physical
// length, or a pixel span below 'min_calibration_pixels'.
CalibrationResult calibrate_frame(const KeypointFrame& frame,
                                  const CalibrationReference& ref,
                                  const CalibrationParams& params) noexcept;

} // namespace anthro
