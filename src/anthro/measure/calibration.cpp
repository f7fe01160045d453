
#include "stdinc.hpp"

#include "calibration.hpp"

#include "anthro/io/json-io.hpp"

namespace anthro
{
// -------------------------------------------------------- CalibrationReference
//
bool CalibrationReference::operator==(const CalibrationReference& o) const
    noexcept
{
   return is_close(physical_length, o.physical_length) and joint_a == o.joint_a
          and joint_b == o.joint_b;
}

Json::Value CalibrationReference::to_json() const noexcept
{
   auto o               = Json::Value{Json::objectValue};
   o["physical_length"] = json_save(physical_length);
   o["joint_a"]         = joint_a;
   o["joint_b"]         = joint_b;
   return o;
}

void CalibrationReference::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading calibration reference"s;
   CalibrationReference x;
   x.physical_length = json_load_key<real>(o, "physical_length", op);
   json_try_load_key(x.joint_a, o, "joint_a", op, false);
   json_try_load_key(x.joint_b, o, "joint_b", op, false);
   *this = std::move(x);
}

string CalibrationReference::to_string() const noexcept
{
   return format("{}cm over '{}' -> '{}'", physical_length, joint_a, joint_b);
}

// ------------------------------------------------------------- calibrate-frame
//
CalibrationResult calibrate_frame(const KeypointFrame& frame,
                                  const CalibrationReference& ref,
                                  const CalibrationParams& params) noexcept
{
   CalibrationResult ret;

   auto fail = [&](string msg) {
      ret.message = format("frame '{}': {}", frame.frame_id(), msg);
      WARN(format("{}: {}", str(ret.error), ret.message));
      return ret;
   };

   if(!std::isfinite(ref.physical_length) or ref.physical_length <= 0.0)
      return fail(format("reference length {} must be finite and positive",
                         ref.physical_length));

   const Keypoint* a = frame.find(ref.joint_a);
   const Keypoint* b = frame.find(ref.joint_b);
   if(a == nullptr)
      return fail(format("reference joint '{}' not detected", ref.joint_a));
   if(b == nullptr)
      return fail(format("reference joint '{}' not detected", ref.joint_b));

   const real pixel_distance = a->xy().distance(b->xy());
   if(!std::isfinite(pixel_distance) or pixel_distance == 0.0)
      return fail(format("reference span '{}' -> '{}' is degenerate ({})",
                         ref.joint_a,
                         ref.joint_b,
                         pixel_distance));
   if(pixel_distance < params.min_calibration_pixels)
      return fail(format("reference span '{}' -> '{}' is {:.2f}px, below the "
                         "minimum of {:.2f}px",
                         ref.joint_a,
                         ref.joint_b,
                         pixel_distance,
                         params.min_calibration_pixels));

   const real scale_factor = ref.physical_length / pixel_distance;
   Ensures(scale_factor > 0.0);

   ret.calibrated = CalibratedFrame{frame, scale_factor};
   TRACE(format("frame '{}' calibrated: {}cm / {}px = {}cm/px",
                frame.frame_id(),
                ref.physical_length,
                pixel_distance,
                scale_factor));
   return ret;
}

} // namespace anthro
