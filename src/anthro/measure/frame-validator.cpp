
#include "stdinc.hpp"

#include "frame-validator.hpp"

namespace anthro
{
string JointRejection::to_string() const noexcept
{
   return format("{}: {}", str(reason), message);
}

const JointRejection& ValidationResult::reason() const noexcept
{
   Expects(!rejections.empty());
   return rejections.front();
}

string ValidationResult::to_string() const noexcept
{
   if(is_valid()) return format("frame '{}' is valid", frame_id);
   return format("frame '{}' rejected:\n   {}",
                 frame_id,
                 implode(cbegin(rejections), cend(rejections), "\n   "));
}

// -------------------------------------------------------------- validate-frame
//
ValidationResult validate_frame(const KeypointFrame& frame,
                                const vector<string>& required_joints,
                                const ValidatorParams& params) noexcept
{
   ValidationResult ret;
   ret.frame_id = frame.frame_id();

   auto joints = required_joints;
   std::sort(begin(joints), end(joints));
   joints.erase(std::unique(begin(joints), end(joints)), end(joints));

   const real w = real(frame.width());
   const real h = real(frame.height());

   auto reject = [&](const string& joint, ErrorKind kind, string msg) {
      ret.rejections.push_back({joint, kind, std::move(msg)});
   };

   for(const auto& joint : joints) {
      const Keypoint* kp = frame.find(joint);
      if(kp == nullptr) {
         reject(joint,
                ErrorKind::MISSING_JOINT,
                format("joint '{}' not detected", joint));
      } else if(!(kp->confidence >= params.min_confidence)) {
         reject(joint,
                ErrorKind::LOW_CONFIDENCE,
                format("joint '{}' has confidence {:.3f} < {:.3f}",
                       joint,
                       kp->confidence,
                       params.min_confidence));
      } else if(!std::isfinite(kp->x) or !std::isfinite(kp->y)
                or kp->x < 0.0 or kp->x >= w or kp->y < 0.0 or kp->y >= h) {
         reject(joint,
                ErrorKind::OUT_OF_BOUNDS,
                format("joint '{}' at {} is outside the {}x{} frame",
                       joint,
                       str(kp->xy()),
                       frame.width(),
                       frame.height()));
      }
   }

   if(!ret.is_valid())
      TRACE(format("frame '{}' rejected with {} problems",
                   frame.frame_id(),
                   ret.rejections.size()));

   return ret;
}

} // namespace anthro
