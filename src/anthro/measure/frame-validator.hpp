
#pragma once

#include "error-kind.hpp"
#include "params.hpp"

#include "anthro/body/keypoint-frame.hpp"

namespace anthro
{
struct JointRejection
{
   string joint     = ""s;
   ErrorKind reason = ErrorKind::MISSING_JOINT;
   string message   = ""s;

   string to_string() const noexcept;
   friend string str(const JointRejection& o) noexcept { return o.to_string(); }
};

struct ValidationResult
{
   string frame_id                   = ""s;
   vector<JointRejection> rejections = {};

   bool is_valid() const noexcept { return rejections.empty(); }

   // The first rejection, in joint-name order. Expects !is_valid()
   const JointRejection& reason() const noexcept;

   string to_string() const noexcept;
   friend string str(const ValidationResult& o) noexcept
   {
      return o.to_string();
   }
};

// Each required joint must be present, have confidence at or above
// 'min_confidence', and lie within [0, width) x [0, height).
ValidationResult validate_frame(const KeypointFrame& frame,
                                const vector<string>& required_joints,
                                const ValidatorParams& params) noexcept;

} // namespace anthro
