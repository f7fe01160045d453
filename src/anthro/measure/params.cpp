
#include "stdinc.hpp"

#include "params.hpp"

namespace anthro
{
// -------------------------------------------------- ValidatorParams::meta-data
//
const vector<MemberMetaData>& ValidatorParams::meta_data() const noexcept
{
#define ThisParams ValidatorParams
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, min_confidence, true));
      return m;
   };
#undef ThisParams
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

// ------------------------------------------------ CalibrationParams::meta-data
//
const vector<MemberMetaData>& CalibrationParams::meta_data() const noexcept
{
#define ThisParams CalibrationParams
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, min_calibration_pixels, true));
      return m;
   };
#undef ThisParams
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

// ---------------------------------------------------- ComputeParams::meta-data
//
const vector<MemberMetaData>& ComputeParams::meta_data() const noexcept
{
#define ThisParams ComputeParams
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, min_field_confidence, true));
      m.push_back(MAKE_META(ThisParams, REAL, front_only_depth_ratio, true));
      m.push_back(
          MAKE_META(ThisParams, REAL, front_only_confidence_factor, true));
      return m;
   };
#undef ThisParams
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

// -------------------------------------------------- AggregateParams::meta-data
//
const vector<MemberMetaData>& AggregateParams::meta_data() const noexcept
{
#define ThisParams AggregateParams
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, conflict_tolerance, true));
      m.push_back(MAKE_META(ThisParams, REAL, min_field_confidence, true));
      return m;
   };
#undef ThisParams
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

// ----------------------------------------------- VerificationParams::meta-data
//
const vector<MemberMetaData>& VerificationParams::meta_data() const noexcept
{
#define ThisParams VerificationParams
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, grace_period_seconds, true));
      m.push_back(MAKE_META(ThisParams, UNSIGNED, max_retakes, true));
      return m;
   };
#undef ThisParams
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

// ----------------------------------------------------------- Params::meta-data
//
const vector<MemberMetaData>& Params::meta_data() const noexcept
{
#define ThisParams Params
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, BOOL, feedback, false));
      m.push_back(MAKE_META(ThisParams, COMPATIBLE_OBJECT, validator, true));
      m.push_back(MAKE_META(ThisParams, COMPATIBLE_OBJECT, calibration, true));
      m.push_back(MAKE_META(ThisParams, COMPATIBLE_OBJECT, compute, true));
      m.push_back(MAKE_META(ThisParams, COMPATIBLE_OBJECT, aggregate, true));
      m.push_back(MAKE_META(ThisParams, COMPATIBLE_OBJECT, verification, true));
      return m;
   };
#undef ThisParams
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

// ------------------------------------------------------------ Params::validate
//
void Params::validate() const noexcept(false)
{
   vector<string> errs;

   auto test = [&](bool ok, const char* name, real val, const char* expect) {
      if(!ok) errs.push_back(format("'{}' = {}, but {}", name, val, expect));
   };

   auto in_unit = [](real x) { return std::isfinite(x) and x >= 0.0 and x <= 1.0; };
   auto positive = [](real x) { return std::isfinite(x) and x > 0.0; };

   test(in_unit(validator.min_confidence),
        "validator.min_confidence",
        validator.min_confidence,
        "must be in [0, 1]");
   test(positive(calibration.min_calibration_pixels),
        "calibration.min_calibration_pixels",
        calibration.min_calibration_pixels,
        "must be positive");
   test(in_unit(compute.min_field_confidence),
        "compute.min_field_confidence",
        compute.min_field_confidence,
        "must be in [0, 1]");
   test(positive(compute.front_only_depth_ratio),
        "compute.front_only_depth_ratio",
        compute.front_only_depth_ratio,
        "must be positive");
   test(in_unit(compute.front_only_confidence_factor),
        "compute.front_only_confidence_factor",
        compute.front_only_confidence_factor,
        "must be in [0, 1]");
   test(std::isfinite(aggregate.conflict_tolerance)
            and aggregate.conflict_tolerance >= 0.0,
        "aggregate.conflict_tolerance",
        aggregate.conflict_tolerance,
        "must be non-negative");
   test(in_unit(aggregate.min_field_confidence),
        "aggregate.min_field_confidence",
        aggregate.min_field_confidence,
        "must be in [0, 1]");
   test(std::isfinite(verification.grace_period_seconds)
            and verification.grace_period_seconds >= 0.0,
        "verification.grace_period_seconds",
        verification.grace_period_seconds,
        "must be non-negative");

   if(!errs.empty())
      throw std::runtime_error(format("invalid parameters:\n   {}",
                                      implode(cbegin(errs), cend(errs), "\n   ")));
}

} // namespace anthro
