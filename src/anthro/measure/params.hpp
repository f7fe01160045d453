
#pragma once

#include "anthro/foundation.hpp"
#include "anthro/io/json-io.hpp"
#include "anthro/io/struct-meta.hpp"

namespace anthro
{
// ------------------------------------------------------------- ValidatorParams

struct ValidatorParams final : public MetaCompatible
{
   virtual ~ValidatorParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real min_confidence = 0.5; //!< A required joint below this is rejected
};

// ----------------------------------------------------------- CalibrationParams

struct CalibrationParams final : public MetaCompatible
{
   virtual ~CalibrationParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real min_calibration_pixels = 20.0; //!< Shorter reference spans are rejected
};

// --------------------------------------------------------------- ComputeParams

struct ComputeParams final : public MetaCompatible
{
   virtual ~ComputeParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real min_field_confidence = 0.5; //!< For 'is_accurate'

   // A circumference without a side view assumes depth = ratio * width
   real front_only_depth_ratio       = 0.70;
   real front_only_confidence_factor = 0.5;
};

// ------------------------------------------------------------- AggregateParams

struct AggregateParams final : public MetaCompatible
{
   virtual ~AggregateParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real conflict_tolerance   = 0.08; //!< Relative to the smallest value
   real min_field_confidence = 0.5;  //!< For 'is_accurate'
};

// ---------------------------------------------------------- VerificationParams

struct VerificationParams final : public MetaCompatible
{
   virtual ~VerificationParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real grace_period_seconds = 30.0; //!< Before a retake is proposed
   unsigned max_retakes      = 3;    //!< Retakes allowed per capture chain
};

// ---------------------------------------------------------------------- Params

struct Params final : public MetaCompatible
{
   virtual ~Params() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   bool feedback = false; //!< Log intermediate products

   ValidatorParams validator;
   CalibrationParams calibration;
   ComputeParams compute;
   AggregateParams aggregate;
   VerificationParams verification;

   // Throws if any value is out of its meaningful range.
   void validate() const noexcept(false);
};

META_READ_WRITE_LOAD_SAVE(Params)

} // namespace anthro
