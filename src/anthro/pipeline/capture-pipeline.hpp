
#pragma once

#include "anthro/measure/aggregate-views.hpp"
#include "anthro/measure/calibration.hpp"
#include "anthro/measure/compute-measurements.hpp"
#include "anthro/measure/frame-validator.hpp"
#include "anthro/session/session-arena.hpp"

namespace anthro
{
// ---------------------------------------------------------------- CaptureInput
//
// The frames of one capture session, as delivered by the pose detector.
//
struct CaptureInput
{
   string user_id                   = ""s;
   string capture_session_id        = ""s;
   CalibrationReference calibration = {};
   vector<KeypointFrame> frames     = {};

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);
};

// ---------------------------------------------------------------- FrameFailure
//
struct FrameFailure
{
   string frame_id   = ""s;
   PoseType view     = PoseType::FRONT;
   ErrorKind error   = ErrorKind::MISSING_JOINT;
   string message    = ""s;

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;
   friend string str(const FrameFailure& o) noexcept { return o.to_string(); }
};

// --------------------------------------------------------------- CaptureResult
//
struct CaptureResult
{
   string user_id                                   = ""s;
   string capture_session_id                        = ""s;
   vector<FrameFailure> failures                    = {};
   vector<MeasurementSet> view_sets                 = {};
   std::optional<ReconciledMeasurementSet> reconciled = {};

   // TRUE iff no frame survived validation and calibration
   bool is_capture_failure() const noexcept { return !reconciled.has_value(); }

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;
   friend string str(const CaptureResult& o) noexcept { return o.to_string(); }
};

// Joints a frame of 'view' needs: the plan's, and the calibration pair.
vector<string> required_joints(const MeasurementPlan& plan,
                               const CalibrationReference& calibration,
                               const PoseType view) noexcept;

/**
 * Validates and calibrates every frame, computes a set per surviving frame,
 * plus a COMBINED circumference set from the first surviving front and side
 * frames, and reconciles them. Frame failures are collected in the result.
 *
 * Throws on a COMBINED input frame, or an invalid plan.
 */
CaptureResult process_capture(const CaptureInput& input,
                              const MeasurementPlan& plan,
                              const Params& params,
                              const Timestamp& now = Timestamp::now()) noexcept(false);

// Independent sessions run concurrently. Result 'i' belongs to input 'i'.
vector<CaptureResult>
process_captures(const vector<CaptureInput>& inputs,
                 const MeasurementPlan& plan,
                 const Params& params,
                 const Timestamp& now = Timestamp::now()) noexcept(false);

// Stores the frames and sets in 'session', then submits the reconciled set,
// or reports a capture failure if there isn't one.
void ingest_capture(CaptureSession& session,
                    const CaptureInput& input,
                    const CaptureResult& result) noexcept(false);

} // namespace anthro
