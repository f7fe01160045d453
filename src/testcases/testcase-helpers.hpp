
#pragma once

#include "anthro/body/keypoint-frame.hpp"
#include "anthro/measure/measurement-set.hpp"
#include "anthro/pipeline/capture-pipeline.hpp"

namespace anthro::testing
{
// A 1000x1000 front view of a 170cm subject: 850px from head-top to right
// ankle, and 225px across the shoulders.
inline KeypointFrame make_front_frame(const string& frame_id = "front-0"s,
                                      const real confidence  = 0.9)
{
   auto kp = [&](real x, real y) { return Keypoint(x, y, confidence); };
   KeypointFrame::joint_map_type j;
   j["head_top"]   = kp(500.0, 50.0);
   j["nose"]       = kp(500.0, 120.0);
   j["neck"]       = kp(500.0, 180.0);
   j["l_shoulder"] = kp(612.5, 200.0);
   j["r_shoulder"] = kp(387.5, 200.0);
   j["r_elbow"]    = kp(370.0, 350.0);
   j["r_wrist"]    = kp(360.0, 480.0);
   j["mid_hip"]    = kp(500.0, 480.0);
   j["l_hip"]      = kp(570.0, 480.0);
   j["r_hip"]      = kp(430.0, 480.0);
   j["r_knee"]     = kp(440.0, 690.0);
   j["r_ankle"]    = kp(500.0, 900.0);
   return KeypointFrame(frame_id, PoseType::FRONT, 1000, 1000, std::move(j));
}

// A side view at the same scale, carrying the depth landmarks.
inline KeypointFrame make_side_frame(const string& frame_id = "side-0"s,
                                     const real confidence  = 0.9)
{
   auto kp = [&](real x, real y) { return Keypoint(x, y, confidence); };
   KeypointFrame::joint_map_type j;
   j["head_top"]    = kp(500.0, 60.0);
   j["neck"]        = kp(505.0, 180.0);
   j["mid_hip"]     = kp(505.0, 480.0);
   j["r_shoulder"]  = kp(500.0, 200.0);
   j["r_elbow"]     = kp(500.0, 350.0);
   j["r_wrist"]     = kp(510.0, 480.0);
   j["r_hip"]       = kp(500.0, 480.0);
   j["r_knee"]      = kp(510.0, 690.0);
   j["r_ankle"]     = kp(500.0, 910.0);
   j["chest_front"] = kp(560.0, 260.0);
   j["chest_back"]  = kp(440.0, 260.0);
   j["waist_front"] = kp(550.0, 420.0);
   j["waist_back"]  = kp(450.0, 420.0);
   j["hip_front"]   = kp(560.0, 500.0);
   j["hip_back"]    = kp(440.0, 500.0);
   return KeypointFrame(frame_id, PoseType::SIDE, 1000, 1000, std::move(j));
}

// A copy of 'frame' with 'joint' set to 'kp'.
inline KeypointFrame with_joint(const KeypointFrame& frame,
                                const string& joint,
                                const Keypoint& kp)
{
   auto joints   = frame.joints();
   joints[joint] = kp;
   return KeypointFrame(frame.frame_id(),
                        frame.pose_type(),
                        frame.width(),
                        frame.height(),
                        std::move(joints));
}

inline CaptureInput make_capture_input(const string& user_id,
                                       const string& session_id,
                                       vector<KeypointFrame> frames)
{
   CaptureInput o;
   o.user_id                     = user_id;
   o.capture_session_id          = session_id;
   o.calibration.physical_length = 170.0;
   o.frames                      = std::move(frames);
   return o;
}

// A per-view set with the given fields, all at 'confidence'.
inline MeasurementSet
make_view_set(const string& user_id,
              const string& session_id,
              const string& view_id,
              const vector<std::pair<string, real>>& fields,
              const MeasurementModel model = MeasurementModel::LINEAR,
              const real confidence        = 0.9,
              const bool front_only        = false)
{
   MeasurementSet o;
   o.set_id             = format("{}/{}", session_id, view_id);
   o.user_id            = user_id;
   o.capture_session_id = session_id;
   o.view_id            = view_id;
   o.pose_type          = PoseType::FRONT;
   o.calibration_ratio  = 0.2;
   o.created_at         = Timestamp(1600000000);
   o.updated_at         = o.created_at;
   for(const auto& [name, value] : fields) {
      Measurement m;
      m.value                     = value;
      m.confidence                = confidence;
      m.model                     = model;
      m.estimated_from_front_only = front_only;
      o.fields[name]              = m;
   }
   o.is_accurate = !front_only and confidence > 0.5;
   return o;
}

} // namespace anthro::testing
