
#include "stdinc.hpp"

#include "compute-measurements.hpp"

namespace anthro
{
// ------------------------------------------------------------------- joint-span
// Pixel length along 'joints', and the lowest confidence among them.
struct JointSpan
{
   real pixels     = 0.0;
   real confidence = 1.0;
};

static JointSpan joint_span(const KeypointFrame& frame,
                            const vector<string>& joints,
                            const string_view entry) noexcept(false)
{
   Expects(joints.size() >= 2);

   auto get = [&](const string& joint) -> const Keypoint& {
      const Keypoint* kp = frame.find(joint);
      if(kp == nullptr)
         throw std::runtime_error(
             format("frame '{}' has no joint '{}', which '{}' requires",
                    frame.frame_id(),
                    joint,
                    entry));
      return *kp;
   };

   JointSpan ret;
   const Keypoint* prev = &get(joints.front());
   ret.confidence       = prev->confidence;
   for(size_t i = 1; i < joints.size(); ++i) {
      const Keypoint& kp = get(joints[i]);
      ret.pixels += prev->xy().distance(kp.xy());
      ret.confidence = std::min(ret.confidence, kp.confidence);
      prev           = &kp;
   }
   return ret;
}

// ------------------------------------------------------------------ make-empty
//
static MeasurementSet make_set(const MeasurementContext& ctx,
                               const string& view_id,
                               const PoseType pose_type,
                               const real calibration_ratio)
{
   MeasurementSet o;
   o.set_id             = format("{}/{}", ctx.capture_session_id, view_id);
   o.user_id            = ctx.user_id;
   o.capture_session_id = ctx.capture_session_id;
   o.view_id            = view_id;
   o.pose_type          = pose_type;
   o.calibration_ratio  = calibration_ratio;
   o.created_at         = ctx.timestamp;
   o.updated_at         = ctx.timestamp;
   return o;
}

static void check_scale(const CalibratedFrame& cf) noexcept(false)
{
   if(!std::isfinite(cf.scale_factor) or cf.scale_factor <= 0.0)
      throw std::runtime_error(format("frame '{}' has invalid scale factor {}",
                                      cf.frame.frame_id(),
                                      cf.scale_factor));
}

// ------------------------------------------------------------------ accuracy
//
bool is_accurate(const MeasurementSet::field_map_type& fields,
                 const real min_field_confidence) noexcept
{
   return std::all_of(cbegin(fields), cend(fields), [&](const auto& ii) {
      const Measurement& m = ii.second;
      return m.confidence > min_field_confidence
             and !m.estimated_from_front_only;
   });
}

vector<string> degenerate_fields(const MeasurementSet& set) noexcept
{
   vector<string> out;
   for(const auto& [name, m] : set.fields)
      if(!std::isfinite(m.value) or m.value <= 0.0) out.push_back(name);
   return out;
}

// --------------------------------------------------- compute-view-measurements
//
MeasurementSet compute_view_measurements(const CalibratedFrame& cf,
                                         const MeasurementPlan& plan,
                                         const ComputeParams& params,
                                         const MeasurementContext& ctx) noexcept(false)
{
   check_scale(cf);
   const auto& frame = cf.frame;
   const auto view   = frame.pose_type();
   const real scale  = cf.scale_factor;

   if(view == PoseType::COMBINED)
      throw std::runtime_error(format(
          "frame '{}': cannot capture a 'combined' view", frame.frame_id()));

   auto o = make_set(ctx, frame.frame_id(), view, scale);

   for(const auto& e : plan.entries) {
      if(!e.applies_to(view)) continue;

      Measurement m;
      m.model = e.model;

      if(e.model == MeasurementModel::CIRCUMFERENCE) {
         if(view != PoseType::FRONT) continue; // needs a front-view width
         const auto w = joint_span(frame, e.joints, e.name);
         const real a = 0.5 * e.width_scale * w.pixels * scale;
         const real b = a * params.front_only_depth_ratio;
         m.value      = ellipse_perimeter(a, b);
         m.confidence = w.confidence * params.front_only_confidence_factor;
         m.estimated_from_front_only = true;
      } else {
         const auto s = joint_span(frame, e.joints, e.name);
         m.value      = s.pixels * scale;
         m.confidence = s.confidence;
      }

      o.fields[e.name] = m;
   }

   o.is_accurate = is_accurate(o.fields, params.min_field_confidence);
   return o;
}

// ----------------------------------------------- compute-combined-measurements
//
MeasurementSet
compute_combined_measurements(const CalibratedFrame& front,
                              const CalibratedFrame& side,
                              const MeasurementPlan& plan,
                              const ComputeParams& params,
                              const MeasurementContext& ctx) noexcept(false)
{
   check_scale(front);
   check_scale(side);

   if(front.frame.pose_type() != PoseType::FRONT)
      throw std::runtime_error(format("frame '{}' is not a front view",
                                      front.frame.frame_id()));
   if(side.frame.pose_type() != PoseType::SIDE)
      throw std::runtime_error(
          format("frame '{}' is not a side view", side.frame.frame_id()));

   const auto view_id
       = format("{}+{}", front.frame.frame_id(), side.frame.frame_id());
   auto o = make_set(ctx, view_id, PoseType::COMBINED, front.scale_factor);

   for(const auto& e : plan.entries) {
      if(e.model != MeasurementModel::CIRCUMFERENCE) continue;
      if(!e.applies_to(PoseType::SIDE)) continue;

      const auto w = joint_span(front.frame, e.joints, e.name);
      const auto d = joint_span(side.frame, e.depth_joints, e.name);
      const real a = 0.5 * e.width_scale * w.pixels * front.scale_factor;
      const real b = 0.5 * e.depth_scale * d.pixels * side.scale_factor;

      Measurement m;
      m.model          = e.model;
      m.value          = ellipse_perimeter(a, b);
      m.confidence     = std::min(w.confidence, d.confidence);
      o.fields[e.name] = m;
   }

   o.is_accurate = is_accurate(o.fields, params.min_field_confidence);
   return o;
}

} // namespace anthro
