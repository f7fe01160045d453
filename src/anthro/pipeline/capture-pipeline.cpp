
#include "stdinc.hpp"

#include "capture-pipeline.hpp"

#include "anthro/io/json-io.hpp"

#define This CaptureInput

namespace anthro
{
// ---------------------------------------------------------------- CaptureInput
//
Json::Value This::to_json() const noexcept
{
   auto o                  = Json::Value{Json::objectValue};
   o["user_id"]            = user_id;
   o["capture_session_id"] = capture_session_id;
   o["calibration"]        = calibration.to_json();
   auto x                  = Json::Value{Json::arrayValue};
   for(const auto& f : frames) x.append(f.to_json());
   o["frames"] = x;
   return o;
}

void This::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading capture input"s;

   CaptureInput x;
   x.user_id            = json_load_key<string>(o, "user_id", op);
   x.capture_session_id = json_load_key<string>(o, "capture_session_id", op);
   x.calibration.read(get_key(o, "calibration"));

   const auto arr = get_key(o, "frames");
   if(!arr.isArray())
      throw std::runtime_error(
          format("capture '{}': 'frames' must be an array",
                 x.capture_session_id));
   x.frames.resize(arr.size());
   for(auto i = 0u; i < arr.size(); ++i) anthro::read(x.frames[i], arr[i]);

   *this = std::move(x);
}

#undef This

// ---------------------------------------------------------------- FrameFailure
//
Json::Value FrameFailure::to_json() const noexcept
{
   auto o        = Json::Value{Json::objectValue};
   o["frame_id"] = frame_id;
   o["view"]     = str(view);
   o["error"]    = str(error);
   o["message"]  = message;
   return o;
}

string FrameFailure::to_string() const noexcept
{
   return format("{} frame '{}': {}: {}", str(view), frame_id, str(error),
                 message);
}

// --------------------------------------------------------------- CaptureResult
//
Json::Value CaptureResult::to_json() const noexcept
{
   auto o                  = Json::Value{Json::objectValue};
   o["user_id"]            = user_id;
   o["capture_session_id"] = capture_session_id;

   auto f = Json::Value{Json::arrayValue};
   for(const auto& x : failures) f.append(x.to_json());
   o["failures"] = f;

   auto s = Json::Value{Json::arrayValue};
   for(const auto& x : view_sets) s.append(x.to_json());
   o["view_sets"] = s;

   o["reconciled"] = reconciled.has_value() ? reconciled->to_json()
                                            : Json::Value{Json::nullValue};
   return o;
}

string CaptureResult::to_string() const noexcept
{
   std::stringstream ss{""};
   ss << format("CaptureResult session '{}', user '{}': {} sets, {} failures",
                capture_session_id,
                user_id,
                view_sets.size(),
                failures.size())
      << endl;
   for(const auto& x : failures) ss << "   " << x.to_string() << endl;
   if(reconciled.has_value())
      ss << reconciled->to_string();
   else
      ss << "   no reconciled set" << endl;
   return ss.str();
}

// ------------------------------------------------------------- required-joints
//
vector<string> required_joints(const MeasurementPlan& plan,
                               const CalibrationReference& calibration,
                               const PoseType view) noexcept
{
   auto out = plan.required_joints(view);
   out.push_back(calibration.joint_a);
   out.push_back(calibration.joint_b);
   std::sort(begin(out), end(out));
   out.erase(std::unique(begin(out), end(out)), end(out));
   return out;
}

// ------------------------------------------------------------- process-capture
//
CaptureResult process_capture(const CaptureInput& input,
                              const MeasurementPlan& plan,
                              const Params& params,
                              const Timestamp& now) noexcept(false)
{
   plan.validate();

   CaptureResult ret;
   ret.user_id            = input.user_id;
   ret.capture_session_id = input.capture_session_id;

   const MeasurementContext ctx{input.user_id, input.capture_session_id, now};

   const auto front_joints
       = required_joints(plan, input.calibration, PoseType::FRONT);
   const auto side_joints
       = required_joints(plan, input.calibration, PoseType::SIDE);

   std::optional<CalibratedFrame> first_front, first_side;

   for(const auto& frame : input.frames) {
      if(frame.pose_type() == PoseType::COMBINED)
         throw std::runtime_error(
             format("capture '{}': frame '{}' is 'combined', but captured "
                    "frames must be 'front' or 'side'",
                    input.capture_session_id,
                    frame.frame_id()));

      const bool is_front = (frame.pose_type() == PoseType::FRONT);
      auto failed = [&](ErrorKind error, string message) {
         WARN(format("capture '{}': {} frame '{}' rejected, {}: {}",
                     input.capture_session_id,
                     str(frame.pose_type()),
                     frame.frame_id(),
                     str(error),
                     message));
         ret.failures.push_back(
             {frame.frame_id(), frame.pose_type(), error, std::move(message)});
      };

      const auto vr = validate_frame(
          frame, is_front ? front_joints : side_joints, params.validator);
      if(!vr.is_valid()) {
         failed(vr.reason().reason, vr.reason().message);
         continue;
      }

      auto cr = calibrate_frame(frame, input.calibration, params.calibration);
      if(!cr.is_ok()) {
         failed(cr.error, cr.message);
         continue;
      }

      auto set
          = compute_view_measurements(*cr.calibrated, plan, params.compute, ctx);
      const auto bad = degenerate_fields(set);
      if(!bad.empty()) {
         failed(ErrorKind::DEGENERATE_MEASUREMENT,
                format("fields [{}] are not finite and positive",
                       implode(cbegin(bad), cend(bad), ", ")));
         continue;
      }
      ret.view_sets.push_back(std::move(set));

      auto& first = is_front ? first_front : first_side;
      if(!first.has_value()) first = std::move(cr.calibrated);
   }

   if(first_front.has_value() and first_side.has_value()) {
      auto combined = compute_combined_measurements(
          *first_front, *first_side, plan, params.compute, ctx);
      const auto bad = degenerate_fields(combined);
      if(!bad.empty()) {
         auto message = format("fields [{}] are not finite and positive",
                               implode(cbegin(bad), cend(bad), ", "));
         WARN(format("capture '{}': combined view '{}' rejected, {}: {}",
                     input.capture_session_id,
                     combined.view_id,
                     str(ErrorKind::DEGENERATE_MEASUREMENT),
                     message));
         ret.failures.push_back({combined.view_id,
                                 PoseType::COMBINED,
                                 ErrorKind::DEGENERATE_MEASUREMENT,
                                 std::move(message)});
      } else if(!combined.fields.empty()) {
         ret.view_sets.push_back(std::move(combined));
      }
   }

   if(!ret.view_sets.empty())
      ret.reconciled = aggregate_views(ret.view_sets, params.aggregate, now);

   if(params.feedback) INFO(ret.to_string());

   return ret;
}

// ------------------------------------------------------------ process-captures
//
vector<CaptureResult> process_captures(const vector<CaptureInput>& inputs,
                                       const MeasurementPlan& plan,
                                       const Params& params,
                                       const Timestamp& now) noexcept(false)
{
   vector<CaptureResult> out(inputs.size());

   ParallelJobSet pjobs;
   pjobs.reserve(inputs.size());
   for(size_t i = 0; i < inputs.size(); ++i)
      pjobs.schedule([&, i]() {
         out[i] = process_capture(inputs[i], plan, params, now);
      });
   pjobs.execute();

   return out;
}

// -------------------------------------------------------------- ingest-capture
//
void ingest_capture(CaptureSession& session,
                    const CaptureInput& input,
                    const CaptureResult& result) noexcept(false)
{
   if(input.capture_session_id != session.session_id()
      or result.capture_session_id != session.session_id()
      or input.user_id != session.user_id()
      or result.user_id != session.user_id())
      throw std::runtime_error(
          format("cannot ingest capture '{}' of user '{}' into session '{}' "
                 "of user '{}'",
                 input.capture_session_id,
                 input.user_id,
                 session.session_id(),
                 session.user_id()));

   for(const auto& s : result.view_sets)
      if(s.capture_session_id != session.session_id()
         or s.user_id != session.user_id())
         throw std::runtime_error(
             format("cannot ingest set '{}' (session '{}', user '{}') into "
                    "session '{}'",
                    s.set_id,
                    s.capture_session_id,
                    s.user_id,
                    session.session_id()));

   // The session is only touched once the verification accepts the outcome
   if(result.reconciled.has_value()) {
      session.verification().submit(*result.reconciled);
   } else {
      const auto reason
          = result.failures.empty()
                ? "no frames were captured"s
                : implode(cbegin(result.failures),
                          cend(result.failures),
                          "; ",
                          [](const auto& x) { return x.to_string(); });
      session.verification().report_capture_failure(reason);
   }

   session.add_frames(input.frames);
   session.add_view_sets(result.view_sets);
}

} // namespace anthro
