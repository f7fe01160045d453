
#include "stdinc.hpp"

#include "measurement-set.hpp"

#include "anthro/io/json-io.hpp"

namespace anthro
{
static bool real_eq(real a, real b) noexcept
{
   return (std::isnan(a) and std::isnan(b)) or a == b;
}

// ----------------------------------------------------------------- Measurement
//
bool Measurement::operator==(const Measurement& o) const noexcept
{
   return real_eq(value, o.value) and real_eq(confidence, o.confidence)
          and model == o.model
          and estimated_from_front_only == o.estimated_from_front_only
          and conflicting == o.conflicting;
}

Json::Value Measurement::to_json() const noexcept
{
   auto o                         = Json::Value{Json::objectValue};
   o["value"]                     = json_save(value);
   o["confidence"]                = json_save(confidence);
   o["model"]                     = str(model);
   o["estimated_from_front_only"] = estimated_from_front_only;
   o["conflicting"]               = conflicting;
   return o;
}

void Measurement::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading measurement"s;
   Measurement x;
   x.value      = json_load_key<real>(o, "value", op);
   x.confidence = json_load_key<real>(o, "confidence", op);
   x.model      = to_measurement_model(json_load_key<string>(o, "model", op));
   json_try_load_key(
       x.estimated_from_front_only, o, "estimated_from_front_only", op, false);
   json_try_load_key(x.conflicting, o, "conflicting", op, false);
   *this = x;
}

string Measurement::to_string() const noexcept
{
   return format("{:.2f}cm @ {:.3f}{}{}",
                 value,
                 confidence,
                 (estimated_from_front_only ? " [front-only]" : ""),
                 (conflicting ? " [conflicting]" : ""));
}

// -------------------------------------------------------------- MeasurementSet
//
const Measurement* MeasurementSet::find(const string_view name) const noexcept
{
   auto ii = fields.find(name);
   return (ii == cend(fields)) ? nullptr : &ii->second;
}

bool MeasurementSet::operator==(const MeasurementSet& o) const noexcept
{
   return set_id == o.set_id and user_id == o.user_id
          and capture_session_id == o.capture_session_id
          and view_id == o.view_id and pose_type == o.pose_type
          and real_eq(calibration_ratio, o.calibration_ratio)
          and fields == o.fields and is_accurate == o.is_accurate
          and verified_by_user == o.verified_by_user
          and created_at == o.created_at and updated_at == o.updated_at;
}

Json::Value MeasurementSet::to_json() const noexcept
{
   auto o                  = Json::Value{Json::objectValue};
   o["set_id"]             = set_id;
   o["user_id"]            = user_id;
   o["capture_session_id"] = capture_session_id;
   o["view_id"]            = view_id;
   o["pose_type"]          = str(pose_type);
   o["calibration_ratio"]  = json_save(calibration_ratio);
   o["is_accurate"]        = is_accurate;
   o["verified_by_user"]   = verified_by_user;
   o["created_at"]         = json_save(created_at);
   o["updated_at"]         = json_save(updated_at);

   auto f = Json::Value{Json::objectValue};
   for(const auto& [name, m] : fields) f[name] = m.to_json();
   o["fields"] = f;
   return o;
}

void MeasurementSet::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading measurement set"s;

   MeasurementSet x;
   x.set_id             = json_load_key<string>(o, "set_id", op);
   x.user_id            = json_load_key<string>(o, "user_id", op);
   x.capture_session_id = json_load_key<string>(o, "capture_session_id", op);
   x.view_id            = json_load_key<string>(o, "view_id", op);
   x.pose_type = to_pose_type(json_load_key<string>(o, "pose_type", op));
   x.calibration_ratio = json_load_key<real>(o, "calibration_ratio", op);
   x.is_accurate       = json_load_key<bool>(o, "is_accurate", op);
   x.verified_by_user  = json_load_key<bool>(o, "verified_by_user", op);
   x.created_at        = json_load_key<Timestamp>(o, "created_at", op);
   x.updated_at        = json_load_key<Timestamp>(o, "updated_at", op);

   const auto f = get_key(o, "fields");
   if(!f.isObject())
      throw std::runtime_error(
          format("'fields' of set '{}' must be an object", x.set_id));
   for(const auto& name : f.getMemberNames()) x.fields[name].read(f[name]);

   *this = std::move(x);
}

string MeasurementSet::to_string() const noexcept
{
   std::stringstream ss{""};
   ss << format("MeasurementSet '{}', user '{}', session '{}', view '{}' "
                "({}), ratio = {}, accurate = {}, verified = {}",
                set_id,
                user_id,
                capture_session_id,
                view_id,
                str(pose_type),
                calibration_ratio,
                str(is_accurate),
                str(verified_by_user));
   for(const auto& [name, m] : fields)
      ss << format("\n   {:24s} {}", name, m.to_string());
   return ss.str();
}

// ------------------------------------------------------- validate against plan
//
void validate_against_plan(const MeasurementSet& set,
                           const MeasurementPlan& plan) noexcept(false)
{
   for(const auto& [name, m] : set.fields) {
      const auto e = plan.find(name);
      if(e == nullptr)
         throw std::runtime_error(
             format("set '{}': field '{}' is not in measurement plan '{}'",
                    set.set_id,
                    name,
                    plan.name));
      if(e->model != m.model)
         throw std::runtime_error(
             format("set '{}': field '{}' has model '{}', but plan '{}' "
                    "specifies '{}'",
                    set.set_id,
                    name,
                    str(m.model),
                    plan.name,
                    str(e->model)));
      if(!std::isfinite(m.value) or m.value <= 0.0)
         throw std::runtime_error(format("set '{}': field '{}' has value {}, "
                                         "which is not finite and positive",
                                         set.set_id,
                                         name,
                                         m.value));
      if(!inclusive_between(0.0, m.confidence, 1.0))
         throw std::runtime_error(format("set '{}': field '{}' has confidence "
                                         "{}, which is not in [0, 1]",
                                         set.set_id,
                                         name,
                                         m.confidence));
   }
}

// ---------------------------------------------------- ReconciledMeasurementSet
//
bool ReconciledMeasurementSet::operator==(
    const ReconciledMeasurementSet& o) const noexcept
{
   return set == o.set and provenance == o.provenance
          and conflicting_fields == o.conflicting_fields
          and source_set_ids == o.source_set_ids;
}

Json::Value ReconciledMeasurementSet::to_json() const noexcept
{
   auto o = set.to_json();

   auto p = Json::Value{Json::objectValue};
   for(const auto& [name, views] : provenance)
      p[name] = json_save(cbegin(views), cend(views));
   o["provenance"] = p;
   o["conflicting_fields"]
       = json_save(cbegin(conflicting_fields), cend(conflicting_fields));
   o["source_set_ids"] = json_save(cbegin(source_set_ids), cend(source_set_ids));
   return o;
}

void ReconciledMeasurementSet::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading reconciled measurement set"s;

   ReconciledMeasurementSet x;
   x.set.read(o);

   const auto p = get_key(o, "provenance");
   if(!p.isObject())
      throw std::runtime_error("'provenance' must be an object");
   for(const auto& name : p.getMemberNames())
      json_load(p[name], x.provenance[name]);

   x.conflicting_fields = json_load_key<vector<string>>(o, "conflicting_fields", op);
   x.source_set_ids     = json_load_key<vector<string>>(o, "source_set_ids", op);

   *this = std::move(x);
}

string ReconciledMeasurementSet::to_string() const noexcept
{
   std::stringstream ss{""};
   ss << set.to_string();
   for(const auto& [name, views] : provenance)
      ss << format("\n   {:24s} <- {}",
                   name,
                   implode(cbegin(views), cend(views), ", "));
   if(has_conflicts())
      ss << format("\n   conflicting: {}",
                   implode(cbegin(conflicting_fields),
                           cend(conflicting_fields),
                           ", "));
   return ss.str();
}

} // namespace anthro
