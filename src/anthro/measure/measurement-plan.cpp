
#include "stdinc.hpp"

#include "measurement-plan.hpp"

#include "anthro/io/json-io.hpp"
#include "anthro/utils/file-system.hpp"

namespace anthro
{
// ----------------------------------------------------------- measurement model
//
const char* str(const MeasurementModel x) noexcept
{
   switch(x) {
   case MeasurementModel::LINEAR: return "linear";
   case MeasurementModel::PATH: return "path";
   case MeasurementModel::CIRCUMFERENCE: return "circumference";
   }
   return "<unknown>";
}

MeasurementModel to_measurement_model(const string_view val) noexcept(false)
{
#define E(x, s) \
   if(val == s) return MeasurementModel::x;
   E(LINEAR, "linear");
   E(PATH, "path");
   E(CIRCUMFERENCE, "circumference");
#undef E
   throw std::runtime_error(
       format("could not convert '{}' to a measurement model", val));
}

// ------------------------------------------------------------------ applies-to
//
bool MeasurementPlanEntry::applies_to(PoseType view) const noexcept
{
   return std::find(cbegin(views), cend(views), view) != cend(views);
}

bool MeasurementPlanEntry::operator==(const MeasurementPlanEntry& o) const
    noexcept
{
   return name == o.name and model == o.model and joints == o.joints
          and depth_joints == o.depth_joints and views == o.views
          and width_scale == o.width_scale and depth_scale == o.depth_scale;
}

// -------------------------------------------------------------------- validate
//
void MeasurementPlanEntry::validate() const noexcept(false)
{
   auto fail = [&](const string& msg) {
      throw std::runtime_error(
          format("measurement plan entry '{}': {}", name, msg));
   };

   if(name.empty()) fail("empty name");
   if(views.empty()) fail("no views");
   if(applies_to(PoseType::COMBINED))
      fail("'combined' is derived, and cannot be a capture view");
   for(const auto& j : joints)
      if(j.empty()) fail("empty joint name");

   switch(model) {
   case MeasurementModel::LINEAR:
      if(joints.size() != 2)
         fail(format("a linear measurement needs 2 joints, got {}",
                     joints.size()));
      break;
   case MeasurementModel::PATH:
      if(joints.size() < 2)
         fail(format("a path measurement needs at least 2 joints, got {}",
                     joints.size()));
      break;
   case MeasurementModel::CIRCUMFERENCE:
      if(joints.size() != 2)
         fail(format("a circumference needs a width pair, got {} joints",
                     joints.size()));
      if(depth_joints.size() != 2)
         fail(format("a circumference needs a depth pair, got {} joints",
                     depth_joints.size()));
      if(!applies_to(PoseType::FRONT))
         fail("a circumference must be measured from the front view");
      break;
   }

   if(model != MeasurementModel::CIRCUMFERENCE and !depth_joints.empty())
      fail(format("'depth_joints' only applies to circumferences"));

   if(!std::isfinite(width_scale) or width_scale <= 0.0)
      fail(format("width-scale must be positive, got {}", width_scale));
   if(!std::isfinite(depth_scale) or depth_scale <= 0.0)
      fail(format("depth-scale must be positive, got {}", depth_scale));
}

// --------------------------------------------------------------------- to-json
//
Json::Value MeasurementPlanEntry::to_json() const noexcept
{
   auto views_str = [&]() {
      Json::Value x{Json::arrayValue};
      for(const auto v : views) x.append(str(v));
      return x;
   };

   auto o      = Json::Value{Json::objectValue};
   o["name"]   = name;
   o["model"]  = str(model);
   o["joints"] = json_save(cbegin(joints), cend(joints));
   if(model == MeasurementModel::CIRCUMFERENCE) {
      o["depth_joints"] = json_save(cbegin(depth_joints), cend(depth_joints));
      o["width_scale"]  = json_save(width_scale);
      o["depth_scale"]  = json_save(depth_scale);
   }
   o["views"] = views_str();
   return o;
}

// ------------------------------------------------------------------------ read
//
void MeasurementPlanEntry::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading measurement plan entry"s;

   MeasurementPlanEntry x;
   x.name   = json_load_key<string>(o, "name", op);
   x.model  = to_measurement_model(json_load_key<string>(o, "model", op));
   x.joints = json_load_key<vector<string>>(o, "joints", op);
   if(has_key(o, "depth_joints"))
      x.depth_joints = json_load_key<vector<string>>(o, "depth_joints", op);
   if(has_key(o, "width_scale"))
      x.width_scale = json_load_key<real>(o, "width_scale", op);
   if(has_key(o, "depth_scale"))
      x.depth_scale = json_load_key<real>(o, "depth_scale", op);

   if(has_key(o, "views")) {
      const auto views = json_load_key<vector<string>>(o, "views", op);
      x.views.clear();
      for(const auto& v : views) x.views.push_back(to_pose_type(v));
   }

   x.validate();
   *this = std::move(x);
}

string MeasurementPlanEntry::to_string() const noexcept
{
   return format("{} ({}: {})",
                 name,
                 str(model),
                 implode(cbegin(joints), cend(joints), ", "));
}

// ------------------------------------------------------- MeasurementPlan::find
//
const MeasurementPlanEntry*
MeasurementPlan::find(const string_view name) const noexcept
{
   auto ii = std::find_if(cbegin(entries), cend(entries), [&](const auto& e) {
      return e.name == name;
   });
   return (ii == cend(entries)) ? nullptr : &*ii;
}

// ---------------------------------------------------------------- requirements
//
vector<string> MeasurementPlan::required_joints(PoseType view) const noexcept
{
   vector<string> out;
   for(const auto& e : entries) {
      if(!e.applies_to(view)) continue;
      if(e.model == MeasurementModel::CIRCUMFERENCE and view == PoseType::SIDE)
         out.insert(end(out), cbegin(e.depth_joints), cend(e.depth_joints));
      else
         out.insert(end(out), cbegin(e.joints), cend(e.joints));
   }
   std::sort(begin(out), end(out));
   out.erase(std::unique(begin(out), end(out)), end(out));
   return out;
}

bool MeasurementPlan::operator==(const MeasurementPlan& o) const noexcept
{
   return name == o.name and entries == o.entries;
}

// --------------------------------------------------- MeasurementPlan::validate
//
void MeasurementPlan::validate() const noexcept(false)
{
   if(entries.empty())
      throw std::runtime_error(format("measurement plan '{}' is empty", name));

   hashset<string> names;
   for(const auto& e : entries) {
      e.validate();
      if(!names.insert(e.name).second)
         throw std::runtime_error(format(
             "measurement plan '{}' has duplicate entry '{}'", name, e.name));
   }
}

Json::Value MeasurementPlan::to_json() const noexcept
{
   auto o    = Json::Value{Json::objectValue};
   o["name"] = name;
   auto x    = Json::Value{Json::arrayValue};
   for(const auto& e : entries) x.append(e.to_json());
   o["entries"] = x;
   return o;
}

string MeasurementPlan::to_string() const noexcept
{
   return format("MeasurementPlan '{}':\n   {}",
                 name,
                 implode(cbegin(entries), cend(entries), "\n   "));
}

// ------------------------------------------------------------------- read/load
//
void read(MeasurementPlan& plan, const Json::Value& node) noexcept(false)
{
   const string op = "reading measurement plan"s;

   MeasurementPlan x;
   x.name = json_load_key<string>(node, "name", op);

   const auto arr = get_key(node, "entries");
   if(!arr.isArray())
      throw std::runtime_error(
          format("'entries' of measurement plan '{}' must be an array", x.name));

   x.entries.resize(arr.size());
   for(auto i = 0u; i < arr.size(); ++i) x.entries[i].read(arr[i]);

   x.validate();
   plan = std::move(x);
}

void load(MeasurementPlan& plan, const string& fname) noexcept(false)
{
   try {
      read(plan, parse_json(file_get_contents(fname)));
   } catch(std::exception& e) {
      throw std::runtime_error(format(
          "failed to load measurement plan '{}': {}", fname, e.what()));
   }
}

// ---------------------------------------------------- default measurement plan
//
static MeasurementPlan make_default_plan()
{
   using M         = MeasurementModel;
   const auto F    = PoseType::FRONT;
   const auto S    = PoseType::SIDE;

   auto linear = [](string name, string a, string b, vector<PoseType> views) {
      MeasurementPlanEntry e;
      e.name   = std::move(name);
      e.model  = M::LINEAR;
      e.joints = {std::move(a), std::move(b)};
      e.views  = std::move(views);
      return e;
   };

   auto path = [](string name, vector<string> joints, vector<PoseType> views) {
      MeasurementPlanEntry e;
      e.name   = std::move(name);
      e.model  = M::PATH;
      e.joints = std::move(joints);
      e.views  = std::move(views);
      return e;
   };

   auto circumference = [&](string name,
                            vector<string> width,
                            real width_scale,
                            vector<string> depth,
                            real depth_scale) {
      MeasurementPlanEntry e;
      e.name         = std::move(name);
      e.model        = M::CIRCUMFERENCE;
      e.joints       = std::move(width);
      e.depth_joints = std::move(depth);
      e.width_scale  = width_scale;
      e.depth_scale  = depth_scale;
      e.views        = {F, S};
      return e;
   };

   // The side-view depth landmarks (chest_front, ...) come from a contour
   // landmark detector that runs alongside BODY_25.
   MeasurementPlan plan;
   plan.name    = "default"s;
   plan.entries = {
       linear("shoulder_width", "l_shoulder", "r_shoulder", {F}),
       linear("hip_width", "l_hip", "r_hip", {F}),
       linear("torso_length", "neck", "mid_hip", {F, S}),
       path("arm_length", {"r_shoulder", "r_elbow", "r_wrist"}, {F, S}),
       path("leg_length", {"r_hip", "r_knee", "r_ankle"}, {F, S}),
       circumference("chest_circumference",
                     {"l_shoulder", "r_shoulder"},
                     0.85,
                     {"chest_front", "chest_back"},
                     1.0),
       circumference("waist_circumference",
                     {"l_hip", "r_hip"},
                     1.20,
                     {"waist_front", "waist_back"},
                     1.0),
       circumference("hip_circumference",
                     {"l_hip", "r_hip"},
                     1.45,
                     {"hip_front", "hip_back"},
                     1.0)};
   return plan;
}

const MeasurementPlan& default_measurement_plan() noexcept
{
   static const MeasurementPlan plan = make_default_plan();
   return plan;
}

} // namespace anthro
