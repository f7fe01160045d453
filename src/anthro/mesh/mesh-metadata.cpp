
#include "stdinc.hpp"

#include "mesh-metadata.hpp"

#include "anthro/io/json-io.hpp"
#include "anthro/utils/file-system.hpp"

namespace anthro
{
// -------------------------------------------------------------------- MeshAxis
//
bool MeshAxis::operator==(const MeshAxis& o) const noexcept
{
   return name == o.name and measurement == o.measurement
          and min_physical == o.min_physical
          and max_physical == o.max_physical;
}

Json::Value MeshAxis::to_json() const noexcept
{
   auto o            = Json::Value{Json::objectValue};
   o["name"]         = name;
   o["measurement"]  = measurement;
   o["min_physical"] = json_save(min_physical);
   o["max_physical"] = json_save(max_physical);
   return o;
}

void MeshAxis::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading mesh axis"s;
   MeshAxis x;
   x.name         = json_load_key<string>(o, "name", op);
   x.measurement  = json_load_key<string>(o, "measurement", op);
   x.min_physical = json_load_key<real>(o, "min_physical", op);
   x.max_physical = json_load_key<real>(o, "max_physical", op);
   *this          = std::move(x);
}

string MeshAxis::to_string() const noexcept
{
   return format(
       "{} <- {} [{}, {}]", name, measurement, min_physical, max_physical);
}

// ------------------------------------------------------- ReferenceMeshMetadata
//
const MeshAxis*
ReferenceMeshMetadata::find_axis(const string_view name) const noexcept
{
   auto ii = std::find_if(
       cbegin(axes), cend(axes), [&](const auto& a) { return a.name == name; });
   return (ii == cend(axes)) ? nullptr : &*ii;
}

bool ReferenceMeshMetadata::operator==(const ReferenceMeshMetadata& o) const
    noexcept
{
   return mesh_name == o.mesh_name and axes == o.axes;
}

void ReferenceMeshMetadata::validate() const noexcept(false)
{
   hashset<string> names;
   for(const auto& a : axes) {
      if(a.name.empty() or a.measurement.empty())
         throw std::runtime_error(
             format("mesh '{}': axis '{}' needs a name and a measurement",
                    mesh_name,
                    a.name));
      if(!names.insert(a.name).second)
         throw std::runtime_error(
             format("mesh '{}': duplicate axis '{}'", mesh_name, a.name));
      if(!std::isfinite(a.min_physical) or !std::isfinite(a.max_physical)
         or a.max_physical <= a.min_physical)
         throw std::runtime_error(
             format("mesh '{}': axis '{}' has range [{}, {}], but requires "
                    "finite min < max",
                    mesh_name,
                    a.name,
                    a.min_physical,
                    a.max_physical));
   }
}

Json::Value ReferenceMeshMetadata::to_json() const noexcept
{
   auto o         = Json::Value{Json::objectValue};
   o["mesh_name"] = mesh_name;
   auto x         = Json::Value{Json::arrayValue};
   for(const auto& a : axes) x.append(a.to_json());
   o["axes"] = x;
   return o;
}

string ReferenceMeshMetadata::to_string() const noexcept
{
   return format("ReferenceMeshMetadata '{}':\n   {}",
                 mesh_name,
                 implode(cbegin(axes),
                         cend(axes),
                         "\n   ",
                         [](const auto& a) { return a.to_string(); }));
}

// ------------------------------------------------------------------- read/load
//
void read(ReferenceMeshMetadata& data, const Json::Value& node) noexcept(false)
{
   const string op = "reading reference mesh metadata"s;

   ReferenceMeshMetadata x;
   x.mesh_name    = json_load_key<string>(node, "mesh_name", op);
   const auto arr = get_key(node, "axes");
   if(!arr.isArray())
      throw std::runtime_error(
          format("'axes' of mesh '{}' must be an array", x.mesh_name));
   x.axes.resize(arr.size());
   for(auto i = 0u; i < arr.size(); ++i) x.axes[i].read(arr[i]);

   x.validate();
   data = std::move(x);
}

void load(ReferenceMeshMetadata& data, const string& fname) noexcept(false)
{
   try {
      read(data, parse_json(file_get_contents(fname)));
   } catch(std::exception& e) {
      throw std::runtime_error(format(
          "failed to load reference mesh metadata '{}': {}", fname, e.what()));
   }
}

// ---------------------------------------------- default reference mesh metadata
//
static ReferenceMeshMetadata make_default_metadata()
{
   auto axis = [](string name, string measurement, real lo, real hi) {
      MeshAxis a;
      a.name         = std::move(name);
      a.measurement  = std::move(measurement);
      a.min_physical = lo;
      a.max_physical = hi;
      return a;
   };

   ReferenceMeshMetadata o;
   o.mesh_name = "neutral-adult"s;
   o.axes      = {axis("shoulders", "shoulder_width", 30.0, 55.0),
             axis("arms", "arm_length", 45.0, 75.0),
             axis("legs", "leg_length", 65.0, 105.0),
             axis("torso", "torso_length", 40.0, 65.0),
             axis("chest", "chest_circumference", 70.0, 130.0),
             axis("waist", "waist_circumference", 55.0, 130.0),
             axis("hips", "hip_circumference", 75.0, 135.0)};
   return o;
}

const ReferenceMeshMetadata& default_reference_mesh_metadata() noexcept
{
   static const ReferenceMeshMetadata o = make_default_metadata();
   return o;
}

} // namespace anthro
