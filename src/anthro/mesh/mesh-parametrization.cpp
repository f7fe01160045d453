
#include "stdinc.hpp"

#include "mesh-parametrization.hpp"

#include "anthro/io/json-io.hpp"
#include "anthro/measure/error-kind.hpp"

namespace anthro
{
// --------------------------------------------------------- OutOfSupportedRange
//
bool OutOfSupportedRange::operator==(const OutOfSupportedRange& o) const
    noexcept
{
   auto same = [](real a, real b) {
      return (std::isnan(a) and std::isnan(b)) or a == b;
   };
   return axis == o.axis and measurement == o.measurement
          and same(value, o.value) and same(min_physical, o.min_physical)
          and same(max_physical, o.max_physical);
}

Json::Value OutOfSupportedRange::to_json() const noexcept
{
   auto o            = Json::Value{Json::objectValue};
   o["kind"]         = str(ErrorKind::OUT_OF_SUPPORTED_RANGE);
   o["axis"]         = axis;
   o["measurement"]  = measurement;
   o["value"]        = json_save(value);
   o["min_physical"] = json_save(min_physical);
   o["max_physical"] = json_save(max_physical);
   return o;
}

void OutOfSupportedRange::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading out-of-supported-range warning"s;
   OutOfSupportedRange x;
   x.axis         = json_load_key<string>(o, "axis", op);
   x.measurement  = json_load_key<string>(o, "measurement", op);
   x.value        = json_load_key<real>(o, "value", op);
   x.min_physical = json_load_key<real>(o, "min_physical", op);
   x.max_physical = json_load_key<real>(o, "max_physical", op);
   *this          = std::move(x);
}

string OutOfSupportedRange::to_string() const noexcept
{
   return format("{}: axis '{}', {} = {} outside [{}, {}]",
                 str(ErrorKind::OUT_OF_SUPPORTED_RANGE),
                 axis,
                 measurement,
                 value,
                 min_physical,
                 max_physical);
}

// -------------------------------------------------------------- MeshParameters
//
real MeshParameters::get(const string_view axis) const noexcept
{
   auto ii = params.find(axis);
   return (ii == cend(params)) ? dNAN : ii->second;
}

bool MeshParameters::operator==(const MeshParameters& o) const noexcept
{
   return mesh_name == o.mesh_name and params == o.params
          and warnings == o.warnings;
}

Json::Value MeshParameters::to_json() const noexcept
{
   auto o         = Json::Value{Json::objectValue};
   o["mesh_name"] = mesh_name;

   auto p = Json::Value{Json::objectValue};
   for(const auto& [axis, value] : params) p[axis] = json_save(value);
   o["params"] = p;

   auto w = Json::Value{Json::arrayValue};
   for(const auto& x : warnings) w.append(x.to_json());
   o["warnings"] = w;
   return o;
}

void MeshParameters::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading mesh parameters"s;

   MeshParameters x;
   x.mesh_name = json_load_key<string>(o, "mesh_name", op);

   const auto p = get_key(o, "params");
   if(!p.isObject())
      throw std::runtime_error("mesh parameters: 'params' must be an object");
   for(const auto& axis : p.getMemberNames()) {
      real value = dNAN;
      json_load(p[axis], value);
      if(!inclusive_between(0.0, value, 1.0))
         throw std::runtime_error(format(
             "mesh parameters: axis '{}' = {} is outside [0, 1]", axis, value));
      x.params[axis] = value;
   }

   if(has_key(o, "warnings")) {
      const auto w = get_key(o, "warnings");
      if(!w.isArray())
         throw std::runtime_error(
             "mesh parameters: 'warnings' must be an array");
      x.warnings.resize(w.size());
      for(auto i = 0u; i < w.size(); ++i) x.warnings[i].read(w[i]);
   }

   *this = std::move(x);
}

string MeshParameters::to_string() const noexcept
{
   std::stringstream ss{""};
   ss << format("MeshParameters '{}'", mesh_name) << endl;
   for(const auto& [axis, value] : params)
      ss << format("   {:16s} {:6.4f}", axis, value) << endl;
   for(const auto& w : warnings) ss << "   WARNING " << w.to_string() << endl;
   return ss.str();
}

// ------------------------------------------------------------ parametrize-mesh
//
MeshParameters
parametrize_mesh(const ReconciledMeasurementSet& reconciled,
                 const ReferenceMeshMetadata& metadata) noexcept(false)
{
   if(!reconciled.set.verified_by_user)
      throw std::runtime_error(
          format("cannot parametrize mesh '{}' from set '{}': the set has not "
                 "been accepted by the user",
                 metadata.mesh_name,
                 reconciled.set.set_id));

   metadata.validate();

   MeshParameters out;
   out.mesh_name = metadata.mesh_name;

   for(const auto& axis : metadata.axes) {
      const Measurement* m = reconciled.set.find(axis.measurement);
      if(m == nullptr or !std::isfinite(m->value)) {
         out.params[axis.name] = MeshParameters::k_neutral;
         continue;
      }

      const real v = m->value;
      if(!inclusive_between(axis.min_physical, v, axis.max_physical)) {
         OutOfSupportedRange w;
         w.axis         = axis.name;
         w.measurement  = axis.measurement;
         w.value        = v;
         w.min_physical = axis.min_physical;
         w.max_physical = axis.max_physical;
         WARN(w.to_string());
         out.warnings.push_back(std::move(w));
      }

      const real t = (v - axis.min_physical)
                     / (axis.max_physical - axis.min_physical);
      out.params[axis.name] = std::clamp(t, 0.0, 1.0);
   }

   return out;
}

} // namespace anthro
