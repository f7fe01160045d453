
#pragma once

#include "anthro/foundation.hpp"
#include "json/json.h"

namespace anthro
{
// -------------------------------------------------------------------- MeshAxis
//
// One deformation axis of a reference mesh, driven by one measurement over
// the physical range the mesh supports.
//
struct MeshAxis
{
   string name         = ""s;
   string measurement  = ""s;
   real min_physical   = 0.0; // cm, maps to 0
   real max_physical   = 0.0; // cm, maps to 1

   bool operator==(const MeshAxis& o) const noexcept;
   bool operator!=(const MeshAxis& o) const noexcept { return !(*this == o); }

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);
   string to_string() const noexcept;
};

// ------------------------------------------------------- ReferenceMeshMetadata
//
struct ReferenceMeshMetadata
{
   string mesh_name      = ""s;
   vector<MeshAxis> axes = {};

   // nullptr if there's no such axis
   const MeshAxis* find_axis(const string_view name) const noexcept;

   bool operator==(const ReferenceMeshMetadata& o) const noexcept;
   bool operator!=(const ReferenceMeshMetadata& o) const noexcept
   {
      return !(*this == o);
   }

   // Throws on a duplicate axis, an empty name, or 'max_physical <= min'.
   void validate() const noexcept(false);

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;
   friend string str(const ReferenceMeshMetadata& o) noexcept
   {
      return o.to_string();
   }
};

void read(ReferenceMeshMetadata& data, const Json::Value& node) noexcept(false);
void load(ReferenceMeshMetadata& data, const string& fname) noexcept(false);

// Axes over the default measurement plan, spanning adult ranges.
const ReferenceMeshMetadata& default_reference_mesh_metadata() noexcept;

} // namespace anthro
