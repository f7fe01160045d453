
#pragma once

#include "mesh-metadata.hpp"

#include "anthro/measure/measurement-set.hpp"

namespace anthro
{
// --------------------------------------------------------- OutOfSupportedRange
//
// A measured value outside the axis' supported range. The parameter is still
// clamped and used.
//
struct OutOfSupportedRange
{
   string axis         = ""s;
   string measurement  = ""s;
   real value          = dNAN;
   real min_physical   = dNAN;
   real max_physical   = dNAN;

   bool operator==(const OutOfSupportedRange& o) const noexcept;
   bool operator!=(const OutOfSupportedRange& o) const noexcept
   {
      return !(*this == o);
   }

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);
   string to_string() const noexcept;
};

// -------------------------------------------------------------- MeshParameters
//
struct MeshParameters
{
   static constexpr real k_neutral = 0.5;

   string mesh_name                                 = ""s;
   std::map<string, real, std::less<>> params       = {}; // axis -> [0, 1]
   vector<OutOfSupportedRange> warnings             = {}; // at most one per axis

   // NAN if there's no such axis
   real get(const string_view axis) const noexcept;

   bool operator==(const MeshParameters& o) const noexcept;
   bool operator!=(const MeshParameters& o) const noexcept
   {
      return !(*this == o);
   }

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);

   string to_string() const noexcept;
   friend string str(const MeshParameters& o) noexcept { return o.to_string(); }
};

// One parameter per axis in 'metadata':
//    clamp((value - min_physical) / (max_physical - min_physical), 0, 1)
// Axes without a measurement are neutral (0.5). Measurements without an axis
// are ignored. Throws unless the record is 'verified_by_user', or if
// 'metadata' is invalid.
MeshParameters
parametrize_mesh(const ReconciledMeasurementSet& reconciled,
                 const ReferenceMeshMetadata& metadata) noexcept(false);

} // namespace anthro
