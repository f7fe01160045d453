
#pragma once

#include <Eigen/Core>

#include "mesh-parametrization.hpp"

namespace anthro
{
// ------------------------------------------------------------- BlendShapeMesh
//
// A reference body mesh, with one vertex-offset matrix per deformation axis.
// An axis at parameter 'p' moves each vertex by '2 (p - 0.5) * offset', so
// 0.5 is the base shape, and 0 and 1 are the extremes.
//
struct BlendShapeMesh
{
   using VertexMatrix = Eigen::Matrix<real, Eigen::Dynamic, 3, Eigen::RowMajor>;
   using FaceMatrix   = Eigen::Matrix<int, Eigen::Dynamic, 3, Eigen::RowMajor>;

   string mesh_name                         = ""s;
   VertexMatrix vertices                    = {}; // N x 3
   FaceMatrix faces                         = {}; // M x 3, indices into N
   std::map<string, VertexMatrix> offsets   = {}; // axis -> N x 3

   size_t n_vertices() const noexcept { return size_t(vertices.rows()); }
   size_t n_faces() const noexcept { return size_t(faces.rows()); }

   // Throws if an offset matrix is not N x 3, or a face index is out of range.
   void validate() const noexcept(false);

   bool operator==(const BlendShapeMesh& o) const noexcept;
   bool operator!=(const BlendShapeMesh& o) const noexcept
   {
      return !(*this == o);
   }

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;
   friend string str(const BlendShapeMesh& o) noexcept { return o.to_string(); }
};

void read(BlendShapeMesh& data, const Json::Value& node) noexcept(false);
void load(BlendShapeMesh& data, const string& fname) noexcept(false);

// base + sum_axis 2 (p_axis - 0.5) * offsets_axis. Axes missing from 'params'
// are neutral. Throws if 'params' names an axis the mesh has no offsets for.
BlendShapeMesh::VertexMatrix
deform(const BlendShapeMesh& mesh, const MeshParameters& params) noexcept(false);

} // namespace anthro
