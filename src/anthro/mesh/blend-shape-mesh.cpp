
#include "stdinc.hpp"

#include "blend-shape-mesh.hpp"

#include "anthro/io/json-io.hpp"
#include "anthro/utils/file-system.hpp"

namespace anthro
{
// ---------------------------------------------------------------- matrix <-> json
//
template<typename M>
static Json::Value rows_to_json(const M& m) noexcept
{
   auto o = Json::Value{Json::arrayValue};
   for(auto r = 0; r < m.rows(); ++r) {
      auto row = Json::Value{Json::arrayValue};
      for(auto c = 0; c < m.cols(); ++c) row.append(json_save(m(r, c)));
      o.append(row);
   }
   return o;
}

template<typename M>
static M rows_from_json(const Json::Value& node, const string_view what)
{
   if(!node.isArray())
      throw std::runtime_error(format("'{}' must be an array of rows", what));
   M m(node.size(), 3);
   for(auto r = 0u; r < node.size(); ++r) {
      const auto& row = node[r];
      if(!row.isArray() or row.size() != 3)
         throw std::runtime_error(
             format("'{}' row {} must have 3 elements", what, r));
      for(auto c = 0u; c < 3; ++c) {
         typename M::Scalar x;
         json_load(row[c], x);
         m(r, c) = x;
      }
   }
   return m;
}

// -------------------------------------------------------------------- validate
//
void BlendShapeMesh::validate() const noexcept(false)
{
   const auto N = vertices.rows();

   if(!vertices.allFinite())
      throw std::runtime_error(
          format("mesh '{}' has non-finite vertices", mesh_name));

   for(auto r = 0; r < faces.rows(); ++r)
      for(auto c = 0; c < 3; ++c)
         if(faces(r, c) < 0 or faces(r, c) >= N)
            throw std::runtime_error(
                format("mesh '{}': face {} refers to vertex {}, but there are "
                       "only {} vertices",
                       mesh_name,
                       r,
                       faces(r, c),
                       N));

   for(const auto& [axis, D] : offsets) {
      if(D.rows() != N)
         throw std::runtime_error(
             format("mesh '{}': axis '{}' has {} offsets for {} vertices",
                    mesh_name,
                    axis,
                    D.rows(),
                    N));
      if(!D.allFinite())
         throw std::runtime_error(format(
             "mesh '{}': axis '{}' has non-finite offsets", mesh_name, axis));
   }
}

// ------------------------------------------------------------------ operator==
//
bool BlendShapeMesh::operator==(const BlendShapeMesh& o) const noexcept
{
   auto same = [](const auto& A, const auto& B) {
      return A.rows() == B.rows() and A.cols() == B.cols() and A == B;
   };

   if(mesh_name != o.mesh_name or !same(vertices, o.vertices)
      or !same(faces, o.faces) or offsets.size() != o.offsets.size())
      return false;

   for(const auto& [axis, D] : offsets) {
      auto ii = o.offsets.find(axis);
      if(ii == cend(o.offsets) or !same(D, ii->second)) return false;
   }
   return true;
}

// ---------------------------------------------------------------------- to-json
//
Json::Value BlendShapeMesh::to_json() const noexcept
{
   auto o         = Json::Value{Json::objectValue};
   o["mesh_name"] = mesh_name;
   o["vertices"]  = rows_to_json(vertices);
   o["faces"]     = rows_to_json(faces);
   auto x         = Json::Value{Json::objectValue};
   for(const auto& [axis, D] : offsets) x[axis] = rows_to_json(D);
   o["offsets"] = x;
   return o;
}

string BlendShapeMesh::to_string() const noexcept
{
   vector<string> axes;
   axes.reserve(offsets.size());
   for(const auto& ii : offsets) axes.push_back(ii.first);
   return format("BlendShapeMesh '{}': {} vertices, {} faces, axes = [{}]",
                 mesh_name,
                 n_vertices(),
                 n_faces(),
                 implode(cbegin(axes), cend(axes), ", "));
}

// ------------------------------------------------------------------- read/load
//
void read(BlendShapeMesh& data, const Json::Value& node) noexcept(false)
{
   const string op = "reading blend-shape mesh"s;

   BlendShapeMesh x;
   x.mesh_name = json_load_key<string>(node, "mesh_name", op);
   x.vertices  = rows_from_json<BlendShapeMesh::VertexMatrix>(
       get_key(node, "vertices"), "vertices");
   x.faces = rows_from_json<BlendShapeMesh::FaceMatrix>(get_key(node, "faces"),
                                                        "faces");

   if(has_key(node, "offsets")) {
      const auto o = get_key(node, "offsets");
      if(!o.isObject())
         throw std::runtime_error("'offsets' must be an object");
      for(const auto& axis : o.getMemberNames())
         x.offsets[axis] = rows_from_json<BlendShapeMesh::VertexMatrix>(
             o[axis], format("offsets.{}", axis));
   }

   x.validate();
   data = std::move(x);
}

void load(BlendShapeMesh& data, const string& fname) noexcept(false)
{
   try {
      read(data, parse_json(file_get_contents(fname)));
   } catch(std::exception& e) {
      throw std::runtime_error(
          format("failed to load blend-shape mesh '{}': {}", fname, e.what()));
   }
}

// ---------------------------------------------------------------------- deform
//
BlendShapeMesh::VertexMatrix
deform(const BlendShapeMesh& mesh, const MeshParameters& params) noexcept(false)
{
   BlendShapeMesh::VertexMatrix V = mesh.vertices;

   for(const auto& [axis, p] : params.params) {
      auto ii = mesh.offsets.find(axis);
      if(ii == cend(mesh.offsets))
         throw std::runtime_error(
             format("mesh '{}' has no blend-shape for axis '{}'",
                    mesh.mesh_name,
                    axis));
      if(ii->second.rows() != V.rows())
         throw std::runtime_error(
             format("mesh '{}': axis '{}' has {} offsets for {} vertices",
                    mesh.mesh_name,
                    axis,
                    ii->second.rows(),
                    V.rows()));
      const real w = 2.0 * (std::clamp(p, 0.0, 1.0) - MeshParameters::k_neutral);
      if(w != 0.0) V += w * ii->second;
   }

   return V;
}

} // namespace anthro
