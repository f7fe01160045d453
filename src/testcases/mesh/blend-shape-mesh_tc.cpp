
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/io/json-io.hpp"
#include "anthro/mesh/blend-shape-mesh.hpp"

namespace anthro
{
// A single triangle, with one axis that moves it along 'x'.
static BlendShapeMesh make_triangle()
{
   BlendShapeMesh m;
   m.mesh_name = "triangle";
   m.vertices.resize(3, 3);
   m.vertices << 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0, 0.0;
   m.faces.resize(1, 3);
   m.faces << 0, 1, 2;
   BlendShapeMesh::VertexMatrix D(3, 3);
   D << 0.1, 0.0, 0.0, 0.1, 0.0, 0.0, 0.1, 0.0, 0.0;
   m.offsets["width"] = D;
   return m;
}

static MeshParameters make_params(real p)
{
   MeshParameters o;
   o.mesh_name       = "triangle";
   o.params["width"] = p;
   return o;
}

CATCH_TEST_CASE("BlendShapeMesh", "[blend-shape-mesh]")
{
   CATCH_SECTION("blend-shape-neutral-is-base")
   {
      const auto m = make_triangle();
      CATCH_REQUIRE_NOTHROW(m.validate());
      CATCH_REQUIRE(m.n_vertices() == 3);
      CATCH_REQUIRE(m.n_faces() == 1);
      CATCH_REQUIRE(deform(m, make_params(0.5)) == m.vertices);
      CATCH_REQUIRE(deform(m, MeshParameters{}) == m.vertices);
   }

   CATCH_SECTION("blend-shape-extremes")
   {
      const auto m  = make_triangle();
      const auto V1 = deform(m, make_params(1.0));
      const auto V0 = deform(m, make_params(0.0));
      CATCH_REQUIRE((V1 - m.vertices).isApprox(m.offsets.at("width")));
      CATCH_REQUIRE((m.vertices - V0).isApprox(m.offsets.at("width")));
      CATCH_REQUIRE(std::fabs(V1(1, 0) - 1.1) < 1e-12);
      CATCH_REQUIRE(std::fabs(V0(1, 0) - 0.9) < 1e-12);

      // Out-of-range parameters are clamped
      CATCH_REQUIRE(deform(m, make_params(7.0)) == V1);
   }

   CATCH_SECTION("blend-shape-unknown-axis")
   {
      auto p           = make_params(0.5);
      p.params["legs"] = 0.7;
      CATCH_REQUIRE_THROWS(deform(make_triangle(), p));
   }

   CATCH_SECTION("blend-shape-validate")
   {
      auto m        = make_triangle();
      m.faces(0, 2) = 3;
      CATCH_REQUIRE_THROWS(m.validate());

      m = make_triangle();
      m.offsets["width"].resize(2, 3);
      m.offsets["width"].setZero();
      CATCH_REQUIRE_THROWS(m.validate());

      m                 = make_triangle();
      m.vertices(0, 0) = dNAN;
      CATCH_REQUIRE_THROWS(m.validate());
   }

   CATCH_SECTION("blend-shape-json")
   {
      const auto m = make_triangle();
      BlendShapeMesh n;
      read(n, parse_json(m.to_json().toStyledString()));
      CATCH_REQUIRE(n == m);

      auto bad = m.to_json();
      bad["faces"][0][1] = 9;
      CATCH_REQUIRE_THROWS(read(n, bad));
   }

   CATCH_SECTION("blend-shape-load-reference")
   {
      BlendShapeMesh m;
      load(m, format("{}/reference-mesh.json", ANTHRO_TESTDATA_DIR));
      CATCH_REQUIRE(m.mesh_name == "neutral-adult");
      CATCH_REQUIRE(m.n_vertices() == 16);
      CATCH_REQUIRE(m.n_faces() == 28);
      CATCH_REQUIRE(m.offsets.size() == 7);
      CATCH_REQUIRE(m.offsets.count("waist") == 1);
      CATCH_REQUIRE_THROWS(load(m, "/no/such/mesh.json"));
   }
}

} // namespace anthro
