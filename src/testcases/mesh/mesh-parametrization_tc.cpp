
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/io/json-io.hpp"
#include "anthro/measure/aggregate-views.hpp"
#include "anthro/mesh/mesh-parametrization.hpp"

#include "testcases/testcase-helpers.hpp"

namespace anthro
{
static ReconciledMeasurementSet
accepted_record(const vector<std::pair<string, real>>& linear,
                const vector<std::pair<string, real>>& circumferences = {})
{
   vector<MeasurementSet> sets;
   sets.push_back(testing::make_view_set("u", "s", "lin", linear));
   if(!circumferences.empty())
      sets.push_back(testing::make_view_set(
          "u", "s", "circ", circumferences, MeasurementModel::CIRCUMFERENCE));
   auto r = aggregate_views(sets, AggregateParams{}, Timestamp(1600000000));
   r.set.verified_by_user = true;
   return r;
}

static ReferenceMeshMetadata one_axis(real lo, real hi)
{
   ReferenceMeshMetadata o;
   o.mesh_name = "test";
   o.axes.resize(1);
   o.axes[0].name         = "shoulders";
   o.axes[0].measurement  = "shoulder_width";
   o.axes[0].min_physical = lo;
   o.axes[0].max_physical = hi;
   return o;
}

CATCH_TEST_CASE("parametrize_mesh", "[mesh-parametrization]")
{
   const auto& meta = default_reference_mesh_metadata();

   CATCH_SECTION("mesh-param-linear-map")
   {
      const auto p = parametrize_mesh(accepted_record({{"shoulder_width", 45.0}}),
                                      one_axis(30.0, 55.0));
      CATCH_REQUIRE(p.mesh_name == "test");
      CATCH_REQUIRE(p.params.size() == 1);
      CATCH_REQUIRE(std::fabs(p.get("shoulders") - 0.6) < 1e-12);
      CATCH_REQUIRE(p.warnings.empty());
      CATCH_REQUIRE(std::isnan(p.get("arms")));
   }

   CATCH_SECTION("mesh-param-endpoints-are-supported")
   {
      const auto lo = parametrize_mesh(accepted_record({{"shoulder_width", 30.0}}),
                                       one_axis(30.0, 55.0));
      const auto hi = parametrize_mesh(accepted_record({{"shoulder_width", 55.0}}),
                                       one_axis(30.0, 55.0));
      CATCH_REQUIRE(lo.get("shoulders") == 0.0);
      CATCH_REQUIRE(hi.get("shoulders") == 1.0);
      CATCH_REQUIRE(lo.warnings.empty());
      CATCH_REQUIRE(hi.warnings.empty());
   }

   CATCH_SECTION("mesh-param-clamps-with-one-warning")
   {
      const auto p = parametrize_mesh(
          accepted_record({{"shoulder_width", 60.0}, {"arm_length", 40.0}}),
          meta);
      CATCH_REQUIRE(p.get("shoulders") == 1.0);
      CATCH_REQUIRE(p.get("arms") == 0.0);
      CATCH_REQUIRE(p.warnings.size() == 2);

      const auto& w = p.warnings[0];
      CATCH_REQUIRE(w.axis == "shoulders");
      CATCH_REQUIRE(w.measurement == "shoulder_width");
      CATCH_REQUIRE(w.value == 60.0);
      CATCH_REQUIRE(w.min_physical == 30.0);
      CATCH_REQUIRE(w.max_physical == 55.0);
      CATCH_REQUIRE(p.warnings[1].axis == "arms");

      for(const auto& [axis, v] : p.params) CATCH_REQUIRE(v >= 0.0);
      for(const auto& [axis, v] : p.params) CATCH_REQUIRE(v <= 1.0);
   }

   CATCH_SECTION("mesh-param-missing-is-neutral")
   {
      const auto p = parametrize_mesh(
          accepted_record({{"leg_length", 85.0}}, {{"waist_circumference", 92.5}}),
          meta);
      CATCH_REQUIRE(p.params.size() == meta.axes.size());
      CATCH_REQUIRE(std::fabs(p.get("legs") - 0.5) < 1e-12);
      CATCH_REQUIRE(std::fabs(p.get("waist") - 0.5) < 1e-12);
      CATCH_REQUIRE(p.get("shoulders") == MeshParameters::k_neutral);
      CATCH_REQUIRE(p.get("chest") == MeshParameters::k_neutral);
      CATCH_REQUIRE(p.warnings.empty());
   }

   CATCH_SECTION("mesh-param-unmapped-measurements-ignored")
   {
      const auto p = parametrize_mesh(
          accepted_record({{"hip_width", 300.0}, {"shoulder_width", 45.0}}),
          one_axis(30.0, 55.0));
      CATCH_REQUIRE(p.params.size() == 1);
      CATCH_REQUIRE(p.warnings.empty());
   }

   CATCH_SECTION("mesh-param-requires-acceptance")
   {
      auto r             = accepted_record({{"shoulder_width", 45.0}});
      r.set.verified_by_user = false;
      CATCH_REQUIRE_THROWS(parametrize_mesh(r, meta));
   }

   CATCH_SECTION("mesh-param-bad-metadata")
   {
      const auto r = accepted_record({{"shoulder_width", 45.0}});
      CATCH_REQUIRE_THROWS(parametrize_mesh(r, one_axis(55.0, 55.0)));
      CATCH_REQUIRE_THROWS(parametrize_mesh(r, one_axis(55.0, 30.0)));

      auto dup = one_axis(30.0, 55.0);
      dup.axes.push_back(dup.axes[0]);
      CATCH_REQUIRE_THROWS(parametrize_mesh(r, dup));
   }

   CATCH_SECTION("mesh-param-json")
   {
      const auto p = parametrize_mesh(
          accepted_record({{"shoulder_width", 60.0}}), meta);
      MeshParameters q;
      q.read(parse_json(p.to_json().toStyledString()));
      CATCH_REQUIRE(p == q);

      auto bad = p.to_json();
      bad["params"]["shoulders"] = 1.5;
      CATCH_REQUIRE_THROWS(q.read(bad));
   }

   CATCH_SECTION("mesh-metadata-load")
   {
      ReferenceMeshMetadata m;
      load(m, format("{}/mesh-metadata.json", ANTHRO_TESTDATA_DIR));
      CATCH_REQUIRE(m == meta);
      CATCH_REQUIRE(m.find_axis("waist") != nullptr);
      CATCH_REQUIRE(m.find_axis("neck") == nullptr);
      CATCH_REQUIRE_THROWS(load(m, "/no/such/mesh-metadata.json"));
   }
}

} // namespace anthro
