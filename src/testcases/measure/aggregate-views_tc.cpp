
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/measure/aggregate-views.hpp"

#include "testcases/testcase-helpers.hpp"

namespace anthro
{
using testing::make_view_set;

CATCH_TEST_CASE("AggregateViews", "[aggregate-views]")
{
   const AggregateParams params;
   const Timestamp now(1600000100);
   const auto C = MeasurementModel::CIRCUMFERENCE;

   CATCH_SECTION("aggregate-conflict")
   {
      const auto a = make_view_set("u", "s", "v1", {{"waist_circumference", 80.0}}, C);
      const auto b = make_view_set("u", "s", "v2", {{"waist_circumference", 95.0}}, C);
      const auto r = aggregate_views({a, b}, params, now);

      CATCH_REQUIRE(r.set.pose_type == PoseType::COMBINED);
      CATCH_REQUIRE(r.has_conflicts());
      CATCH_REQUIRE(r.conflicting_fields == vector<string>{"waist_circumference"});
      CATCH_REQUIRE(r.set.find("waist_circumference")->conflicting);
      CATCH_REQUIRE(!r.set.is_accurate);
      CATCH_REQUIRE(std::fabs(r.set.find("waist_circumference")->value - 87.5)
                    < 1e-9);
   }

   CATCH_SECTION("aggregate-within-tolerance")
   {
      const auto a = make_view_set("u", "s", "v1", {{"waist_circumference", 80.0}}, C);
      const auto b = make_view_set("u", "s", "v2", {{"waist_circumference", 84.0}}, C);
      const auto r = aggregate_views({a, b}, params, now);

      CATCH_REQUIRE(!r.has_conflicts());
      CATCH_REQUIRE(!r.set.find("waist_circumference")->conflicting);
      CATCH_REQUIRE(r.set.is_accurate);
      CATCH_REQUIRE(r.provenance.at("waist_circumference")
                    == vector<string>{"v1", "v2"});
   }

   CATCH_SECTION("aggregate-confidence-weighting")
   {
      const auto a = make_view_set("u", "s", "v1", {{"torso_length", 60.0}},
                                   MeasurementModel::LINEAR, 0.9);
      const auto b = make_view_set("u", "s", "v2", {{"torso_length", 62.0}},
                                   MeasurementModel::LINEAR, 0.6);
      const auto r = aggregate_views({a, b}, params, now);
      const auto m = r.set.find("torso_length");
      CATCH_REQUIRE(std::fabs(m->value - (0.9 * 60.0 + 0.6 * 62.0) / 1.5)
                    < 1e-9);
      CATCH_REQUIRE(m->confidence == 0.6);
   }

   CATCH_SECTION("aggregate-passes-single-values-through")
   {
      const auto a = make_view_set("u", "s", "v1",
                                   {{"shoulder_width", 45.0}, {"torso_length", 60.0}});
      const auto b = make_view_set("u", "s", "v2", {{"torso_length", 61.0}});
      const auto r = aggregate_views({a, b}, params, now);
      CATCH_REQUIRE(*r.set.find("shoulder_width") == *a.find("shoulder_width"));
      CATCH_REQUIRE(r.provenance.at("shoulder_width") == vector<string>{"v1"});
      CATCH_REQUIRE(r.source_set_ids == vector<string>{"s/v1", "s/v2"});
      CATCH_REQUIRE(r.set.set_id == "s/reconciled");
      CATCH_REQUIRE(r.set.created_at == now);
   }

   CATCH_SECTION("aggregate-prefers-authoritative-values")
   {
      const auto front = make_view_set("u", "s", "front", {{"chest_circumference", 70.0}},
                                       C, 0.45, true);
      const auto comb  = make_view_set("u", "s", "front+side",
                                       {{"chest_circumference", 98.0}}, C, 0.9);
      const auto r     = aggregate_views({front, comb}, params, now);
      const auto m     = r.set.find("chest_circumference");
      CATCH_REQUIRE(!r.has_conflicts()); // the front-only value is not compared
      CATCH_REQUIRE(m->value == 98.0);
      CATCH_REQUIRE(!m->estimated_from_front_only);
      CATCH_REQUIRE(r.provenance.at("chest_circumference")
                    == vector<string>{"front+side"});
      CATCH_REQUIRE(r.set.is_accurate);

      // With no authoritative value, the front-only estimate is used.
      const auto r2 = aggregate_views({front}, params, now);
      CATCH_REQUIRE(r2.set.find("chest_circumference")->estimated_from_front_only);
      CATCH_REQUIRE(!r2.set.is_accurate);
   }

   CATCH_SECTION("aggregate-front-only-estimates-never-conflict")
   {
      const auto a = make_view_set("u", "s", "front-0", {{"waist_circumference", 80.0}},
                                   C, 0.45, true);
      const auto b = make_view_set("u", "s", "front-1", {{"waist_circumference", 95.0}},
                                   C, 0.45, true);
      const auto r = aggregate_views({a, b}, params, now);
      const auto m = r.set.find("waist_circumference");
      CATCH_REQUIRE(!r.has_conflicts());
      CATCH_REQUIRE(!m->conflicting);
      CATCH_REQUIRE(m->estimated_from_front_only);
      CATCH_REQUIRE(std::fabs(m->value - 87.5) < 1e-9);
      CATCH_REQUIRE(!r.set.is_accurate);
   }

   CATCH_SECTION("aggregate-conflict-boundary")
   {
      // 8% of 100 exactly is within tolerance; anything above is a conflict
      const auto a = make_view_set("u", "s", "v1", {{"inseam", 100.0}});
      const auto b = make_view_set("u", "s", "v2", {{"inseam", 108.0}});
      const auto c = make_view_set("u", "s", "v3", {{"inseam", 108.5}});
      CATCH_REQUIRE(!aggregate_views({a, b}, params, now).has_conflicts());
      CATCH_REQUIRE(aggregate_views({a, c}, params, now).has_conflicts());
   }

   CATCH_SECTION("aggregate-rejects-mixed-sessions")
   {
      const auto a = make_view_set("u", "s1", "v1", {{"torso_length", 60.0}});
      const auto b = make_view_set("u", "s2", "v2", {{"torso_length", 60.0}});
      const auto c = make_view_set("w", "s1", "v3", {{"torso_length", 60.0}});
      CATCH_REQUIRE_THROWS(aggregate_views({a, b}, params, now));
      CATCH_REQUIRE_THROWS(aggregate_views({a, c}, params, now));
      CATCH_REQUIRE_THROWS(aggregate_views({}, params, now));
   }

   CATCH_SECTION("reconciled-json")
   {
      const auto a = make_view_set("u", "s", "v1", {{"waist_circumference", 80.0}}, C);
      const auto b = make_view_set("u", "s", "v2", {{"waist_circumference", 95.0}}, C);
      const auto r = aggregate_views({a, b}, params, now);
      ReconciledMeasurementSet u;
      u.read(r.to_json());
      CATCH_REQUIRE(r == u);
   }
}

} // namespace anthro
