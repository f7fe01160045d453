
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/measure/params.hpp"

namespace anthro
{
template<typename T> static void test_eq(const T& u, const Json::Value& o)
{
   T v, z;
   v.read_with_defaults(o, &z, false);
   CATCH_REQUIRE(u == v);
}

// Every other key missing: the defaults fill in.
template<typename T> static void test_it_eq()
{
   T u;
   Json::Value packed        = u.to_json();
   const vector<string> keys = packed.getMemberNames();
   for(auto i = 0u; i < keys.size(); i += 2) packed.removeMember(keys[i]);
   test_eq<T>(u, packed);
}

template<typename T> static void test_read_eq()
{
   T u, v;
   Json::Value packed        = u.to_json();
   const vector<string> keys = packed.getMemberNames();
   for(auto i = 0u; i < keys.size(); ++i) {
      Json::Value p2 = packed;
      p2.removeMember(keys[i]);
      v.template read_with_defaults<T>(p2, false);
      CATCH_REQUIRE(u == v);
   }
   test_it_eq<T>();
}

CATCH_TEST_CASE("STRUCT-META", "[struct_meta]")
{
   CATCH_SECTION("struct-meta_params")
   {
      Params p, q;
      p.feedback                          = true;
      p.validator.min_confidence          = 0.25;
      p.aggregate.conflict_tolerance      = 0.1;
      p.verification.max_retakes          = 5;
      p.verification.grace_period_seconds = 12.5;
      const auto s                        = p.to_json_string();
      q.read(parse_json(s));
      CATCH_REQUIRE(p == q);
      CATCH_REQUIRE(q.verification.max_retakes == 5);
   }

   CATCH_SECTION("struct-meta_nested-defaults")
   {
      Params p;
      p.compute.front_only_depth_ratio = 0.8;
      Json::Value packed               = p.to_json();
      packed["compute"].removeMember("front_only_confidence_factor");
      packed.removeMember("aggregate");

      Params q;
      read(q, packed);
      CATCH_REQUIRE(q.compute.front_only_depth_ratio == 0.8);
      CATCH_REQUIRE(q.compute.front_only_confidence_factor == 0.5);
      CATCH_REQUIRE(q.aggregate.conflict_tolerance == 0.08);
   }

   CATCH_SECTION("struct-meta_strict-read")
   {
      Params p;
      Json::Value packed = p.to_json();
      packed.removeMember("feedback");
      CATCH_REQUIRE_THROWS(p.read(packed));
   }

   CATCH_SECTION("struct-meta")
   {
      test_it_eq<ValidatorParams>();
      test_it_eq<CalibrationParams>();
      test_read_eq<ComputeParams>();
      test_read_eq<AggregateParams>();
      test_read_eq<VerificationParams>();
      test_read_eq<Params>();
   }

   CATCH_SECTION("params-validate")
   {
      Params p;
      CATCH_REQUIRE_NOTHROW(p.validate());

      p.validator.min_confidence = 1.5;
      CATCH_REQUIRE_THROWS(p.validate());

      p                              = Params{};
      p.aggregate.conflict_tolerance = -0.01;
      CATCH_REQUIRE_THROWS(p.validate());

      p                                   = Params{};
      p.verification.grace_period_seconds = -1.0;
      CATCH_REQUIRE_THROWS(p.validate());
   }
}

} // namespace anthro
