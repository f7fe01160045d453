
#define CATCH_CONFIG_PREFIX_ALL

#include <atomic>

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/io/json-io.hpp"
#include "anthro/utils/timestamp.hpp"

namespace anthro
{
CATCH_TEST_CASE("Timestamp", "[timestamp]")
{
   CATCH_SECTION("timestamp-to-string")
   {
      const Timestamp t(1600000000, 123456);
      CATCH_REQUIRE(t.to_string() == "2020-09-13T12:26:40.123456");
      CATCH_REQUIRE(Timestamp::parse(t.to_string()) == t);
      CATCH_REQUIRE(Timestamp::parse("2020-09-13T12:26:40")
                    == Timestamp(1600000000));
   }

   CATCH_SECTION("timestamp-ordering")
   {
      Timestamp a(1600000000);
      Timestamp b = a;
      b.add_millis(1500);
      CATCH_REQUIRE(a < b);
      CATCH_REQUIRE(a.micros_to(b) == 1500000);
      CATCH_REQUIRE(b.micros() == 500000);
      CATCH_REQUIRE(b.seconds_from_epoch() == 1600000001);
   }

   CATCH_SECTION("timestamp-bad-input")
   {
      CATCH_REQUIRE_THROWS(Timestamp::parse("2020-09-13"));
      CATCH_REQUIRE_THROWS(Timestamp::parse("2020-09-13 12:26:40.1234x6"));
   }

   CATCH_SECTION("timestamp-json")
   {
      const Timestamp t(1600000000, 42);
      Timestamp u;
      json_load(json_save(t), u);
      CATCH_REQUIRE(t == u);
   }
}

CATCH_TEST_CASE("ParallelJobSet", "[threads]")
{
   CATCH_SECTION("parallel-job-set-runs-every-job")
   {
      std::atomic<int> counter{0};
      ParallelJobSet pjobs;
      for(auto i = 0; i < 100; ++i) pjobs.schedule([&]() { ++counter; });
      pjobs.execute();
      CATCH_REQUIRE(counter.load() == 100);
   }

   CATCH_SECTION("parallel-job-set-rethrows")
   {
      std::atomic<int> counter{0};
      ParallelJobSet pjobs;
      for(auto i = 0; i < 10; ++i)
         pjobs.schedule([&, i]() {
            ++counter;
            if(i == 3) throw std::runtime_error("job 3");
         });
      CATCH_REQUIRE_THROWS_AS(pjobs.execute(), std::runtime_error);
      CATCH_REQUIRE(counter.load() == 10);
   }
}

} // namespace anthro
