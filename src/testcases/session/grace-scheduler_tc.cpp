
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <future>

#include "anthro/session/grace-scheduler.hpp"

namespace anthro
{
using std::chrono::milliseconds;
using std::chrono::seconds;

CATCH_TEST_CASE("ManualScheduler", "[grace-scheduler]")
{
   CATCH_SECTION("manual-deadline-order")
   {
      ManualScheduler sched;
      vector<int> order;
      sched.schedule_after(seconds(3), [&]() { order.push_back(3); });
      sched.schedule_after(seconds(1), [&]() { order.push_back(1); });
      sched.schedule_after(seconds(2), [&]() { order.push_back(2); });
      CATCH_REQUIRE(sched.n_pending() == 3);

      CATCH_REQUIRE(sched.advance(milliseconds(999)) == 0);
      CATCH_REQUIRE(sched.advance(milliseconds(1001)) == 2);
      CATCH_REQUIRE(order == vector<int>{1, 2});
      CATCH_REQUIRE(sched.n_pending() == 1);
      CATCH_REQUIRE(sched.now() == seconds(2));

      CATCH_REQUIRE(sched.advance(seconds(10)) == 1);
      CATCH_REQUIRE(order == vector<int>{1, 2, 3});
      CATCH_REQUIRE(sched.advance(seconds(10)) == 0);
   }

   CATCH_SECTION("manual-cancel")
   {
      ManualScheduler sched;
      int counter  = 0;
      const auto a = sched.schedule_after(seconds(1), [&]() { counter += 1; });
      const auto b = sched.schedule_after(seconds(1), [&]() { counter += 10; });
      CATCH_REQUIRE(a != b);
      CATCH_REQUIRE(sched.cancel(a));
      CATCH_REQUIRE(!sched.cancel(a));
      CATCH_REQUIRE(sched.advance(seconds(1)) == 1);
      CATCH_REQUIRE(counter == 10);
      CATCH_REQUIRE(!sched.cancel(b)); // already ran
   }

   CATCH_SECTION("manual-task-may-reschedule")
   {
      ManualScheduler sched;
      int fired = 0;
      sched.schedule_after(seconds(1), [&]() {
         ++fired;
         sched.schedule_after(seconds(1), [&]() { ++fired; });
      });
      CATCH_REQUIRE(sched.advance(seconds(1)) == 1);
      CATCH_REQUIRE(sched.n_pending() == 1);
      CATCH_REQUIRE(sched.advance(seconds(1)) == 1);
      CATCH_REQUIRE(fired == 2);
   }
}

CATCH_TEST_CASE("ThreadedScheduler", "[grace-scheduler]")
{
   CATCH_SECTION("threaded-runs-task")
   {
      ThreadedScheduler sched;
      std::promise<int> done;
      auto fut = done.get_future();
      sched.schedule_after(milliseconds(10), [&]() { done.set_value(42); });
      CATCH_REQUIRE(fut.wait_for(seconds(5)) == std::future_status::ready);
      CATCH_REQUIRE(fut.get() == 42);
   }

   CATCH_SECTION("threaded-cancel")
   {
      std::atomic<int> fired{0};
      {
         ThreadedScheduler sched;
         const auto id
             = sched.schedule_after(seconds(60), [&]() { fired++; });
         CATCH_REQUIRE(sched.n_pending() == 1);
         CATCH_REQUIRE(sched.cancel(id));
         CATCH_REQUIRE(sched.n_pending() == 0);
         CATCH_REQUIRE(!sched.cancel(id));
      }
      CATCH_REQUIRE(fired.load() == 0);
   }

   CATCH_SECTION("threaded-destruction-drops-pending")
   {
      std::atomic<int> fired{0};
      {
         ThreadedScheduler sched;
         sched.schedule_after(seconds(60), [&]() { fired++; });
      }
      CATCH_REQUIRE(fired.load() == 0);
   }
}

} // namespace anthro
