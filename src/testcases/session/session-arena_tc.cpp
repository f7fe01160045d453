
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/measure/aggregate-views.hpp"
#include "anthro/session/session-arena.hpp"

#include "testcases/testcase-helpers.hpp"

namespace anthro
{
using testing::make_view_set;

static ReconciledMeasurementSet record_for(const string& session)
{
   const auto a = make_view_set("u", session, "v1", {{"shoulder_width", 45.0}});
   return aggregate_views({a}, AggregateParams{}, Timestamp(1600000000));
}

// Submit and reject, so the session is ready for a retake.
static void drive_to_retaking(CaptureSession& s)
{
   s.verification().submit(record_for(s.session_id()));
   s.verification().reject();
}

CATCH_TEST_CASE("SessionArena", "[session-arena]")
{
   vector<TransitionEvent> events;
   ManualScheduler scheduler;

   SessionArena::Config config;
   config.plan      = make_shared<const MeasurementPlan>(default_measurement_plan());
   config.scheduler = &scheduler;
   config.listener  = [&](const TransitionEvent& e) { events.push_back(e); };

   CATCH_SECTION("arena-open-find-close")
   {
      SessionArena arena(config);
      auto s1 = arena.open_session("u", "s1");
      auto s2 = arena.open_session("u", "s0");
      CATCH_REQUIRE(s1 != nullptr);
      CATCH_REQUIRE(s1->verification().state() == VerificationState::CAPTURED);
      CATCH_REQUIRE(s1->retake_count() == 0);
      CATCH_REQUIRE(arena.size() == 2);
      CATCH_REQUIRE(arena.session_ids() == vector<string>{"s0", "s1"});

      CATCH_REQUIRE_THROWS(arena.open_session("v", "s1"));
      CATCH_REQUIRE_THROWS(arena.open_session("", "s9"));
      CATCH_REQUIRE_THROWS(arena.open_session("u", ""));

      CATCH_REQUIRE(arena.find("s1") == s1);
      CATCH_REQUIRE(arena.find("nope") == nullptr);

      CATCH_REQUIRE(arena.close_session("s1"));
      CATCH_REQUIRE(!arena.close_session("s1"));
      CATCH_REQUIRE(arena.find("s1") == nullptr);
      CATCH_REQUIRE(arena.size() == 1);

      // Closed sessions stay usable by whoever holds them
      s1->verification().report_capture_failure("occluded");
      CATCH_REQUIRE(s1->verification().n_capture_failures() == 1);
   }

   CATCH_SECTION("arena-session-data")
   {
      SessionArena arena(config);
      auto s = arena.open_session("u", "s1");
      s->add_frames({testing::make_front_frame(), testing::make_side_frame()});
      CATCH_REQUIRE(s->frames().size() == 2);

      s->add_view_sets({make_view_set("u", "s1", "front-0", {{"hip_width", 28.0}})});
      CATCH_REQUIRE(s->view_sets().size() == 1);

      CATCH_REQUIRE_THROWS(
          s->add_view_sets({make_view_set("u", "s2", "x", {{"hip_width", 1.0}})}));
      CATCH_REQUIRE_THROWS(
          s->add_view_sets({make_view_set("w", "s1", "x", {{"hip_width", 1.0}})}));
      CATCH_REQUIRE(s->view_sets().size() == 1);
   }

   CATCH_SECTION("arena-retake-requires-retaking")
   {
      SessionArena arena(config);
      auto s = arena.open_session("u", "s1");
      CATCH_REQUIRE_THROWS(arena.start_retake("s1", "s2"));
      CATCH_REQUIRE_THROWS(arena.start_retake("missing", "s2"));

      s->verification().submit(record_for("s1"));
      CATCH_REQUIRE_THROWS(arena.start_retake("s1", "s2"));
      CATCH_REQUIRE(arena.session_ids() == vector<string>{"s1"});
   }

   CATCH_SECTION("arena-retake-chain")
   {
      SessionArena arena(config);
      auto s = arena.open_session("u", "s0");

      for(unsigned i = 1; i <= 3; ++i) {
         drive_to_retaking(*s);
         const auto old_id = s->session_id();
         const auto new_id = format("s{}", i);
         s                 = arena.start_retake(old_id, new_id);
         CATCH_REQUIRE(s != nullptr);
         CATCH_REQUIRE(s->retake_count() == i);
         CATCH_REQUIRE(s->user_id() == "u");
         CATCH_REQUIRE(s->verification().state() == VerificationState::CAPTURED);
         CATCH_REQUIRE(arena.find(old_id) == nullptr);
         CATCH_REQUIRE(arena.session_ids() == vector<string>{new_id});
      }

      // The fourth retake is one too many
      drive_to_retaking(*s);
      CATCH_REQUIRE(arena.start_retake("s3", "s4") == nullptr);
      CATCH_REQUIRE(s->verification().state()
                    == VerificationState::RETAKES_EXHAUSTED);
      CATCH_REQUIRE(arena.find("s3") == s);
      CATCH_REQUIRE(arena.find("s4") == nullptr);
      CATCH_REQUIRE(events.back().trigger == TransitionTrigger::RETAKES_EXHAUSTED);
      CATCH_REQUIRE(events.back().retake_count == 3);

      CATCH_REQUIRE_THROWS(s->verification().abandon());
      CATCH_REQUIRE_THROWS(arena.start_retake("s3", "s5"));
   }

   CATCH_SECTION("arena-retake-target-in-use")
   {
      SessionArena arena(config);
      auto a = arena.open_session("u", "a");
      arena.open_session("u", "b");
      drive_to_retaking(*a);
      CATCH_REQUIRE_THROWS(arena.start_retake("a", "b"));
      CATCH_REQUIRE_THROWS(arena.start_retake("a", ""));
      CATCH_REQUIRE(arena.find("a") == a);
      CATCH_REQUIRE(a->verification().state() == VerificationState::RETAKING);
   }

   CATCH_SECTION("arena-max-retakes-zero")
   {
      config.params.verification.max_retakes = 0;
      SessionArena arena(config);
      auto s = arena.open_session("u", "s0");
      drive_to_retaking(*s);
      CATCH_REQUIRE(arena.start_retake("s0", "s1") == nullptr);
      CATCH_REQUIRE(s->verification().state()
                    == VerificationState::RETAKES_EXHAUSTED);
   }

   CATCH_SECTION("arena-listener-may-query-the-arena")
   {
      config.params.verification.max_retakes = 0;
      SessionArena* arena_ptr                 = nullptr;
      vector<size_t> sizes;
      vector<bool> found;
      config.listener = [&](const TransitionEvent& e) {
         events.push_back(e);
         sizes.push_back(arena_ptr->size());
         found.push_back(arena_ptr->find(e.session_id) != nullptr);
      };

      SessionArena arena(config);
      arena_ptr = &arena;
      auto s    = arena.open_session("u", "s0");
      drive_to_retaking(*s);
      CATCH_REQUIRE(arena.start_retake("s0", "s1") == nullptr);

      CATCH_REQUIRE(events.back().trigger == TransitionTrigger::RETAKES_EXHAUSTED);
      CATCH_REQUIRE(sizes.size() == events.size());
      CATCH_REQUIRE(sizes.back() == 1);
      CATCH_REQUIRE(found.back());
      CATCH_REQUIRE(arena.find("s1") == nullptr);
   }

   CATCH_SECTION("arena-sessions-share-the-scheduler")
   {
      const auto C = MeasurementModel::CIRCUMFERENCE;
      SessionArena arena(config);
      for(auto id : {"a", "b"}) {
         auto s = arena.open_session("u", id);
         const auto x = make_view_set("u", id, "v1", {{"waist_circumference", 80.0}}, C);
         const auto y = make_view_set("u", id, "v2", {{"waist_circumference", 95.0}}, C);
         s->verification().submit(
             aggregate_views({x, y}, AggregateParams{}, Timestamp(1600000000)));
      }
      CATCH_REQUIRE(scheduler.n_pending() == 2);
      arena.find("a")->verification().accept();
      CATCH_REQUIRE(scheduler.n_pending() == 1);
      CATCH_REQUIRE(scheduler.advance(std::chrono::seconds(30)) == 1);
      CATCH_REQUIRE(arena.find("b")->verification().retake_proposed());
      CATCH_REQUIRE(!arena.find("a")->verification().retake_proposed());
   }
}

} // namespace anthro
