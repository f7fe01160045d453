
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/measure/aggregate-views.hpp"
#include "anthro/session/verification.hpp"

#include "testcases/testcase-helpers.hpp"

namespace anthro
{
using std::chrono::seconds;
using testing::make_view_set;

static ReconciledMeasurementSet accurate_record(const string& session)
{
   const auto a = make_view_set("u", session, "v1", {{"shoulder_width", 45.0}});
   return aggregate_views({a}, AggregateParams{}, Timestamp(1600000000));
}

static ReconciledMeasurementSet conflicting_record(const string& session)
{
   const auto C = MeasurementModel::CIRCUMFERENCE;
   const auto a = make_view_set("u", session, "v1", {{"waist_circumference", 80.0}}, C);
   const auto b = make_view_set("u", session, "v2", {{"waist_circumference", 95.0}}, C);
   return aggregate_views({a, b}, AggregateParams{}, Timestamp(1600000000));
}

struct Fixture
{
   ManualScheduler scheduler;
   vector<TransitionEvent> events;

   VerificationSession::Config config(const string& session = "s"s)
   {
      VerificationSession::Config o;
      o.user_id    = "u";
      o.session_id = session;
      o.plan       = make_shared<const MeasurementPlan>(default_measurement_plan());
      o.scheduler  = &scheduler;
      o.listener   = [this](const TransitionEvent& e) { events.push_back(e); };
      return o;
   }
};

CATCH_TEST_CASE("VerificationSession", "[verification]")
{
   CATCH_SECTION("verification-accept")
   {
      Fixture fx;
      VerificationSession vs(fx.config());
      CATCH_REQUIRE(vs.state() == VerificationState::CAPTURED);
      CATCH_REQUIRE(!vs.record().has_value());

      vs.submit(accurate_record("s"));
      CATCH_REQUIRE(vs.state() == VerificationState::PENDING_REVIEW);
      CATCH_REQUIRE(!vs.grace_timer_pending()); // accurate: no timer
      CATCH_REQUIRE(fx.scheduler.n_pending() == 0);

      vs.accept();
      CATCH_REQUIRE(vs.state() == VerificationState::ACCEPTED);
      CATCH_REQUIRE(vs.record()->set.verified_by_user);
      CATCH_REQUIRE(is_terminal(vs.state()));

      CATCH_REQUIRE(fx.events.size() == 2);
      CATCH_REQUIRE(fx.events[0].trigger == TransitionTrigger::SUBMIT);
      CATCH_REQUIRE(fx.events[0].from == VerificationState::CAPTURED);
      CATCH_REQUIRE(fx.events[1].trigger == TransitionTrigger::ACCEPT);
      CATCH_REQUIRE(fx.events[1].to == VerificationState::ACCEPTED);
      CATCH_REQUIRE(fx.events[1].session_id == "s");
   }

   CATCH_SECTION("verification-accepted-is-immutable")
   {
      Fixture fx;
      VerificationSession vs(fx.config());
      vs.submit(accurate_record("s"));
      vs.accept();
      const auto before = vs.record();

      CATCH_REQUIRE_THROWS(vs.amend("shoulder_width", 50.0));
      CATCH_REQUIRE_THROWS(vs.accept());
      CATCH_REQUIRE_THROWS(vs.reject());
      CATCH_REQUIRE_THROWS(vs.submit(accurate_record("s")));
      CATCH_REQUIRE_THROWS(vs.abandon());
      CATCH_REQUIRE(vs.record() == before);
      CATCH_REQUIRE(vs.state() == VerificationState::ACCEPTED);
      CATCH_REQUIRE(fx.events.size() == 2);
   }

   CATCH_SECTION("verification-only-accept-or-retake-from-review")
   {
      Fixture fx;
      VerificationSession vs(fx.config());
      CATCH_REQUIRE_THROWS(vs.accept());
      CATCH_REQUIRE_THROWS(vs.reject());
      CATCH_REQUIRE_THROWS(vs.abandon());

      vs.submit(accurate_record("s"));
      CATCH_REQUIRE_THROWS(vs.abandon());
      CATCH_REQUIRE_THROWS(vs.acknowledge_retake()); // nothing proposed
      CATCH_REQUIRE_THROWS(vs.report_capture_failure("blurry"));

      vs.reject();
      CATCH_REQUIRE(vs.state() == VerificationState::RETAKING);
      vs.abandon();
      CATCH_REQUIRE(vs.state() == VerificationState::ABANDONED);
      CATCH_REQUIRE(is_terminal(vs.state()));
   }

   CATCH_SECTION("verification-submit-checks")
   {
      Fixture fx;
      VerificationSession vs(fx.config());
      CATCH_REQUIRE_THROWS(vs.submit(accurate_record("other-session")));

      auto r = accurate_record("s");
      r.set.user_id = "someone-else";
      CATCH_REQUIRE_THROWS(vs.submit(r));

      r = accurate_record("s");
      r.set.fields["inseam"] = r.set.fields["shoulder_width"];
      CATCH_REQUIRE_THROWS(vs.submit(r)); // not in the plan

      CATCH_REQUIRE(vs.state() == VerificationState::CAPTURED);
      CATCH_REQUIRE(fx.events.empty());
   }

   CATCH_SECTION("verification-capture-failure")
   {
      Fixture fx;
      VerificationSession vs(fx.config());
      vs.report_capture_failure("MissingJoint: r_ankle");
      vs.report_capture_failure("LowConfidence: neck");
      CATCH_REQUIRE(vs.state() == VerificationState::CAPTURED);
      CATCH_REQUIRE(vs.n_capture_failures() == 2);
      CATCH_REQUIRE(fx.events.size() == 2);
      CATCH_REQUIRE(fx.events[1].trigger == TransitionTrigger::CAPTURE_FAILURE);
      CATCH_REQUIRE(fx.events[1].detail == "LowConfidence: neck");
   }

   CATCH_SECTION("verification-grace-period")
   {
      Fixture fx;
      VerificationSession vs(fx.config());
      vs.submit(conflicting_record("s"));
      CATCH_REQUIRE(vs.state() == VerificationState::PENDING_REVIEW);
      CATCH_REQUIRE(vs.grace_timer_pending());
      CATCH_REQUIRE(fx.scheduler.n_pending() == 1);

      CATCH_REQUIRE(fx.scheduler.advance(seconds(29)) == 0);
      CATCH_REQUIRE(!vs.retake_proposed());

      CATCH_REQUIRE(fx.scheduler.advance(seconds(1)) == 1);
      CATCH_REQUIRE(vs.retake_proposed());
      CATCH_REQUIRE(vs.state() == VerificationState::PENDING_REVIEW);
      CATCH_REQUIRE(!vs.grace_timer_pending());
      CATCH_REQUIRE(fx.events.back().trigger
                    == TransitionTrigger::RETAKE_PROPOSED);

      vs.acknowledge_retake();
      CATCH_REQUIRE(vs.state() == VerificationState::RETAKING);
      CATCH_REQUIRE(fx.events.back().trigger
                    == TransitionTrigger::ACKNOWLEDGE_RETAKE);
   }

   CATCH_SECTION("verification-grace-period-cancelled")
   {
      Fixture fx;
      VerificationSession vs(fx.config());
      vs.submit(conflicting_record("s"));
      CATCH_REQUIRE(vs.grace_timer_pending());

      vs.accept();
      CATCH_REQUIRE(!vs.grace_timer_pending());
      CATCH_REQUIRE(fx.scheduler.n_pending() == 0);
      CATCH_REQUIRE(fx.scheduler.advance(seconds(60)) == 0);
      CATCH_REQUIRE(!vs.retake_proposed());
      CATCH_REQUIRE(vs.state() == VerificationState::ACCEPTED);
      CATCH_REQUIRE(fx.events.size() == 2);
   }

   CATCH_SECTION("verification-amend")
   {
      Fixture fx;
      VerificationSession vs(fx.config());
      vs.submit(conflicting_record("s"));
      CATCH_REQUIRE(!vs.record()->set.is_accurate);

      CATCH_REQUIRE_THROWS(vs.amend("hip_width", 30.0)); // not a field
      CATCH_REQUIRE_THROWS(vs.amend("waist_circumference", -1.0));

      fx.scheduler.advance(seconds(10));
      vs.amend("waist_circumference", 82.0);

      const auto r = vs.record();
      const auto m = r->set.find("waist_circumference");
      CATCH_REQUIRE(m->value == 82.0);
      CATCH_REQUIRE(m->confidence == 1.0);
      CATCH_REQUIRE(!m->conflicting);
      CATCH_REQUIRE(!r->has_conflicts());
      CATCH_REQUIRE(r->provenance.at("waist_circumference")
                    == vector<string>{"user"});
      CATCH_REQUIRE(r->set.is_accurate);
      CATCH_REQUIRE(!r->set.verified_by_user);
      CATCH_REQUIRE(!vs.grace_timer_pending()); // now accurate
      CATCH_REQUIRE(fx.events.back().trigger == TransitionTrigger::AMEND);

      CATCH_REQUIRE(fx.scheduler.advance(seconds(60)) == 0);
      vs.accept();
      CATCH_REQUIRE(vs.record()->set.verified_by_user);
   }

   CATCH_SECTION("verification-destruction-cancels-timer")
   {
      Fixture fx;
      {
         VerificationSession vs(fx.config());
         vs.submit(conflicting_record("s"));
         CATCH_REQUIRE(fx.scheduler.n_pending() == 1);
      }
      CATCH_REQUIRE(fx.scheduler.n_pending() == 0);
      CATCH_REQUIRE(fx.scheduler.advance(seconds(60)) == 0);
   }

   CATCH_SECTION("verification-without-scheduler")
   {
      auto config      = Fixture{}.config();
      config.scheduler = nullptr;
      config.listener  = nullptr;
      VerificationSession vs(std::move(config));
      vs.submit(conflicting_record("s"));
      CATCH_REQUIRE(!vs.grace_timer_pending());
      vs.reject();
      CATCH_REQUIRE(vs.state() == VerificationState::RETAKING);
   }

   CATCH_SECTION("verification-listener-errors-are-contained")
   {
      Fixture fx;
      auto config     = fx.config();
      config.listener = [](const TransitionEvent&) {
         throw std::runtime_error("listener failed");
      };
      VerificationSession vs(std::move(config));
      CATCH_REQUIRE_NOTHROW(vs.submit(accurate_record("s")));
      CATCH_REQUIRE(vs.state() == VerificationState::PENDING_REVIEW);
   }

   CATCH_SECTION("verification-state-names")
   {
      for(auto s : {VerificationState::CAPTURED,
                    VerificationState::PENDING_REVIEW,
                    VerificationState::ACCEPTED,
                    VerificationState::RETAKING,
                    VerificationState::ABANDONED,
                    VerificationState::RETAKES_EXHAUSTED})
         CATCH_REQUIRE(to_verification_state(str(s)) == s);
      CATCH_REQUIRE_THROWS(to_verification_state("Pending"));
      CATCH_REQUIRE(!is_terminal(VerificationState::RETAKING));
   }
}

} // namespace anthro
