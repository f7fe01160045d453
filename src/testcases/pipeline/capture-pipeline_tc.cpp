
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include "anthro/io/json-io.hpp"
#include "anthro/pipeline/capture-pipeline.hpp"
#include "anthro/utils/file-system.hpp"

#include "testcases/testcase-helpers.hpp"

namespace anthro
{
using testing::make_capture_input;
using testing::make_front_frame;
using testing::make_side_frame;

static const Timestamp k_now = Timestamp(1600000000);

static SessionArena::Config arena_config(ManualScheduler& scheduler)
{
   SessionArena::Config o;
   o.plan      = make_shared<const MeasurementPlan>(default_measurement_plan());
   o.scheduler = &scheduler;
   return o;
}

CATCH_TEST_CASE("process_capture", "[capture-pipeline]")
{
   const auto& plan = default_measurement_plan();
   Params params;

   CATCH_SECTION("pipeline-front-and-side")
   {
      const auto input = make_capture_input(
          "u", "s", {make_front_frame(), make_side_frame()});
      const auto ret = process_capture(input, plan, params, k_now);

      CATCH_REQUIRE(ret.failures.empty());
      CATCH_REQUIRE(!ret.is_capture_failure());
      CATCH_REQUIRE(ret.view_sets.size() == 3); // front, side, combined

      const auto& front = ret.view_sets[0];
      CATCH_REQUIRE(front.pose_type == PoseType::FRONT);
      CATCH_REQUIRE(std::fabs(front.calibration_ratio - 0.2) < 1e-9);
      CATCH_REQUIRE(front.set_id == "s/front-0");

      const auto& combined = ret.view_sets[2];
      CATCH_REQUIRE(combined.pose_type == PoseType::COMBINED);
      CATCH_REQUIRE(combined.view_id == "front-0+side-0");

      const auto& r = *ret.reconciled;
      CATCH_REQUIRE(r.set.pose_type == PoseType::COMBINED);
      CATCH_REQUIRE(r.set.set_id == "s/reconciled");
      CATCH_REQUIRE(r.set.created_at == k_now);
      CATCH_REQUIRE(r.set.fields.size() == plan.entries.size());
      CATCH_REQUIRE(!r.has_conflicts());
      CATCH_REQUIRE(r.set.is_accurate);
      CATCH_REQUIRE(!r.set.verified_by_user);
      CATCH_REQUIRE(r.source_set_ids.size() == 3);

      const auto sw = r.set.find("shoulder_width");
      CATCH_REQUIRE(std::fabs(sw->value - 45.0) < 1e-6);
      CATCH_REQUIRE(std::fabs(r.set.find("hip_width")->value - 28.0) < 1e-6);

      // Circumferences come from the combined set, not the front estimates
      for(auto name : {"chest_circumference",
                       "waist_circumference",
                       "hip_circumference"}) {
         const auto m = r.set.find(name);
         CATCH_REQUIRE(m != nullptr);
         CATCH_REQUIRE(!m->estimated_from_front_only);
         CATCH_REQUIRE(m->model == MeasurementModel::CIRCUMFERENCE);
         CATCH_REQUIRE(r.provenance.at(name) == vector<string>{combined.view_id});
      }

      CATCH_REQUIRE_NOTHROW(validate_against_plan(r.set, plan));
   }

   CATCH_SECTION("pipeline-front-only")
   {
      const auto ret = process_capture(
          make_capture_input("u", "s", {make_front_frame()}), plan, params, k_now);
      CATCH_REQUIRE(ret.view_sets.size() == 1);
      const auto& r = *ret.reconciled;
      const auto m  = r.set.find("waist_circumference");
      CATCH_REQUIRE(m != nullptr);
      CATCH_REQUIRE(m->estimated_from_front_only);
      CATCH_REQUIRE(!r.set.is_accurate);
   }

   CATCH_SECTION("pipeline-frame-failures")
   {
      const auto input = make_capture_input(
          "u",
          "s",
          {make_front_frame("blurry", 0.1), make_side_frame("side-0", 0.9)});
      const auto ret = process_capture(input, plan, params, k_now);
      CATCH_REQUIRE(ret.failures.size() == 1);
      CATCH_REQUIRE(ret.failures[0].frame_id == "blurry");
      CATCH_REQUIRE(ret.failures[0].view == PoseType::FRONT);
      CATCH_REQUIRE(ret.failures[0].error == ErrorKind::LOW_CONFIDENCE);
      CATCH_REQUIRE(ret.view_sets.size() == 1); // the side view, no combined
      CATCH_REQUIRE(!ret.is_capture_failure());
   }

   CATCH_SECTION("pipeline-capture-failure")
   {
      auto input = make_capture_input(
          "u", "s", {make_front_frame(), make_side_frame()});
      input.calibration.physical_length = 0.0;
      const auto ret = process_capture(input, plan, params, k_now);
      CATCH_REQUIRE(ret.is_capture_failure());
      CATCH_REQUIRE(ret.view_sets.empty());
      CATCH_REQUIRE(ret.failures.size() == 2);
      for(const auto& f : ret.failures)
         CATCH_REQUIRE(f.error == ErrorKind::INVALID_CALIBRATION);
   }

   CATCH_SECTION("pipeline-degenerate-frame")
   {
      // Both shoulders on the same pixel: a zero-width measurement
      const auto f  = make_front_frame();
      const auto df = testing::with_joint(f, "l_shoulder", *f.find("r_shoulder"));
      const auto ret = process_capture(
          make_capture_input("u", "s", {df, make_side_frame()}), plan, params, k_now);

      CATCH_REQUIRE(ret.failures.size() == 1);
      CATCH_REQUIRE(ret.failures[0].frame_id == "front-0");
      CATCH_REQUIRE(ret.failures[0].view == PoseType::FRONT);
      CATCH_REQUIRE(ret.failures[0].error == ErrorKind::DEGENERATE_MEASUREMENT);
      CATCH_REQUIRE(ret.view_sets.size() == 1); // the side view, no combined
      CATCH_REQUIRE(ret.view_sets[0].pose_type == PoseType::SIDE);
      CATCH_REQUIRE(ret.reconciled.has_value());
      CATCH_REQUIRE(ret.reconciled->set.find("shoulder_width") == nullptr);
      for(const auto& s : ret.view_sets) CATCH_REQUIRE(degenerate_fields(s).empty());
   }

   CATCH_SECTION("pipeline-rejects-combined-frames")
   {
      const auto f = make_front_frame();
      const KeypointFrame combined(
          "c", PoseType::COMBINED, f.width(), f.height(), f.joints());
      CATCH_REQUIRE_THROWS(process_capture(
          make_capture_input("u", "s", {combined}), plan, params, k_now));
   }

   CATCH_SECTION("pipeline-required-joints")
   {
      const auto joints
          = required_joints(plan, CalibrationReference{}, PoseType::FRONT);
      CATCH_REQUIRE(std::is_sorted(cbegin(joints), cend(joints)));
      CATCH_REQUIRE(std::adjacent_find(cbegin(joints), cend(joints))
                    == cend(joints));
      CATCH_REQUIRE(std::count(cbegin(joints), cend(joints), "head_top"s) == 1);
      CATCH_REQUIRE(std::count(cbegin(joints), cend(joints), "r_ankle"s) == 1);
   }

   CATCH_SECTION("pipeline-parallel")
   {
      vector<CaptureInput> inputs;
      for(auto i = 0; i < 8; ++i)
         inputs.push_back(make_capture_input(
             "u", format("s{}", i), {make_front_frame(), make_side_frame()}));
      inputs.push_back(
          make_capture_input("u", "bad", {make_front_frame("f", 0.1)}));

      const auto rets = process_captures(inputs, plan, params, k_now);
      CATCH_REQUIRE(rets.size() == inputs.size());
      const auto expected = process_capture(inputs[0], plan, params, k_now);
      for(auto i = 0; i < 8; ++i) {
         CATCH_REQUIRE(rets[i].capture_session_id == inputs[i].capture_session_id);
         CATCH_REQUIRE(rets[i].reconciled->set.fields
                       == expected.reconciled->set.fields);
      }
      CATCH_REQUIRE(rets.back().is_capture_failure());
   }

   CATCH_SECTION("pipeline-sample-capture")
   {
      CaptureInput input;
      input.read(parse_json(file_get_contents(
          format("{}/sample-capture.json", ANTHRO_TESTDATA_DIR))));
      CATCH_REQUIRE(input.user_id == "user-1");
      CATCH_REQUIRE(input.capture_session_id == "session-1");
      CATCH_REQUIRE(input.frames.size() == 2);

      const auto ret = process_capture(input, plan, params, k_now);
      CATCH_REQUIRE(ret.failures.empty());
      CATCH_REQUIRE(std::fabs(
                        ret.reconciled->set.find("shoulder_width")->value - 45.0)
                    < 1e-6);
   }
}

CATCH_TEST_CASE("ingest_capture", "[capture-pipeline]")
{
   const auto& plan = default_measurement_plan();
   Params params;
   ManualScheduler scheduler;

   CATCH_SECTION("ingest-to-review-and-accept")
   {
      SessionArena arena(arena_config(scheduler));
      auto session     = arena.open_session("u", "s");
      const auto input = make_capture_input(
          "u", "s", {make_front_frame(), make_side_frame()});
      const auto ret = process_capture(input, plan, params, k_now);

      ingest_capture(*session, input, ret);
      CATCH_REQUIRE(session->frames().size() == 2);
      CATCH_REQUIRE(session->view_sets().size() == 3);
      auto& v = session->verification();
      CATCH_REQUIRE(v.state() == VerificationState::PENDING_REVIEW);
      CATCH_REQUIRE(!v.grace_timer_pending());

      v.accept();
      CATCH_REQUIRE(v.record()->set.verified_by_user);
   }

   CATCH_SECTION("ingest-conflicting-views")
   {
      SessionArena arena(arena_config(scheduler));
      auto session = arena.open_session("u", "s");
      const auto C = MeasurementModel::CIRCUMFERENCE;

      CaptureResult ret;
      ret.user_id            = "u";
      ret.capture_session_id = "s";
      ret.view_sets          = {
          testing::make_view_set("u", "s", "a", {{"waist_circumference", 80.0}}, C),
          testing::make_view_set("u", "s", "b", {{"waist_circumference", 95.0}}, C)};
      ret.reconciled = aggregate_views(ret.view_sets, params.aggregate, k_now);

      ingest_capture(*session, make_capture_input("u", "s", {}), ret);
      auto& v = session->verification();
      CATCH_REQUIRE(v.state() == VerificationState::PENDING_REVIEW);
      CATCH_REQUIRE(!v.record()->set.is_accurate);
      CATCH_REQUIRE(v.record()->set.find("waist_circumference")->conflicting);
      CATCH_REQUIRE(std::fabs(
                        v.record()->set.find("waist_circumference")->value - 87.5)
                    < 1e-9);
      CATCH_REQUIRE(v.grace_timer_pending());
   }

   CATCH_SECTION("ingest-capture-failure")
   {
      SessionArena arena(arena_config(scheduler));
      auto session     = arena.open_session("u", "s");
      const auto input = make_capture_input("u", "s", {make_front_frame("f", 0.1)});
      const auto ret   = process_capture(input, plan, params, k_now);

      ingest_capture(*session, input, ret);
      auto& v = session->verification();
      CATCH_REQUIRE(v.state() == VerificationState::CAPTURED);
      CATCH_REQUIRE(v.n_capture_failures() == 1);
      CATCH_REQUIRE(!v.record().has_value());
   }

   CATCH_SECTION("ingest-degenerate-capture")
   {
      SessionArena arena(arena_config(scheduler));
      auto session     = arena.open_session("u", "s");
      const auto f     = make_front_frame();
      const auto input = make_capture_input(
          "u", "s", {testing::with_joint(f, "l_shoulder", *f.find("r_shoulder"))});
      const auto ret = process_capture(input, plan, params, k_now);
      CATCH_REQUIRE(ret.is_capture_failure());

      CATCH_REQUIRE_NOTHROW(ingest_capture(*session, input, ret));
      auto& v = session->verification();
      CATCH_REQUIRE(v.state() == VerificationState::CAPTURED);
      CATCH_REQUIRE(v.n_capture_failures() == 1);
      CATCH_REQUIRE(session->frames().size() == 1);
      CATCH_REQUIRE(session->view_sets().empty());
   }

   CATCH_SECTION("ingest-rejected-submit-leaves-session-untouched")
   {
      SessionArena arena(arena_config(scheduler));
      auto session = arena.open_session("u", "s");

      CaptureResult ret;
      ret.user_id            = "u";
      ret.capture_session_id = "s";
      ret.view_sets = {testing::make_view_set("u", "s", "a", {{"hip_width", 0.0}})};
      ret.reconciled = aggregate_views(ret.view_sets, params.aggregate, k_now);

      const auto input = make_capture_input("u", "s", {make_front_frame()});
      CATCH_REQUIRE_THROWS(ingest_capture(*session, input, ret));
      CATCH_REQUIRE(session->frames().empty());
      CATCH_REQUIRE(session->view_sets().empty());
      CATCH_REQUIRE(session->verification().state() == VerificationState::CAPTURED);
   }

   CATCH_SECTION("ingest-wrong-session")
   {
      SessionArena arena(arena_config(scheduler));
      auto session     = arena.open_session("u", "s");
      const auto input = make_capture_input("u", "t", {make_front_frame()});
      const auto ret   = process_capture(input, plan, params, k_now);
      CATCH_REQUIRE_THROWS(ingest_capture(*session, input, ret));
      CATCH_REQUIRE(session->frames().empty());
      CATCH_REQUIRE(session->view_sets().empty());
   }

   CATCH_SECTION("ingest-wrong-user")
   {
      SessionArena arena(arena_config(scheduler));
      auto session     = arena.open_session("u", "s");
      const auto input = make_capture_input("v", "s", {make_front_frame()});
      const auto ret   = process_capture(input, plan, params, k_now);
      CATCH_REQUIRE_THROWS(ingest_capture(*session, input, ret));
      CATCH_REQUIRE(session->frames().empty());
      CATCH_REQUIRE(session->verification().state() == VerificationState::CAPTURED);
   }
}

} // namespace anthro
