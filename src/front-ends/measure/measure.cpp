
#include "stdinc.hpp"

#include "measure-inc.hpp"

#include "anthro/io/json-io.hpp"
#include "anthro/mesh/blend-shape-mesh.hpp"
#include "anthro/mesh/mesh-parametrization.hpp"
#include "anthro/pipeline/capture-pipeline.hpp"
#include "anthro/utils/cli-utils.hpp"
#include "anthro/utils/file-system.hpp"

namespace anthro::measure
{
// ---------------------------------------------------------------------- config

struct Config
{
   bool show_help            = false;
   string capture_fname      = ""s;
   string params_fname       = ""s;
   string plan_fname         = ""s;
   string mesh_meta_fname    = ""s;
   string mesh_fname         = ""s;
   string out_fname          = ""s; // stdout if empty
   real height               = dNAN;
   bool accept               = false;
   bool print_timing         = false;

   string to_string() const noexcept;
   friend string str(const Config& o) noexcept { return o.to_string(); }
};

string Config::to_string() const noexcept
{
   auto or_default = [](const string& s) { return s.empty() ? "<default>"s : s; };
   return format(R"V0G0N(
Measure-Config
   capture:         '{}'
   params:          '{}'
   plan:            '{}'
   mesh-metadata:   '{}'
   mesh:            '{}'
   out:             '{}'
   height:           {}
   accept:           {}
)V0G0N",
                 capture_fname,
                 or_default(params_fname),
                 or_default(plan_fname),
                 or_default(mesh_meta_fname),
                 mesh_fname,
                 out_fname.empty() ? "<stdout>"s : out_fname,
                 height,
                 str(accept));
}

// ------------------------------------------------------------------- show-help

static void show_help(string argv0)
{
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...] <capture.json>

      -p <filename>        Params file. Missing keys take default values.
      --plan <filename>    Measurement plan. Default is the built-in plan.
      -H <cm>              User height, overriding the capture's calibration.
      --accept             Accept the reconciled set, as the user would, and
                           compute mesh parameters.
      --mesh-meta <file>   Reference mesh metadata. Default is built-in.
      --mesh <filename>    Blend-shape mesh to deform (implies --accept).
      -o <filename>        Output file. Default is stdout.
      --timing             Print timings.

   Example:

      > {:s} -H 170 --accept -o /tmp/out.json capture.json

)V0G0N",
                  basename(argv0),
                  basename(argv0));
}

// ------------------------------------------------------------------ parse-args

static Config parse_args(int argc, char** argv, bool& has_error) noexcept
{
   Config config;

   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "-h" || arg == "--help") {
            config.show_help = true;
         } else if(arg == "-p") {
            config.params_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--plan") {
            config.plan_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-H") {
            config.height = cli::safe_arg_real(argc, argv, i);
         } else if(arg == "--accept") {
            config.accept = true;
         } else if(arg == "--mesh-meta") {
            config.mesh_meta_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--mesh") {
            config.mesh_fname = cli::safe_arg_str(argc, argv, i);
            config.accept     = true;
         } else if(arg == "-o") {
            config.out_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--timing") {
            config.print_timing = true;
         } else if(!arg.empty() and arg[0] == '-') {
            cout << format("Unknown option: '{}'", arg) << endl;
            has_error = true;
         } else if(config.capture_fname.empty()) {
            config.capture_fname = string(arg);
         } else {
            cout << format("Unexpected argument: '{}'", arg) << endl;
            has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {:s}", e.what()) << endl;
         has_error = true;
      }
   }

   if(config.show_help) return config;

   auto check_file = [&](const string& fname, const char* what) {
      if(!fname.empty() and !is_regular_file(fname)) {
         cout << format("Failed to find {} file: '{:s}'", what, fname) << endl;
         has_error = true;
      }
   };

   if(config.capture_fname.empty()) {
      cout << format("Must specify a capture filename!") << endl;
      has_error = true;
   }
   check_file(config.capture_fname, "capture");
   check_file(config.params_fname, "params");
   check_file(config.plan_fname, "plan");
   check_file(config.mesh_meta_fname, "mesh metadata");
   check_file(config.mesh_fname, "mesh");

   if(!std::isnan(config.height) and !(config.height > 0.0)) {
      cout << format("Height must be positive, got {}", config.height) << endl;
      has_error = true;
   }

   return config;
}

// ---------------------------------------------------------------------- run-it

static Json::Value run_it(const Config& config) noexcept(false)
{
   Params params;
   if(!config.params_fname.empty()) load(params, config.params_fname);
   params.validate();

   auto plan = make_shared<MeasurementPlan>(default_measurement_plan());
   if(!config.plan_fname.empty()) load(*plan, config.plan_fname);

   CaptureInput input;
   input.read(parse_json(file_get_contents(config.capture_fname)));
   if(!std::isnan(config.height)) input.calibration.physical_length = config.height;

   TRACE(format("{}", str(config)));

   // ---- Measure
   const auto now = Timestamp::now();
   const auto t0        = tick();
   const auto result    = process_capture(input, *plan, params, now);
   const auto process_s = tock(t0);

   // ---- Verify
   vector<TransitionEvent> events;
   SessionArena::Config arena_config;
   arena_config.params   = params;
   arena_config.plan     = plan;
   arena_config.listener = [&](const TransitionEvent& e) { events.push_back(e); };
   SessionArena arena(std::move(arena_config));

   auto session = arena.open_session(input.user_id, input.capture_session_id);
   ingest_capture(*session, input, result);

   Json::Value out{Json::objectValue};
   out["result"] = result.to_json();

   auto& verification = session->verification();
   if(config.accept) {
      if(verification.state() != VerificationState::PENDING_REVIEW) {
         WARN(format("session '{}' is {}, nothing to accept",
                     session->session_id(),
                     str(verification.state())));
      } else {
         verification.accept();

         ReferenceMeshMetadata metadata = default_reference_mesh_metadata();
         if(!config.mesh_meta_fname.empty())
            load(metadata, config.mesh_meta_fname);

         const auto record     = verification.record();
         const auto mesh_params = parametrize_mesh(*record, metadata);
         out["accepted"]        = record->to_json();
         out["mesh_parameters"] = mesh_params.to_json();

         if(!config.mesh_fname.empty()) {
            BlendShapeMesh mesh;
            load(mesh, config.mesh_fname);
            BlendShapeMesh deformed = mesh;
            deformed.vertices       = deform(mesh, mesh_params);
            deformed.offsets.clear();
            out["deformed_mesh"] = deformed.to_json();
         }
      }
   }

   out["state"] = str(verification.state());
   auto x       = Json::Value{Json::arrayValue};
   for(const auto& e : events) x.append(e.to_json());
   out["events"] = x;

   if(config.print_timing)
      INFO(format("processed {} frames in {:.3f}ms",
                  input.frames.size(),
                  process_s * 1000.0));

   return out;
}

// -------------------------------------------------------------------- run main

int run_main(int argc, char** argv)
{
   bool has_error    = false;
   const auto config = parse_args(argc, argv, has_error);

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   bool success = false;
   try {
      const auto out = run_it(config);
      if(config.out_fname.empty()) {
         cout << str(out) << endl;
         success = true;
      } else {
         const auto ec = file_put_contents(config.out_fname, str(out));
         if(ec)
            LOG_ERR(format("failed to write '{}': {}",
                           config.out_fname,
                           ec.message()));
         else
            INFO(format("output saved to '{:s}'", config.out_fname));
         success = !ec;
      }
   } catch(std::exception& e) {
      LOG_ERR(format("failed: {:s}", e.what()));
   }

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace anthro::measure
