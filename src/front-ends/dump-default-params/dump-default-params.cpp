
#include "stdinc.hpp"

#include "dump-default-params-inc.hpp"

#include "anthro/measure/measurement-plan.hpp"
#include "anthro/measure/params.hpp"
#include "anthro/mesh/mesh-metadata.hpp"
#include "anthro/utils/cli-utils.hpp"
#include "anthro/utils/file-system.hpp"

namespace anthro::dump_default_params
{
// ---------------------------------------------------------------------- config

struct Config
{
   bool show_help = false;
   string outdir  = "/tmp"s;
};

// -------------------------------------------------------------------- run main

static void show_help(string argv0)
{
   Config default_config;

   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...]

      Writes 'params.json', 'measurement-plan.json' and 'mesh-metadata.json'.

      -d <dirname>       Directory to save products to. Default is '{:s}'.

   Example:

      > {:s} -d /tmp/anthro

)V0G0N",
                  basename(argv0),
                  default_config.outdir,
                  basename(argv0));
}

static bool save_json(const string& fname, const Json::Value& o) noexcept
{
   const auto ec = file_put_contents(fname, str(o));
   if(ec) {
      LOG_ERR(format("failed to write '{}': {}", fname, ec.message()));
      return false;
   }
   INFO(format("saved '{}'", fname));
   return true;
}

int run_main(int argc, char** argv)
{
   Config config;
   auto has_error = false;

   // ---- Parse command line
   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "-h" || arg == "--help") {
            config.show_help = true;
         } else if(arg == "-d"s) {
            config.outdir = cli::safe_arg_str(argc, argv, i);
         } else {
            cout << format("Unexpected argument: '{}'", arg) << endl;
            has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {:s}", e.what()) << endl;
         has_error = true;
      }
   }

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(!has_error and !is_directory(config.outdir)) {
      cout << format("Failed to find output directory '{:s}'", config.outdir)
           << endl;
      has_error = true;
   }

   if(has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   // ---- Action
   bool success = true;
   success = save_json(format("{}/params.json", config.outdir),
                       Params{}.to_json())
             and success;
   success = save_json(format("{}/measurement-plan.json", config.outdir),
                       default_measurement_plan().to_json())
             and success;
   success = save_json(format("{}/mesh-metadata.json", config.outdir),
                       default_reference_mesh_metadata().to_json())
             and success;

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace anthro::dump_default_params
