
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>

#include "stdinc.hpp"

#include "anthro/utils/file-system.hpp"

#include "dump-default-params/dump-default-params-inc.hpp"
#include "measure/measure-inc.hpp"

using namespace anthro;
using namespace std::string_literals;

// ------------------------------------------------------------------------ Runs

static auto make_runs()
{
   std::unordered_map<std::string, std::function<int(int, char**)>> r;
   std::unordered_map<std::string, std::function<std::string()>> b;

#define REGISTER(z)                 \
   {                                \
      r[#z] = anthro::z ::run_main; \
      b[#z] = anthro::z ::brief;    \
   }

   REGISTER(measure);
   REGISTER(dump_default_params);

#undef REGISTER

   return make_pair(r, b);
}

// ------------------------------------------------------------------- show-help

static void show_help(const char* arg0)
{
   auto [runs, briefs] = make_runs();

   std::vector<std::string> names;
   for(const auto& ii : runs) names.push_back(ii.first);
   std::sort(names.begin(), names.end());

   auto f = [&](const string& s) {
      auto ii        = briefs.find(s);
      std::string bb = ""s;
      if(ii == cend(briefs)) {
         WARN(format("failed to find brief of '{:s}'", s));
      } else {
         bb = ii->second();
      }
      const int sz = std::max(1, 25 - int(s.size()));
      std::string spaces(size_t(sz), ' ');

      return format("{:s}{:s}    {:s}", s, spaces, bb);
   };

   cout << format(R"V0G0N(

   Usage: {:s} [-h] [--version] <run> [OPTIONS...]

      Run can be one of:

      {:s}

)V0G0N",
                  basename(arg0),
                  implode(names.begin(), names.end(), "\n      ", f));
}

// ------------------------------------------------------------------------ main

int main(int argc, char** argv)
{
   if(argc < 2) {
      cout << "Type -h for help" << endl;
      return EXIT_FAILURE;
   }

   const std::string arg = argv[1];
   if(arg == "--help"s || arg == "-h") {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   // Init environment variables
   load_environment_variables();

   if(arg == "--version"s) {
      cout << environment_info() << endl;
      return EXIT_SUCCESS;
   }

   auto [runs, briefs] = make_runs();

   // Run names use '-' on the command line
   string name = arg;
   std::replace(begin(name), end(name), '-', '_');

   auto ii = runs.find(name);
   if(ii == runs.end()) {
      WARN(format("Failed to find run '{:s}'", arg));
      return EXIT_FAILURE;
   }

   // Now "shift" argv[0] to argv[1]
   return ii->second(argc - 1, &argv[1]);
}
