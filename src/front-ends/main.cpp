#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>

#include "stdinc.hpp"

#include "mocap/utils/file-system.hpp"

#include "detect-skeletons/detect-skeletons-inc.hpp"
#include "dump-default-params/dump-default-params-inc.hpp"

using namespace mocap;
using namespace std::string_literals;

// ------------------------------------------------------------------------ Runs

static auto make_runs()
{
   std::unordered_map<std::string, std::function<int(int, char**)>> r;
   std::unordered_map<std::string, std::function<std::string()>> b;

#define REGISTER(name, z)            \
   {                                 \
      r[name] = mocap::z ::run_main; \
      b[name] = mocap::z ::brief;    \
   }

   // --------------------------------------------- register -- "main" functions
   REGISTER("detect-skeletons", detect_skeletons);
   REGISTER("dump-default-params", dump_default_params);

#undef REGISTER

   return make_pair(r, b);
}

// ------------------------------------------------------------------- show-help

static void show_help(const char* arg0)
{
   std::unordered_map<std::string, std::function<int(int, char**)>> runs;
   std::unordered_map<std::string, std::function<std::string()>> briefs;

   std::tie(runs, briefs) = make_runs();

   std::vector<std::string> names;
   for(const auto& ii : runs) names.push_back(ii.first);
   std::sort(names.begin(), names.end());

   auto f = [&](const string& s) {
      auto ii        = briefs.find(s);
      std::string bb = ""s;
      if(ii == cend(briefs)) {
         WARN(format("failed to find brief of '{}'", s));
      } else {
         bb = ii->second();
      }
      const int sz = std::max(25 - int(s.size()), 1);
      std::string spaces(size_t(sz), ' ');

      return format("{}{}    {}", s, spaces, bb);
   };

   cout << format(R"V0G0N(

   Usage: {} [-h] <run> [options...]

      Run can be one of:

      {}

   Type `{} <run> -h` for help on a specific run.

)V0G0N",
                  basename(arg0),
                  implode(names.begin(), names.end(), "\n      ", f),
                  basename(arg0));
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

   auto [runs, briefs] = make_runs();

   if(runs.find(arg) == runs.end()) {
      WARN(format("Failed to find run '{}'", arg));
      return EXIT_FAILURE;
   }

   // Init environment variables
   mocap::load_environment_variables();

   // Now "shift" argv[0] to argv[1]
   return runs.find(arg)->second(argc - 1, &argv[1]);
}
