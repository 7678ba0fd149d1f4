#include "stdinc.hpp"

#include "dump-default-params-inc.hpp"

#include "mocap/pipeline/params.hpp"
#include "mocap/utils/cli-utils.hpp"
#include "mocap/utils/file-system.hpp"

namespace mocap::dump_default_params
{
// ---------------------------------------------------------------------- config

struct Config
{
   bool has_error = false;
   bool show_help = false;
   string outfile = ""s; // empty means stdout
};

// -------------------------------------------------------------------- run main

void show_help(string argv0)
{
   cout << format(R"V0G0N(

   Usage: {} dump-default-params [-o <filename>]

      -o <filename>      Save to file instead of stdout.

   Example:

      # Edit, and then pass to 'detect-skeletons -p params.json'
      > {} dump-default-params -o params.json

)V0G0N",
                  basename(argv0),
                  basename(argv0));
}

int run_main(int argc, char** argv)
{
   Config config;
   auto has_error = false;

   // ------------------------------------------------------- Parse command line
   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "-h" || arg == "--help") {
            config.show_help = true;
         } else if(arg == "-o"s) {
            config.outfile = cli::safe_arg_str(argc, argv, i);
         } else {
            cout << format("Unexpected argument: '{}'", arg) << endl;
            has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {}", e.what()) << endl;
         has_error = true;
      }
   }

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   // ------------------------------------------------------------------- Action
   bool success = false;
   try {
      const pipeline::Params defaults;
      string s;
      write(defaults, s);
      if(config.outfile.empty()) {
         cout << s << endl;
      } else {
         save(defaults, config.outfile);
         INFO(format("default parameters saved to '{}'", config.outfile));
      }
      success = true;
   } catch(std::exception& e) {
      LOG_ERR(format("failed: {}", e.what()));
   }

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace mocap::dump_default_params
