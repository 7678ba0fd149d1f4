
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/pipeline/cli-args.hpp"
#include "mocap/utils/file-system.hpp"

namespace mocap::pipeline
{
// argv-style view over a list of strings
struct Argv
{
   vector<string> args;
   vector<char*> ptrs;

   Argv(std::initializer_list<string> l)
       : args(l)
   {
      for(auto& s : args) ptrs.push_back(&s[0]);
      ptrs.push_back(nullptr);
   }

   int argc() const noexcept { return int(args.size()); }
   char** argv() noexcept { return ptrs.data(); }
};

static CliArgs parse(Argv&& a)
{
   return parse_command_line(a.argc(), a.argv());
}

CATCH_TEST_CASE("cli-args", "[cli_args]")
{
   CATCH_SECTION("help")
   {
      const auto config = parse({"detect-skeletons", "-s", "x", "--help"});
      CATCH_REQUIRE(config.show_help);
   }

   CATCH_SECTION("defaults")
   {
      const auto config = parse({"detect-skeletons", "-s", "session_01"});
      CATCH_REQUIRE(!config.has_error);
      CATCH_REQUIRE(config.session_id == "session_01");
      CATCH_REQUIRE(config.data_dir == "");
      CATCH_REQUIRE(config.params == Params{});
   }

   CATCH_SECTION("session-is-required")
   {
      CATCH_REQUIRE(parse({"detect-skeletons"}).has_error);
      CATCH_REQUIRE(parse({"detect-skeletons", "-s"}).has_error);
   }

   CATCH_SECTION("unknown-argument")
   {
      CATCH_REQUIRE(parse({"detect-skeletons", "-s", "a", "--frobnicate"})
                        .has_error);
   }

   CATCH_SECTION("overrides")
   {
      const auto config = parse({"detect-skeletons",
                                 "-s",
                                 "s2",
                                 "--data-dir",
                                 "/tmp",
                                 "--backend",
                                 "replay",
                                 "--replay-dir",
                                 "/tmp",
                                 "--graph",
                                 "holistic.pbtxt",
                                 "--fps",
                                 "59.94",
                                 "--no-annotated-videos",
                                 "--legacy-broadcast"});
      CATCH_REQUIRE(!config.has_error);
      CATCH_REQUIRE(config.data_dir == "/tmp");

      const auto& p = config.params;
      CATCH_REQUIRE(p.detector_params.backend == detector::Backend::REPLAY);
      CATCH_REQUIRE(p.detector_params.replay_dir == "/tmp");
      CATCH_REQUIRE(p.detector_params.graph_config == "holistic.pbtxt");
      CATCH_REQUIRE(p.annotated_video_fps == 59.94);
      CATCH_REQUIRE(!p.save_annotated_videos);
      CATCH_REQUIRE(p.legacy_broadcast_last_landmark);
      CATCH_REQUIRE(p.assignment_policy()
                    == LandmarkAssignment::LEGACY_BROADCAST_LAST);
   }

   CATCH_SECTION("bad-values")
   {
      CATCH_REQUIRE(
          parse({"detect-skeletons", "-s", "a", "--backend", "openpose"})
              .has_error);
      CATCH_REQUIRE(
          parse({"detect-skeletons", "-s", "a", "--data-dir", "/no/such/dir"})
              .has_error);
      CATCH_REQUIRE(
          parse({"detect-skeletons", "-s", "a", "--p-json", "{not json"})
              .has_error);
      CATCH_REQUIRE(parse({"detect-skeletons",
                           "-s",
                           "a",
                           "--p-json",
                           R"({"annotated_video_fps": 0.0})"})
                        .has_error);
      CATCH_REQUIRE(
          parse({"detect-skeletons", "-s", "a", "--fps", "fast"}).has_error);
      CATCH_REQUIRE(
          parse({"detect-skeletons", "-s", "a", "--fps", "-5"}).has_error);
      CATCH_REQUIRE(parse({"detect-skeletons", "-s", "a", "--fps"}).has_error);
   }

   CATCH_SECTION("params-json-string")
   {
      const auto config
          = parse({"detect-skeletons",
                   "-s",
                   "a",
                   "--p-json",
                   R"({"video_extension": ".avi",
                       "detector_params": {"backend": "replay",
                                           "model_complexity": 1}})",
                   "--legacy-broadcast"});
      CATCH_REQUIRE(!config.has_error);
      CATCH_REQUIRE(config.params.video_extension == ".avi");
      CATCH_REQUIRE(config.params.annotated_video_fps == 30.0);
      CATCH_REQUIRE(config.params.detector_params.model_complexity == 1);
      CATCH_REQUIRE(config.params.legacy_broadcast_last_landmark);
   }

   CATCH_SECTION("params-file")
   {
      const auto tmpd  = make_temp_directory("/tmp/cli-args-tc.XXXXXX");
      const auto fname = format("{}/params.json", tmpd);

      Params p;
      p.detector_params.backend = detector::Backend::REPLAY;
      p.annotated_video_fps     = 60.0;
      save(p, fname);

      const auto config = parse({"detect-skeletons", "-s", "a", "-p", fname});
      CATCH_REQUIRE(!config.has_error);
      CATCH_REQUIRE(config.params == p);

      CATCH_REQUIRE(
          parse({"detect-skeletons", "-s", "a", "-p", fname + ".missing"})
              .has_error);
      CATCH_REQUIRE(parse({"detect-skeletons",
                           "-s",
                           "a",
                           "-p",
                           fname,
                           "--p-json",
                           "{}"})
                        .has_error);

      remove_all(tmpd);
   }

   CATCH_SECTION("callback")
   {
      int verbosity = 0;
      Argv a{"detect-skeletons", "-v", "-s", "a", "-v"};
      const auto config = parse_command_line(
          a.argc(), a.argv(), [&](int, char** argv, int& i) {
             if(strcmp(argv[i], "-v") != 0) return false;
             ++verbosity;
             return true;
          });
      CATCH_REQUIRE(!config.has_error);
      CATCH_REQUIRE(verbosity == 2);
   }
}

} // namespace mocap::pipeline
