
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/detector/params.hpp"
#include "mocap/pipeline/cli-args.hpp"
#include "mocap/pipeline/params.hpp"

namespace mocap
{
template<typename T> static void test_eq(const T& u, const Json::Value& o)
{
   T v, z;
   v.read_with_defaults(o, &z);
   CATCH_REQUIRE(u == v);
}

template<typename T> static void test_it_eq()
{
   T u;
   Json::Value packed        = u.to_json();
   const vector<string> keys = packed.getMemberNames();
   for(auto i = 0u; i < keys.size(); i += 2) packed.removeMember(keys[i]);
   test_eq<T>(u, packed);
}

template<typename T> static void test_read_eq()
{
   T u, v;
   Json::Value packed        = u.to_json();
   const vector<string> keys = packed.getMemberNames();
   for(auto i = 0u; i < keys.size(); ++i) {
      Json::Value p2 = packed;
      p2.removeMember(keys[i]);
      read(v, p2);
      CATCH_REQUIRE(u == v);
   }
   test_it_eq<T>();
}

CATCH_TEST_CASE("STRUCT-META", "[struct_meta]")
{
   CATCH_SECTION("struct-meta_detector-params")
   {
      detector::Params p, q;
      p.backend                 = detector::Backend::REPLAY;
      p.replay_dir              = "/tmp/recordings"s;
      p.model_complexity        = 1;
      p.refine_face_landmarks   = !p.refine_face_landmarks;
      p.min_tracking_confidence = 0.75;
      const auto s              = p.to_json_string();
      q.read(parse_json(s));
      CATCH_REQUIRE(p == q);
      CATCH_REQUIRE(q.backend == detector::Backend::REPLAY);
      CATCH_REQUIRE(q.min_detection_confidence == 0.5);
      CATCH_REQUIRE(q.min_tracking_confidence == 0.75);

      const auto o = p.to_json();
      CATCH_REQUIRE(o["backend"].asString() == "replay");
      CATCH_REQUIRE(o["min_tracking_confidence"].asDouble() == 0.75);
   }

   CATCH_SECTION("struct-meta_pipeline-params")
   {
      pipeline::Params p, q;
      p.detector_params.backend        = detector::Backend::REPLAY;
      p.detector_params.graph_config   = "holistic.pbtxt"s;
      p.save_annotated_videos          = false;
      p.annotated_video_fps            = 25.0;
      p.video_extension                = ".MOV"s;
      p.legacy_broadcast_last_landmark = true;
      p.save_body_confidence           = false;

      string s;
      write(p, s);
      read(q, s);
      CATCH_REQUIRE(p == q);
      CATCH_REQUIRE(q.detector_params.graph_config == "holistic.pbtxt");
      CATCH_REQUIRE(q.assignment_policy()
                    == LandmarkAssignment::LEGACY_BROADCAST_LAST);

      q.detector_params.model_complexity = 0;
      CATCH_REQUIRE(p != q);
   }

   CATCH_SECTION("struct-meta_feedback-not-in-eq")
   {
      pipeline::Params p, q;
      q.feedback                 = true;
      q.detector_params.feedback = true;
      CATCH_REQUIRE(p == q);
   }

   CATCH_SECTION("struct-meta_nested-partial")
   {
      // Missing nested keys are filled from defaults
      const auto o = parse_json(
          R"({"detector_params": {"backend": "REPLAY"}, "feedback": true})");
      pipeline::Params p;
      read(p, o);
      CATCH_REQUIRE(p.detector_params.backend == detector::Backend::REPLAY);
      CATCH_REQUIRE(p.detector_params.model_complexity == 2);
      CATCH_REQUIRE(p.detector_params.min_detection_confidence == 0.5);
      CATCH_REQUIRE(p.feedback == true);
      CATCH_REQUIRE(p.annotated_video_fps == 30.0);
      CATCH_REQUIRE(p.video_extension == ".mp4");
   }

   CATCH_SECTION("struct-meta_bad-values-use-defaults")
   {
      const auto o = parse_json(
          R"({"backend": "openpose", "model_complexity": "high"})");
      detector::Params p, defaults;
      read(p, o);
      CATCH_REQUIRE(p == defaults);
   }

   CATCH_SECTION("struct-meta_read-requires-all-keys")
   {
      detector::Params p;
      Json::Value o = p.to_json();
      o.removeMember("replay_dir");
      CATCH_REQUIRE_THROWS_AS(p.read(o), std::runtime_error);
   }

   CATCH_SECTION("struct-meta")
   {
      test_read_eq<detector::Params>();
      test_read_eq<pipeline::Params>();
      test_read_eq<pipeline::CliArgs>();
   }
}

} // namespace mocap
