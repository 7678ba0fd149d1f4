
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/detector/landmark-detector.hpp"
#include "mocap/detector/landmark-replay.hpp"
#include "mocap/utils/file-system.hpp"

#include <opencv2/core/core.hpp>

namespace mocap
{
static vector<LandmarkSet> make_recording()
{
   vector<LandmarkSet> frames(3);
   frames[0].body = LandmarkSet::landmark_list(size_t(k_n_body_points),
                                               Landmark(0.1f, 0.2f, 0.3f));
   frames[1].left_hand = LandmarkSet::landmark_list(size_t(k_n_hand_points),
                                                    Landmark(0.4f, 0.5f));
   frames[2].face = LandmarkSet::landmark_list{};
   return frames;
}

CATCH_TEST_CASE("landmark-replay", "[landmark_replay]")
{
   const auto tmpd = make_temp_directory("/tmp/replay-tc.XXXXXX");

   CATCH_SECTION("replay-frames-in-order")
   {
      const auto frames = make_recording();
      save_landmark_recording(format("{}/cam0_landmarks.json", tmpd), frames);

      LandmarkReplay replay(tmpd);
      replay.begin_video("/some/session/synchronized_videos/cam0.mp4");
      CATCH_REQUIRE(replay.n_recorded_frames() == 3);

      cv::Mat im;
      for(const auto& expected : frames)
         CATCH_REQUIRE(replay.detect(im) == expected);

      // Past the end of the recording
      CATCH_REQUIRE(replay.detect(im).empty());
      CATCH_REQUIRE(replay.detect(im).empty());

      // Restarts for the next video
      replay.begin_video("cam0.mp4");
      CATCH_REQUIRE(replay.detect(im) == frames[0]);
   }

   CATCH_SECTION("replay-filename")
   {
      CATCH_REQUIRE(LandmarkReplay::replay_filename("/r", "/a/b/cam3.mp4")
                    == "/r/cam3_landmarks.json");
   }

   CATCH_SECTION("missing-recording")
   {
      LandmarkReplay replay(tmpd);
      CATCH_REQUIRE_THROWS_AS(replay.begin_video("cam9.mp4"),
                              std::runtime_error);
   }

   CATCH_SECTION("malformed-recording")
   {
      const auto fname = format("{}/bad_landmarks.json", tmpd);

      CATCH_REQUIRE(!file_put_contents(fname, R"({"nope": []})"));
      CATCH_REQUIRE_THROWS_AS(load_landmark_recording(fname),
                              std::runtime_error);

      CATCH_REQUIRE(!file_put_contents(fname, R"({"frames": [)"));
      CATCH_REQUIRE_THROWS_AS(load_landmark_recording(fname),
                              std::runtime_error);

      CATCH_REQUIRE(
          !file_put_contents(fname, R"({"frames": [{"body": [[1]]}]})"));
      CATCH_REQUIRE_THROWS_AS(load_landmark_recording(fname),
                              std::runtime_error);
   }

   CATCH_SECTION("make-landmark-detector")
   {
      detector::Params p;
      p.backend    = detector::Backend::REPLAY;
      p.replay_dir = tmpd;
      auto det     = make_landmark_detector(p);
      CATCH_REQUIRE(det != nullptr);
      CATCH_REQUIRE(string(det->name()) == "replay");

      if(!k_has_mediapipe) {
         p.backend = detector::Backend::MEDIAPIPE;
         CATCH_REQUIRE_THROWS_AS(make_landmark_detector(p),
                                 std::runtime_error);
      }
   }

   remove_all(tmpd);
}

} // namespace mocap
