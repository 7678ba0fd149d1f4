
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/detector/landmark-detector.hpp"
#include "mocap/io/npy-io.hpp"
#include "mocap/landmarks/multi-camera-assembler.hpp"
#include "mocap/pipeline/session-pipeline.hpp"
#include "mocap/utils/file-system.hpp"

#include "json/json.h"

#include <opencv2/core/core.hpp>

namespace mocap::pipeline
{
// ------------------------------------------------------------------ FakeSource
//
struct FakeSource final : public FrameSource
{
   int n_frames     = 0;
   int frame_no     = 0;
   bool fail_at_one = false; // first frame cannot be decoded

   FakeSource(int n, bool fail)
       : n_frames(n)
       , fail_at_one(fail)
   {}

   bool read(cv::Mat& im) noexcept(false) override
   {
      if(fail_at_one || frame_no >= n_frames) return false;
      im = cv::Mat(height(), width(), CV_8UC3, cv::Scalar(frame_no, 0, 0));
      ++frame_no;
      return true;
   }

   int width() const noexcept override { return 64; }
   int height() const noexcept override { return 48; }
   real fps() const noexcept override { return 25.0; }
};

// ------------------------------------------------------------- FakeSink(State)
//
struct SinkState
{
   vector<string> opened     = {};
   vector<int> frames_pushed = {};
   vector<real> fps          = {};
   int n_closed              = 0;
   int throw_on_push         = -1; // frame index, or -1
   bool throw_on_open        = false;
};

struct FakeSink final : public FrameSink
{
   shared_ptr<SinkState> state;
   int width  = 0;
   int height = 0;

   void push_frame(const cv::Mat& im) noexcept(false) override
   {
      CATCH_REQUIRE(im.cols == width);
      CATCH_REQUIRE(im.rows == height);
      if(state->frames_pushed.back() == state->throw_on_push)
         throw std::runtime_error("broken pipe");
      state->frames_pushed.back()++;
   }

   int close() noexcept(false) override
   {
      state->n_closed++;
      return 0;
   }
};

// ---------------------------------------------------------------- FakeDetector
//
// Body detected in every frame, at a position derived from the blue channel
// of the frame (which FakeSource sets to the frame number).
struct FakeDetector final : public LandmarkDetector
{
   vector<string> videos = {};
   int n_detects         = 0;
   int skip_frame        = -1; // detect nothing in this frame

   void begin_video(const string_view fname) noexcept(false) override
   {
      videos.push_back(string(fname));
   }

   LandmarkSet detect(const cv::Mat& im) noexcept(false) override
   {
      ++n_detects;
      const int frame_no = int(im.at<cv::Vec3b>(0, 0)[0]);
      LandmarkSet o;
      if(frame_no == skip_frame) return o;
      o.body = vector<Landmark>{};
      for(auto i = 0; i < k_n_body_points; ++i)
         o.body->emplace_back(
             float(i) / 64.0f, float(frame_no) / 64.0f, 0.5f);
      return o;
   }

   const char* name() const noexcept override { return "fake"; }
};

// ----------------------------------------------------------------- TestSession
//
struct TestSession
{
   string data_dir              = ""s;
   SessionPaths paths           = {};
   hashmap<string, int> lengths = {}; // video basename => n-frames
   hashset<string> bad_videos   = {}; // first frame fails to decode
   hashset<string> unopenable   = {};
   shared_ptr<SinkState> sink   = make_shared<SinkState>();

   TestSession()
   {
      data_dir = make_temp_directory("/tmp/session-pipeline-tc.XXXXXX");
      paths    = SessionPaths::make(data_dir, "session_01");
      CATCH_REQUIRE(mkdir_p(paths.synchronized_videos_dir));
   }

   ~TestSession()
   {
      try {
         remove_all(data_dir);
      } catch(std::exception& e) {
         WARN(format("{}", e.what()));
      }
   }

   void add_video(const string& name, int n_frames)
   {
      const auto fname = format("{}/{}", paths.synchronized_videos_dir, name);
      CATCH_REQUIRE(!file_put_contents(fname, "not-a-movie"));
      lengths[name] = n_frames;
   }

   IOFactory make_io()
   {
      IOFactory io;
      io.open_video = [this](string_view fname) -> unique_ptr<FrameSource> {
         const auto name = basename(fname);
         if(unopenable.count(name) > 0) return nullptr;
         return make_unique<FakeSource>(lengths.at(name),
                                        bad_videos.count(name) > 0);
      };
      io.open_sink = [this](string_view fname,
                            int w,
                            int h,
                            real fps) -> unique_ptr<FrameSink> {
         if(sink->throw_on_open) throw std::runtime_error("no ffmpeg");
         sink->opened.push_back(string(fname));
         sink->fps.push_back(fps);
         sink->frames_pushed.push_back(0);
         auto o    = make_unique<FakeSink>();
         o->state  = sink;
         o->width  = w;
         o->height = h;
         return o;
      };
      return io;
   }
};

// ------------------------------------------------------------------ Test Cases
//
CATCH_TEST_CASE("session-paths", "[session_paths]")
{
   CATCH_SECTION("session-paths")
   {
      const auto p = SessionPaths::make("/data", "s1");
      CATCH_REQUIRE(p.session_dir == "/data/s1");
      CATCH_REQUIRE(p.synchronized_videos_dir
                    == "/data/s1/synchronized_videos");
      CATCH_REQUIRE(p.output_data_dir == "/data/s1/output_data");
      CATCH_REQUIRE(p.annotated_videos_dir == "/data/s1/annotated_videos");
      CATCH_REQUIRE(p.data2d_npy()
                    == "/data/s1/output_data/mediapipe_2dData_numCams_"
                       "numFrames_numTrackedPoints_pixelXY.npy");
      CATCH_REQUIRE(p.body_confidence_npy()
                    == "/data/s1/output_data/mediapipe_bodyConfidence_"
                       "numCams_numFrames_numBodyPoints.npy");
      CATCH_REQUIRE(p.summary_json()
                    == "/data/s1/output_data/mediapipe_2dData_summary.json");
      CATCH_REQUIRE(p.annotated_video_fname("/x/cam0.mp4")
                    == "/data/s1/annotated_videos/cam0_mediapipe.mp4");
   }
}

CATCH_TEST_CASE("session-pipeline", "[session_pipeline]")
{
   TestSession session;
   FakeDetector detector;
   Params params;

   CATCH_SECTION("two-cameras")
   {
      session.add_video("cam1.mp4", 5);
      session.add_video("cam0.mp4", 5);
      session.add_video("notes.txt", 0);
      detector.skip_frame = 3;

      const auto result = process_session(
          session.paths, detector, params, session.make_io());

      // Filename order
      CATCH_REQUIRE(result.n_cameras() == 2);
      CATCH_REQUIRE(basename(result.video_fnames[0]) == "cam0.mp4");
      CATCH_REQUIRE(basename(result.video_fnames[1]) == "cam1.mp4");
      CATCH_REQUIRE(detector.videos == result.video_fnames);
      CATCH_REQUIRE(detector.n_detects == 10);

      CATCH_REQUIRE(result.data2d.shape()
                    == DenseArray<4>::shape_type{2, 5, 553, 2});
      CATCH_REQUIRE(result.body_confidence.shape()
                    == DenseArray<3>::shape_type{2, 5, 33});

      // Pixel coordinates, and the skipped frame
      CATCH_REQUIRE(result.data2d(1, 2, 32, 0) == (32.0 / 64.0) * 64);
      CATCH_REQUIRE(result.data2d(1, 2, 32, 1) == (2.0 / 64.0) * 48);
      CATCH_REQUIRE(std::isnan(result.data2d(0, 3, 0, 0)));
      CATCH_REQUIRE(std::isnan(result.data2d(0, 2, 100, 0)));

      // Saved arrays
      const auto data2d = load_npy<4>(session.paths.data2d_npy());
      CATCH_REQUIRE(data2d.bit_equal(result.data2d));
      const auto conf = load_npy<3>(session.paths.body_confidence_npy());
      CATCH_REQUIRE(conf.bit_equal(result.body_confidence));

      // Summary
      const auto summary
          = parse_json(file_get_contents(session.paths.summary_json()));
      CATCH_REQUIRE(summary["session_id"].asString() == "session_01");
      CATCH_REQUIRE(summary["assignment_policy"].asString() == "PER_POINT");
      CATCH_REQUIRE(summary["data2d_shape"].size() == 4);
      CATCH_REQUIRE(summary["data2d_shape"][2].asInt() == 553);
      const auto& cameras = summary["cameras"];
      CATCH_REQUIRE(cameras.size() == 2);
      CATCH_REQUIRE(cameras[0]["video"].asString() == "cam0.mp4");
      CATCH_REQUIRE(cameras[1]["image_width"].asInt() == 64);
      CATCH_REQUIRE(cameras[1]["image_height"].asInt() == 48);
      CATCH_REQUIRE(cameras[0]["visible_frames"]["body"].asInt() == 4);
      CATCH_REQUIRE(cameras[0]["visible_frames"]["face"].asInt() == 0);
      CATCH_REQUIRE(cameras[0]["visible_frames"]["all"].asInt() == 0);

      // Annotated videos
      CATCH_REQUIRE(session.sink->opened.size() == 2);
      CATCH_REQUIRE(session.sink->opened[0]
                    == session.paths.annotated_video_fname("cam0.mp4"));
      CATCH_REQUIRE(session.sink->frames_pushed == vector<int>{5, 5});
      CATCH_REQUIRE(session.sink->fps == vector<real>{30.0, 30.0});
      CATCH_REQUIRE(session.sink->n_closed == 2);
      CATCH_REQUIRE(is_directory(session.paths.annotated_videos_dir));
   }

   CATCH_SECTION("failing-sink-does-not-stop-extraction")
   {
      session.add_video("cam0.mp4", 6);
      session.add_video("cam1.mp4", 6);
      session.sink->throw_on_push = 2;

      const auto result = process_session(
          session.paths, detector, params, session.make_io());

      CATCH_REQUIRE(session.sink->frames_pushed == vector<int>{2, 2});
      CATCH_REQUIRE(session.sink->n_closed == 0);
      CATCH_REQUIRE(result.data2d.shape(1) == 6);
      CATCH_REQUIRE(!std::isnan(result.data2d(1, 5, 0, 0)));
      CATCH_REQUIRE(is_regular_file(session.paths.data2d_npy()));
      CATCH_REQUIRE(is_regular_file(session.paths.body_confidence_npy()));
   }

   CATCH_SECTION("sink-creation-failure")
   {
      session.add_video("cam0.mp4", 3);
      session.sink->throw_on_open = true;

      const auto result = process_session(
          session.paths, detector, params, session.make_io());
      CATCH_REQUIRE(session.sink->opened.empty());
      CATCH_REQUIRE(result.data2d.shape(1) == 3);
      CATCH_REQUIRE(is_regular_file(session.paths.data2d_npy()));
   }

   CATCH_SECTION("annotated-fps-from-source")
   {
      session.add_video("cam0.mp4", 3);
      params.annotated_video_fps = 0.0;

      process_session(session.paths, detector, params, session.make_io());
      CATCH_REQUIRE(session.sink->fps == vector<real>{25.0});
      CATCH_REQUIRE(session.sink->frames_pushed == vector<int>{3});
   }

   CATCH_SECTION("ffmpeg-exits-early")
   {
      // An `ffmpeg` on PATH that exits before reading any frames
      const auto bin_dir = format("{}/bin", session.data_dir);
      const auto exe     = format("{}/ffmpeg", bin_dir);
      CATCH_REQUIRE(mkdir_p(bin_dir));
      CATCH_REQUIRE(!file_put_contents(exe, "#!/bin/sh\nexit 1\n"));
      std::filesystem::permissions(exe,
                                   std::filesystem::perms::owner_all,
                                   std::filesystem::perm_options::add);

      const char* old_path = std::getenv("PATH");
      const string saved   = (old_path == nullptr) ? ""s : string(old_path);
      setenv("PATH", format("{}:{}", bin_dir, saved).c_str(), 1);

      // Frames large enough to overflow the pipe buffer
      session.add_video("cam0.mp4", 40);
      auto io      = session.make_io();
      io.open_sink = IOFactory::make_default().open_sink;

      SessionResult result;
      try {
         result = process_session(session.paths, detector, params, io);
      } catch(...) {
         setenv("PATH", saved.c_str(), 1);
         throw;
      }
      setenv("PATH", saved.c_str(), 1);

      CATCH_REQUIRE(result.data2d.shape(1) == 40);
      CATCH_REQUIRE(is_regular_file(session.paths.data2d_npy()));
      const auto data2d = load_npy<4>(session.paths.data2d_npy());
      CATCH_REQUIRE(data2d.bit_equal(result.data2d));
   }

   CATCH_SECTION("no-annotated-videos")
   {
      session.add_video("cam0.mp4", 3);
      params.save_annotated_videos = false;
      params.save_body_confidence  = false;

      const auto result = process_session(
          session.paths, detector, params, session.make_io());
      CATCH_REQUIRE(session.sink->opened.empty());
      CATCH_REQUIRE(result.body_confidence.empty());
      CATCH_REQUIRE(is_regular_file(session.paths.data2d_npy()));
      CATCH_REQUIRE(!is_regular_file(session.paths.body_confidence_npy()));

      const auto summary
          = parse_json(file_get_contents(session.paths.summary_json()));
      CATCH_REQUIRE(summary["body_confidence_shape"].isNull());
   }

   CATCH_SECTION("legacy-broadcast")
   {
      session.add_video("cam0.mp4", 2);
      params.legacy_broadcast_last_landmark = true;

      const auto result = process_session(
          session.paths, detector, params, session.make_io());
      const auto last_x = (32.0 / 64.0) * 64;
      for(auto k = 0; k < k_n_body_points; ++k)
         CATCH_REQUIRE(result.data2d(0, 1, k, 0) == last_x);

      const auto summary
          = parse_json(file_get_contents(session.paths.summary_json()));
      CATCH_REQUIRE(summary["assignment_policy"].asString()
                    == "LEGACY_BROADCAST_LAST");
   }

   CATCH_SECTION("first-frame-failure")
   {
      session.add_video("cam0.mp4", 3);
      session.add_video("cam1.mp4", 3);
      session.bad_videos.insert("cam1.mp4");

      CATCH_REQUIRE_THROWS_AS(
          process_session(session.paths, detector, params, session.make_io()),
          FatalIOError);
      CATCH_REQUIRE(!is_regular_file(session.paths.data2d_npy()));
   }

   CATCH_SECTION("cannot-open-video")
   {
      session.add_video("cam0.mp4", 3);
      session.unopenable.insert("cam0.mp4");

      CATCH_REQUIRE_THROWS_AS(
          process_session(session.paths, detector, params, session.make_io()),
          FatalIOError);
      CATCH_REQUIRE(detector.videos.empty());
   }

   CATCH_SECTION("empty-session")
   {
      session.add_video("cam0.avi", 3);
      CATCH_REQUIRE_THROWS_AS(
          process_session(session.paths, detector, params, session.make_io()),
          FatalIOError);

      const auto missing = SessionPaths::make(session.data_dir, "no-such");
      CATCH_REQUIRE_THROWS_AS(
          process_session(missing, detector, params, session.make_io()),
          FatalIOError);
   }

   CATCH_SECTION("camera-length-mismatch")
   {
      session.add_video("cam0.mp4", 10);
      session.add_video("cam1.mp4", 9);

      try {
         process_session(session.paths, detector, params, session.make_io());
         CATCH_REQUIRE(false);
      } catch(ShapeMismatch& e) {
         CATCH_REQUIRE(e.camera_index() == 1);
         CATCH_REQUIRE(e.expected()[0] == 10);
         CATCH_REQUIRE(e.actual()[0] == 9);
      }
   }

   CATCH_SECTION("process-video")
   {
      session.add_video("cam0.mp4", 4);
      const auto fname
          = format("{}/cam0.mp4", session.paths.synchronized_videos_dir);

      const auto arrays
          = process_video(fname, "", detector, params, session.make_io());
      CATCH_REQUIRE(arrays.n_frames() == 4);
      CATCH_REQUIRE(arrays.image_width == 64);
      CATCH_REQUIRE(arrays.image_height == 48);
      CATCH_REQUIRE(session.sink->opened.empty());
      CATCH_REQUIRE(!std::isnan(arrays.body_confidence(3, 0)));
   }
}

} // namespace mocap::pipeline
