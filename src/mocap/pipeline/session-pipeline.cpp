#include "stdinc.hpp"

#include "session-pipeline.hpp"

#include "mocap/detector/landmark-detector.hpp"
#include "mocap/io/json-io.hpp"
#include "mocap/io/npy-io.hpp"
#include "mocap/landmarks/camera-aggregator.hpp"
#include "mocap/landmarks/multi-camera-assembler.hpp"
#include "mocap/movie/ffmpeg.hpp"
#include "mocap/movie/movie-reader.hpp"
#include "mocap/movie/render-landmarks.hpp"
#include "mocap/utils/file-system.hpp"

#include "json/json.h"

#include <opencv2/core/core.hpp>

namespace mocap::pipeline
{
// ---------------------------------------------------------------- make-default
//
IOFactory IOFactory::make_default() noexcept
{
   IOFactory io;
   io.open_video = [](const string_view fname) -> unique_ptr<FrameSource> {
      auto reader = make_unique<MovieReader>();
      if(!reader->open(fname)) return nullptr;
      return reader;
   };
   io.open_sink = [](const string_view fname,
                     int w,
                     int h,
                     real fps) -> unique_ptr<FrameSink> {
      return make_unique<movie::StreamingFFMpegEncoder>(
          movie::StreamingFFMpegEncoder::create(fname, w, h, fps));
   };
   return io;
}

// ------------------------------------------------------------- AnnotatedOutput
//
// Wraps a FrameSink so that the first failure is logged, and the sink is
// dropped for the rest of the video.
namespace
{
   struct AnnotatedOutput
   {
      string fname               = ""s;
      unique_ptr<FrameSink> sink = nullptr;

      void open(const IOFactory& io, int w, int h, real fps) noexcept
      {
         if(fname.empty() || !io.open_sink) return;
         try {
            sink = io.open_sink(fname, w, h, fps);
         } catch(std::exception& e) {
            WARN(format("failed to create annotated video '{}': {}",
                        fname,
                        e.what()));
            sink.reset();
         }
      }

      void push(const cv::Mat& im, const LandmarkSet& landmarks) noexcept
      {
         if(!sink) return;
         try {
            cv::Mat canvas = im.clone();
            render_landmarks(canvas, landmarks);
            sink->push_frame(canvas);
         } catch(std::exception& e) {
            WARN(format("failed to write frame to annotated video '{}': {}; "
                        "annotation disabled for this video",
                        fname,
                        e.what()));
            sink.reset();
         }
      }

      void close() noexcept
      {
         if(!sink) return;
         try {
            const int ret = sink->close();
            if(ret != 0)
               WARN(format(
                   "encoder for '{}' exited with code {}", fname, ret));
         } catch(std::exception& e) {
            WARN(format("failed to finalize annotated video '{}': {}",
                        fname,
                        e.what()));
         }
         sink.reset();
      }
   };
} // namespace

// --------------------------------------------------------------- process-video
//
PerCameraArrays process_video(const string_view video_fname,
                              const string_view annotated_fname,
                              LandmarkDetector& detector,
                              const Params& params,
                              const IOFactory& io) noexcept(false)
{
   Expects(io.open_video);

   unique_ptr<FrameSource> source;
   try {
      source = io.open_video(video_fname);
   } catch(std::exception& e) {
      throw FatalIOError(
          format("failed to open video '{}': {}", video_fname, e.what()));
   }
   if(source == nullptr)
      throw FatalIOError(format("failed to open video '{}'", video_fname));

   detector.begin_video(video_fname);

   cv::Mat im;
   if(!source->read(im) || im.empty())
      throw FatalIOError(
          format("failed to decode first frame of '{}'", video_fname));

   const int w = im.cols;
   const int h = im.rows;
   if(source->width() != w || source->height() != h)
      WARN(format("'{}': container reports {}x{}, but frames decode as {}x{}",
                  basename(video_fname),
                  source->width(),
                  source->height(),
                  w,
                  h));

   // Non-positive annotated_video_fps means "same as the source video"
   const real fps = (params.annotated_video_fps > 0.0)
                        ? params.annotated_video_fps
                        : source->fps();

   AnnotatedOutput annotated;
   annotated.fname = string(annotated_fname);
   annotated.open(io, w, h, fps);

   vector<LandmarkSet> frames;
   do {
      frames.push_back(detector.detect(im));
      annotated.push(im, frames.back());
      TRACE(format("'{}' frame {}", basename(video_fname), frames.size() - 1));
   } while(source->read(im) && !im.empty());

   annotated.close();

   if(params.feedback)
      INFO(format("'{}': {} frames of {}x{} with detector '{}'",
                  basename(video_fname),
                  frames.size(),
                  w,
                  h,
                  detector.name()));

   return aggregate_camera(frames, w, h, params.assignment_policy());
}

// ------------------------------------------------------------- process-session
//
SessionResult process_session(const SessionPaths& paths,
                              LandmarkDetector& detector,
                              const Params& params,
                              const IOFactory& io) noexcept(false)
{
   const auto now = tick();

   SessionResult result;
   result.paths = paths;

   if(!is_directory(paths.synchronized_videos_dir))
      throw FatalIOError(format("synchronized videos directory '{}' not found",
                                paths.synchronized_videos_dir));

   try {
      result.video_fnames = list_directory_files(paths.synchronized_videos_dir,
                                                 params.video_extension);
   } catch(std::runtime_error& e) {
      throw FatalIOError(e.what());
   }

   if(result.video_fnames.empty())
      throw FatalIOError(format("no '{}' videos found in '{}'",
                                params.video_extension,
                                paths.synchronized_videos_dir));

   if(!mkdir_p(paths.output_data_dir))
      throw FatalIOError(format("failed to create output directory '{}'",
                                paths.output_data_dir));

   bool save_annotated = params.save_annotated_videos;
   if(save_annotated && !mkdir_p(paths.annotated_videos_dir)) {
      WARN(format("failed to create directory '{}', annotated videos disabled",
                  paths.annotated_videos_dir));
      save_annotated = false;
   }

   const auto n_cameras = result.video_fnames.size();
   result.cameras.reserve(n_cameras);
   result.visibility.reserve(n_cameras);
   for(size_t i = 0; i < n_cameras; ++i) {
      const auto& fname = result.video_fnames[i];
      INFO(format("camera {} of {}: '{}'", i + 1, n_cameras, basename(fname)));
      const auto annotated_fname
          = save_annotated ? paths.annotated_video_fname(fname) : ""s;
      result.cameras.push_back(
          process_video(fname, annotated_fname, detector, params, io));
      result.visibility.push_back(calc_visibility_flags(result.cameras.back()));
   }

   result.data2d = assemble_multi_camera(result.cameras);
   save_npy(paths.data2d_npy(), result.data2d);
   INFO(format("saved {} array to '{}'",
               str(result.data2d.shape()),
               paths.data2d_npy()));

   if(params.save_body_confidence) {
      result.body_confidence = assemble_body_confidence(result.cameras);
      save_npy(paths.body_confidence_npy(), result.body_confidence);
      INFO(format("saved {} array to '{}'",
                  str(result.body_confidence.shape()),
                  paths.body_confidence_npy()));
   }

   result.seconds = tock(now);

   {
      std::stringstream ss{""};
      ss << make_session_summary(result, params);
      const auto ec = file_put_contents(paths.summary_json(), ss.str());
      if(ec)
         throw std::runtime_error(format(
             "failed to write '{}': {}", paths.summary_json(), ec.message()));
   }

   INFO(format(
       "session '{}' processed in {}s", paths.session_id, result.seconds));

   return result;
}

// -------------------------------------------------------- make-session-summary
//
Json::Value make_session_summary(const SessionResult& result,
                                 const Params& params) noexcept
{
   auto shape_to_json = [](const auto& shape) {
      Json::Value a{Json::arrayValue};
      for(const auto x : shape) a.append(Json::UInt64(x));
      return a;
   };

   Json::Value o{Json::objectValue};
   o["session_id"]        = result.paths.session_id;
   o["assignment_policy"] = str(params.assignment_policy());
   o["data2d_shape"]      = shape_to_json(result.data2d.shape());
   o["body_confidence_shape"]
       = params.save_body_confidence
             ? shape_to_json(result.body_confidence.shape())
             : Json::Value{Json::nullValue};
   o["n_tracked_points"] = k_n_tracked_points;
   o["seconds"]          = result.seconds;

   Json::Value cameras{Json::arrayValue};
   for(size_t i = 0; i < result.n_cameras(); ++i) {
      const auto& arrays = result.cameras[i];
      Json::Value c{Json::objectValue};
      c["video"]        = basename(result.video_fnames[i]);
      c["image_width"]  = arrays.image_width;
      c["image_height"] = arrays.image_height;
      c["n_frames"]     = Json::UInt64(arrays.n_frames());

      Json::Value visible{Json::objectValue};
      if(i < result.visibility.size()) {
         const auto& flags = result.visibility[i];
         for(const auto part : k_body_parts)
            visible[str(part)]
                = Json::UInt64(count_visible_frames(flags, part));
         visible["all"] = Json::UInt64(count_visible_frames(flags));
      }
      c["visible_frames"] = visible;
      cameras.append(c);
   }
   o["cameras"] = cameras;

   return o;
}

} // namespace mocap::pipeline
