#pragma once

#include "params.hpp"
#include "session-paths.hpp"

#include "mocap/landmarks/per-camera-arrays.hpp"
#include "mocap/landmarks/visibility.hpp"
#include "mocap/movie/frame-io.hpp"

#include <stdexcept>

namespace Json
{
class Value;
}

namespace mocap
{
class LandmarkDetector;

// ---------------------------------------------------------------- FatalIOError
//
// A video could not be opened or decoded, or the session has no videos.
class FatalIOError final : public std::runtime_error
{
 public:
   using std::runtime_error::runtime_error;
};

} // namespace mocap

namespace mocap::pipeline
{
// ------------------------------------------------------------------- IOFactory
//
// Opens video sources and annotated-video sinks. A source opener returns
// nullptr (or throws) if the video cannot be opened.
struct IOFactory final
{
   using VideoOpener
       = std::function<unique_ptr<FrameSource>(const string_view fname)>;
   using SinkOpener = std::function<unique_ptr<FrameSink>(
       const string_view fname, int width, int height, real fps)>;

   VideoOpener open_video = nullptr;
   SinkOpener open_sink   = nullptr;

   // MovieReader and StreamingFFMpegEncoder
   static IOFactory make_default() noexcept;
};

// --------------------------------------------------------------- SessionResult
//
struct SessionResult final
{
   SessionPaths paths                 = {};
   vector<string> video_fnames        = {}; // camera order
   vector<PerCameraArrays> cameras    = {};
   vector<VisibilityFlags> visibility = {};
   DenseArray<4> data2d               = {}; // [cameras, frames, 553, 2]
   DenseArray<3> body_confidence      = {}; // [cameras, frames, 33]
   real seconds                       = 0.0;

   size_t n_cameras() const noexcept { return cameras.size(); }
};

// Runs `detector` over every frame of one video. When `annotated_fname` is
// non-empty, the frames are also rendered with their landmarks and encoded
// there. Annotation failures are logged and never abort extraction.
// Throws FatalIOError if the video cannot be opened, or its first frame
// cannot be decoded.
PerCameraArrays process_video(const string_view video_fname,
                              const string_view annotated_fname,
                              LandmarkDetector& detector,
                              const Params& params,
                              const IOFactory& io) noexcept(false);

// Processes every video in `paths.synchronized_videos_dir`, in filename order,
// and saves the stacked arrays and summary to `paths.output_data_dir`.
// Throws FatalIOError, ShapeMismatch, or std::runtime_error.
SessionResult
process_session(const SessionPaths& paths,
                LandmarkDetector& detector,
                const Params& params,
                const IOFactory& io
                = IOFactory::make_default()) noexcept(false);

// Video names, array shapes, image sizes, assignment policy, and per-camera
// visible-frame counts.
Json::Value make_session_summary(const SessionResult& result,
                                 const Params& params) noexcept;

} // namespace mocap::pipeline
