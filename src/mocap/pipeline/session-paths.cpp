#include "session-paths.hpp"

#include "mocap/utils/file-system.hpp"

#define This SessionPaths

namespace mocap::pipeline
{
static constexpr const char* k_data2d_fname
    = "mediapipe_2dData_numCams_numFrames_numTrackedPoints_pixelXY.npy";
static constexpr const char* k_body_confidence_fname
    = "mediapipe_bodyConfidence_numCams_numFrames_numBodyPoints.npy";
static constexpr const char* k_summary_fname = "mediapipe_2dData_summary.json";

// ------------------------------------------------------------------------ make
//
This This::make(const string_view data_dir,
                const string_view session_id) noexcept
{
   SessionPaths o;
   o.session_id              = string(session_id);
   o.session_dir             = format("{}/{}", data_dir, session_id);
   o.synchronized_videos_dir = format("{}/synchronized_videos", o.session_dir);
   o.output_data_dir         = format("{}/output_data", o.session_dir);
   o.annotated_videos_dir    = format("{}/annotated_videos", o.session_dir);
   return o;
}

// ------------------------------------------------------------------- artifacts
//
string This::data2d_npy() const noexcept
{
   return format("{}/{}", output_data_dir, k_data2d_fname);
}

string This::body_confidence_npy() const noexcept
{
   return format("{}/{}", output_data_dir, k_body_confidence_fname);
}

string This::summary_json() const noexcept
{
   return format("{}/{}", output_data_dir, k_summary_fname);
}

string This::annotated_video_fname(const string_view video_fname) const
    noexcept
{
   return format("{}/{}_mediapipe.mp4",
                 annotated_videos_dir,
                 basename(video_fname, true));
}

// ------------------------------------------------------------------- to-string
//
string This::to_string() const noexcept
{
   return format(R"V0G0N(
SessionPaths
   session-id:              '{}'
   session-dir:             '{}'
   synchronized-videos-dir: '{}'
   output-data-dir:         '{}'
   annotated-videos-dir:    '{}'
)V0G0N",
                 session_id,
                 session_dir,
                 synchronized_videos_dir,
                 output_data_dir,
                 annotated_videos_dir);
}

} // namespace mocap::pipeline
