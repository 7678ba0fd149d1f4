#pragma once

#include "mocap/foundation.hpp"

namespace mocap::pipeline
{
// ---------------------------------------------------------------- SessionPaths
//
// Folder and artifact layout of one recording session:
//
//    {data_dir}/{session_id}/synchronized_videos/*.mp4     (input)
//    {data_dir}/{session_id}/output_data/*.npy, *.json     (output)
//    {data_dir}/{session_id}/annotated_videos/*.mp4        (output)
//
struct SessionPaths final
{
   string session_id              = ""s;
   string session_dir             = ""s;
   string synchronized_videos_dir = ""s;
   string output_data_dir         = ""s;
   string annotated_videos_dir    = ""s;

   static SessionPaths make(const string_view data_dir,
                            const string_view session_id) noexcept;

   string data2d_npy() const noexcept;
   string body_confidence_npy() const noexcept;
   string summary_json() const noexcept;

   // `{annotated_videos_dir}/{stem}_mediapipe.mp4`
   string annotated_video_fname(const string_view video_fname) const noexcept;

   string to_string() const noexcept;
   friend string str(const SessionPaths& o) noexcept { return o.to_string(); }
};

} // namespace mocap::pipeline
