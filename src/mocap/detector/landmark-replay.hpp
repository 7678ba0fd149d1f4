#pragma once

#include "landmark-detector.hpp"

namespace mocap
{
// Replays landmarks recorded in `{replay_dir}/{video-stem}_landmarks.json`:
//
//    { "frames": [ { "body": [[x, y, vis], ...], "face": null, ... }, ... ] }
//
// Frames past the end of the recording detect nothing.
class LandmarkReplay final : public LandmarkDetector
{
 private:
   string replay_dir_          = ""s;
   string current_fname_       = ""s;
   vector<LandmarkSet> frames_ = {};
   size_t frame_no_            = 0;

 public:
   explicit LandmarkReplay(string replay_dir);
   LandmarkReplay(const LandmarkReplay&) = delete;
   LandmarkReplay(LandmarkReplay&&)      = default;
   ~LandmarkReplay() override            = default;
   LandmarkReplay& operator=(const LandmarkReplay&) = delete;
   LandmarkReplay& operator=(LandmarkReplay&&) = default;

   void begin_video(const string_view fname) noexcept(false) override;
   LandmarkSet detect(const cv::Mat& image) noexcept(false) override;
   const char* name() const noexcept override { return "replay"; }

   size_t n_recorded_frames() const noexcept { return frames_.size(); }

   static string replay_filename(const string_view replay_dir,
                                 const string_view video_fname) noexcept;
};

// Throws std::runtime_error on a missing or malformed file
vector<LandmarkSet> load_landmark_recording(const string_view fname) noexcept(
    false);

void save_landmark_recording(const string_view fname,
                             const vector<LandmarkSet>& frames) noexcept(false);

} // namespace mocap
