#include "landmark-replay.hpp"

#include "mocap/io/json-io.hpp"
#include "mocap/utils/file-system.hpp"

#define This LandmarkReplay

namespace mocap
{
This::This(string replay_dir)
    : replay_dir_(std::move(replay_dir))
{}

string This::replay_filename(const string_view replay_dir,
                             const string_view video_fname) noexcept
{
   return format(
       "{}/{}_landmarks.json", replay_dir, basename(video_fname, true));
}

void This::begin_video(const string_view fname) noexcept(false)
{
   current_fname_ = replay_filename(replay_dir_, fname);
   frames_        = load_landmark_recording(current_fname_);
   frame_no_      = 0;
   INFO(format(
       "replaying {} frames from '{}'", frames_.size(), current_fname_));
}

LandmarkSet This::detect(const cv::Mat&) noexcept(false)
{
   const auto frame_no = frame_no_++;
   if(frame_no >= frames_.size()) {
      TRACE(
          format("'{}' has no record for frame {}", current_fname_, frame_no));
      return LandmarkSet{};
   }
   return frames_[frame_no];
}

// --------------------------------------------------------- load/save recording
//
vector<LandmarkSet> load_landmark_recording(const string_view fname) noexcept(
    false)
{
   if(!is_regular_file(fname))
      throw std::runtime_error(
          format("landmark recording '{}' not found", fname));

   const Json::Value root = parse_json(file_get_contents(fname));
   if(!has_key(root, "frames") || !root["frames"].isArray())
      throw std::runtime_error(
          format("landmark recording '{}' has no 'frames' array", fname));

   const auto& node = root["frames"];
   vector<LandmarkSet> frames(node.size());
   for(auto i = 0u; i < node.size(); ++i) {
      try {
         frames[i].read(node[i]);
      } catch(std::runtime_error& e) {
         throw std::runtime_error(
             format("error reading '{}', frame {}: {}", fname, i, e.what()));
      }
   }
   return frames;
}

void save_landmark_recording(const string_view fname,
                             const vector<LandmarkSet>& frames) noexcept(false)
{
   Json::Value root{Json::objectValue};
   root["frames"] = Json::Value{Json::arrayValue};
   for(const auto& lms : frames) root["frames"].append(lms.to_json());

   const auto ec = file_put_contents(fname, str(root));
   if(ec)
      throw std::runtime_error(
          format("failed to write '{}': {}", fname, ec.message()));
}

} // namespace mocap

#undef This
