#include "landmark-detector.hpp"

#include "landmark-replay.hpp"
#include "mediapipe-holistic.hpp"

namespace mocap
{
unique_ptr<LandmarkDetector>
make_landmark_detector(const detector::Params& params) noexcept(false)
{
   switch(params.backend) {
   case detector::Backend::REPLAY: {
      const auto& dir = params.replay_dir.empty() ? mocap_replay_dir()
                                                  : params.replay_dir;
      if(dir.empty())
         throw std::runtime_error(
             "replay backend requires 'replay_dir', or MOCAP_REPLAY_DIR");
      return make_unique<LandmarkReplay>(dir);
   }
   case detector::Backend::MEDIAPIPE: {
      auto p = params;
      if(p.graph_config.empty()) p.graph_config = mocap_mediapipe_graph();
      return make_unique<MediapipeHolistic>(p);
   }
   }
   throw std::runtime_error(
       format("unknown detector backend: {}", int(params.backend)));
}

} // namespace mocap
