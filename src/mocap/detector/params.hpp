#pragma once

#include "mocap/foundation.hpp"
#include "mocap/io/json-io.hpp"
#include "mocap/io/struct-meta.hpp"

namespace mocap::detector
{
// --------------------------------------------------------------------- Backend

enum class Backend : int { REPLAY = 0, MEDIAPIPE };

const char* str(const Backend) noexcept;
Backend to_backend(const string_view val) noexcept(false);

// ---------------------------------------------------------------------- Params

struct Params final : public MetaCompatible
{
   virtual ~Params() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   Backend backend
       = (k_has_mediapipe) ? Backend::MEDIAPIPE : Backend::REPLAY;

   // Replay: directory holding `{video-stem}_landmarks.json` files.
   // Empty means MOCAP_REPLAY_DIR.
   string replay_dir = ""s;

   // MediaPipe: holistic graph `.pbtxt`. Empty means MOCAP_MEDIAPIPE_GRAPH.
   string graph_config        = ""s;
   int model_complexity       = 2; //!< 0, 1, or 2. Higher is slower
   bool smooth_landmarks      = true;
   bool refine_face_landmarks = true; //!< 478 face points, with irises

   // Pose detector score, and landmark tracking score, thresholds
   real min_detection_confidence = 0.5;
   real min_tracking_confidence  = 0.5;

   bool feedback = false;
};

} // namespace mocap::detector

namespace mocap
{
META_READ_WRITE_LOAD_SAVE(detector::Params)
}
