#pragma once

#include "mocap/detector/params.hpp"
#include "mocap/landmarks/frame-extractor.hpp"

namespace mocap::pipeline
{
struct Params final : public MetaCompatible
{
   virtual ~Params() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   detector::Params detector_params = {};

   bool save_annotated_videos = true;
   real annotated_video_fps   = 30.0; // <= 0 uses the source frame rate
   string video_extension     = ".mp4"s;

   // Write the last landmark of each part into every point of that part.
   // Only for comparing against output produced by older tooling.
   bool legacy_broadcast_last_landmark = false;

   bool save_body_confidence = true;

   bool feedback = false;

   LandmarkAssignment assignment_policy() const noexcept
   {
      return legacy_broadcast_last_landmark
                 ? LandmarkAssignment::LEGACY_BROADCAST_LAST
                 : LandmarkAssignment::PER_POINT;
   }
};

} // namespace mocap::pipeline

namespace mocap
{
META_READ_WRITE_LOAD_SAVE(pipeline::Params)
}
