#pragma once

#include "frame-extractor.hpp"

namespace mocap
{
// One LandmarkSet per decoded frame, in decode order. The output always has
// `frames.size()` frames, whatever was detected.
PerCameraArrays
aggregate_camera(const vector<LandmarkSet>& frames,
                 const int image_w,
                 const int image_h,
                 const LandmarkAssignment policy
                 = LandmarkAssignment::PER_POINT) noexcept;

} // namespace mocap
