#include "camera-aggregator.hpp"

namespace mocap
{
PerCameraArrays aggregate_camera(const vector<LandmarkSet>& frames,
                                 const int image_w,
                                 const int image_h,
                                 const LandmarkAssignment policy) noexcept
{
   auto o = PerCameraArrays::make(frames.size(), image_w, image_h);
   for(size_t i = 0; i < frames.size(); ++i)
      extract_frame(frames[i], i, o, policy);
   return o;
}

} // namespace mocap
