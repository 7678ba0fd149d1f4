#include "per-camera-arrays.hpp"

namespace mocap
{
PerCameraArrays PerCameraArrays::make(size_t n_frames, int image_w, int image_h)
{
   PerCameraArrays o;
   for(const auto p : k_body_parts)
      o.part(p) = DenseArray<3>(
          {n_frames, size_t(body_part_spec(p).n_points), k_n_spatial_dims});
   o.body_confidence = DenseArray<2>({n_frames, size_t(k_n_body_points)});
   o.image_width     = image_w;
   o.image_height    = image_h;
   return o;
}

} // namespace mocap
