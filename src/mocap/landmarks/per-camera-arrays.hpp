#pragma once

#include "tracked-points.hpp"

#include "mocap/utils/dense-array.hpp"

namespace mocap
{
// ------------------------------------------------------------- PerCameraArrays
//
// Pixel XY for each body part, [frames, points_in_part, 2], plus body
// confidence [frames, 33]. Missing detections are NaN.
struct PerCameraArrays final
{
   array<DenseArray<3>, k_n_body_parts> xy = {};
   DenseArray<2> body_confidence           = {};
   int image_width                         = 0;
   int image_height                        = 0;

   // All arrays allocated at full length, and filled with NaN
   static PerCameraArrays make(size_t n_frames, int image_w, int image_h);

   size_t n_frames() const noexcept { return xy[0].shape(0); }

   DenseArray<3>& part(const BodyPart p) noexcept { return xy[size_t(p)]; }
   const DenseArray<3>& part(const BodyPart p) const noexcept
   {
      return xy[size_t(p)];
   }

   // Pointer to the [points, 2] block of `frame_no`
   real* part_row(const BodyPart p, size_t frame_no) noexcept
   {
      return part(p).data() + frame_no * part(p).stride(0);
   }
   const real* part_row(const BodyPart p, size_t frame_no) const noexcept
   {
      return part(p).data() + frame_no * part(p).stride(0);
   }

   real* confidence_row(size_t frame_no) noexcept
   {
      return body_confidence.data() + frame_no * body_confidence.stride(0);
   }
};

} // namespace mocap
