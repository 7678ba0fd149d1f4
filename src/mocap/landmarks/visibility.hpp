#pragma once

#include "per-camera-arrays.hpp"

namespace mocap
{
// A part is visible in a frame iff none of its coordinates are NaN.
struct VisibilityFlags final
{
   array<vector<bool>, k_n_body_parts> parts = {};
   vector<bool> all                          = {}; // AND of all the parts

   size_t n_frames() const noexcept { return all.size(); }
   const vector<bool>& part(const BodyPart p) const noexcept
   {
      return parts[size_t(p)];
   }
};

bool is_part_visible(const PerCameraArrays& arrays,
                     const BodyPart part,
                     const size_t frame_no) noexcept;

bool is_frame_visible(const PerCameraArrays& arrays,
                      const size_t frame_no) noexcept;

VisibilityFlags calc_visibility_flags(const PerCameraArrays& arrays) noexcept;

size_t count_visible_frames(const VisibilityFlags& flags,
                            const BodyPart part) noexcept;

// Frames where every part is visible
size_t count_visible_frames(const VisibilityFlags& flags) noexcept;

} // namespace mocap
