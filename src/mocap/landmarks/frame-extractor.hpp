#pragma once

#include "landmark-set.hpp"
#include "per-camera-arrays.hpp"

namespace mocap
{
// How a part's landmark list is written into its [points, 2] block.
//
//  PER_POINT:             point i receives landmark i. Points past the end of
//                         the list stay NaN, surplus landmarks are ignored.
//  LEGACY_BROADCAST_LAST: every point receives the last landmark of the list.
//                         Reproduces output produced by older tooling.
enum class LandmarkAssignment : int8_t { PER_POINT = 0, LEGACY_BROADCAST_LAST };

const char* str(const LandmarkAssignment) noexcept;
LandmarkAssignment to_landmark_assignment(const string_view) noexcept(false);

// Writes one part. `xy_out` points at `spec.n_points * 2` reals. `conf_out`
// points at `spec.n_points` reals, and is only written when the part has
// confidence and `conf_out` is not nullptr.
void extract_part(const BodyPartSpec& spec,
                  const vector<Landmark>& landmarks,
                  const real image_w,
                  const real image_h,
                  real* xy_out,
                  real* conf_out,
                  const LandmarkAssignment policy) noexcept;

// Writes frame `frame_no` of `arrays`. Absent parts are left untouched.
void extract_frame(const LandmarkSet& landmarks,
                   const size_t frame_no,
                   PerCameraArrays& arrays,
                   const LandmarkAssignment policy
                   = LandmarkAssignment::PER_POINT) noexcept;

} // namespace mocap
