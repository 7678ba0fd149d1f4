#pragma once

#include "per-camera-arrays.hpp"

namespace mocap
{
// --------------------------------------------------------------- ShapeMismatch
//
// Camera `camera_index()` disagrees with camera 0 on the shape of its stacked
// array.
class ShapeMismatch final : public std::runtime_error
{
 private:
   int camera_index_ = -1;
   vector<size_t> expected_;
   vector<size_t> actual_;

 public:
   ShapeMismatch(int camera_index,
                 vector<size_t> expected,
                 vector<size_t> actual,
                 const string_view what);

   int camera_index() const noexcept { return camera_index_; }
   const vector<size_t>& expected() const noexcept { return expected_; }
   const vector<size_t>& actual() const noexcept { return actual_; }
};

// Concatenate the four part arrays along the point axis:
// [frames, 553, 2]. Throws ShapeMismatch, naming `camera_index`, if a part is
// not 2D or the parts disagree on frame count.
DenseArray<3> stack_parts(const PerCameraArrays& arrays,
                          const int camera_index = 0) noexcept(false);

// [cameras, frames, 553, 2]. Throws ShapeMismatch if any camera differs from
// camera 0 in frame count, point count, or spatial dimension, and
// std::invalid_argument if `cameras` is empty.
DenseArray<4>
assemble_multi_camera(const vector<PerCameraArrays>& cameras) noexcept(false);

// [cameras, frames, 33], with the same preconditions.
DenseArray<3> assemble_body_confidence(
    const vector<PerCameraArrays>& cameras) noexcept(false);

} // namespace mocap
