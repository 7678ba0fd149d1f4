#include "multi-camera-assembler.hpp"

namespace mocap
{
// --------------------------------------------------------------- ShapeMismatch
//
ShapeMismatch::ShapeMismatch(int camera_index,
                             vector<size_t> expected,
                             vector<size_t> actual,
                             const string_view what)
    : std::runtime_error(format(
        "camera {}: {}; expected shape [{}], but got [{}]",
        camera_index,
        what,
        implode(cbegin(expected), cend(expected), ", "),
        implode(cbegin(actual), cend(actual), ", ")))
    , camera_index_(camera_index)
    , expected_(std::move(expected))
    , actual_(std::move(actual))
{}

template<std::size_t N> static vector<size_t> to_vec(const array<size_t, N>& s)
{
   return vector<size_t>(cbegin(s), cend(s));
}

// ----------------------------------------------------------------- stack-parts
//
DenseArray<3> stack_parts(const PerCameraArrays& arrays,
                          const int camera_index) noexcept(false)
{
   const auto n_frames = arrays.n_frames();

   size_t n_points = 0;
   for(const auto p : k_body_parts) {
      const auto& A = arrays.part(p);
      const vector<size_t> expected
          = {n_frames, A.shape(1), size_t(k_n_spatial_dims)};
      if(A.shape(2) != size_t(k_n_spatial_dims))
         throw ShapeMismatch(
             camera_index,
             expected,
             to_vec(A.shape()),
             format("'{}' should be 2D (pixel XY) data", str(p)));
      if(A.shape(0) != n_frames)
         throw ShapeMismatch(
             camera_index,
             expected,
             to_vec(A.shape()),
             format("'{}' frame count differs from '{}'",
                    str(p),
                    str(BodyPart::BODY)));
      n_points += A.shape(1);
   }

   DenseArray<3> out({n_frames, n_points, k_n_spatial_dims});
   for(size_t t = 0; t < n_frames; ++t) {
      real* dst = out.data() + t * out.stride(0);
      for(const auto p : k_body_parts) {
         const auto& A   = arrays.part(p);
         const real* src = arrays.part_row(p, t);
         dst             = std::copy(src, src + A.stride(0), dst);
      }
   }

   return out;
}

// ------------------------------------------------------- assemble-multi-camera
//
DenseArray<4>
assemble_multi_camera(const vector<PerCameraArrays>& cameras) noexcept(false)
{
   if(cameras.empty())
      throw std::invalid_argument("cannot assemble zero cameras");

   vector<DenseArray<3>> stacked;
   stacked.reserve(cameras.size());
   for(size_t i = 0; i < cameras.size(); ++i)
      stacked.push_back(stack_parts(cameras[i], int(i)));

   const auto& shape0 = stacked[0].shape();

   for(size_t i = 1; i < stacked.size(); ++i) {
      const auto& shape = stacked[i].shape();
      if(shape != shape0)
         throw ShapeMismatch(
             int(i),
             to_vec(shape0),
             to_vec(shape),
             (shape[0] != shape0[0])
                 ? "frame count differs from camera 0"
                 : "tracked point layout differs from camera 0");
   }

   DenseArray<4> out(
       {stacked.size(), shape0[0], shape0[1], size_t(k_n_spatial_dims)});
   real* dst = out.data();
   for(const auto& A : stacked) dst = std::copy(A.begin(), A.end(), dst);
   Ensures(dst == out.data() + out.size());

   return out;
}

// ---------------------------------------------------- assemble-body-confidence
//
DenseArray<3> assemble_body_confidence(
    const vector<PerCameraArrays>& cameras) noexcept(false)
{
   if(cameras.empty())
      throw std::invalid_argument("cannot assemble zero cameras");

   const auto& shape0 = cameras[0].body_confidence.shape();
   for(size_t i = 1; i < cameras.size(); ++i) {
      const auto& shape = cameras[i].body_confidence.shape();
      if(shape != shape0)
         throw ShapeMismatch(int(i),
                             to_vec(shape0),
                             to_vec(shape),
                             (shape[0] != shape0[0])
                                 ? "frame count differs from camera 0"
                                 : "body point count differs from camera 0");
   }

   DenseArray<3> out({cameras.size(), shape0[0], shape0[1]});
   real* dst = out.data();
   for(const auto& cam : cameras)
      dst = std::copy(
          cam.body_confidence.begin(), cam.body_confidence.end(), dst);
   Ensures(dst == out.data() + out.size());

   return out;
}

} // namespace mocap
