#include "frame-extractor.hpp"

namespace mocap
{
// ---------------------------------------------------------- LandmarkAssignment
//
const char* str(const LandmarkAssignment x) noexcept
{
   switch(x) {
   case LandmarkAssignment::PER_POINT: return "PER_POINT";
   case LandmarkAssignment::LEGACY_BROADCAST_LAST:
      return "LEGACY_BROADCAST_LAST";
   }
   return "<unknown>";
}

LandmarkAssignment to_landmark_assignment(const string_view val) noexcept(false)
{
   if(val == "PER_POINT") return LandmarkAssignment::PER_POINT;
   if(val == "LEGACY_BROADCAST_LAST")
      return LandmarkAssignment::LEGACY_BROADCAST_LAST;
   throw std::runtime_error(
       format("could not convert '{}' to a landmark assignment", val));
}

// ---------------------------------------------------------------- extract-part
//
void extract_part(const BodyPartSpec& spec,
                  const vector<Landmark>& landmarks,
                  const real image_w,
                  const real image_h,
                  real* xy_out,
                  real* conf_out,
                  const LandmarkAssignment policy) noexcept
{
   Expects(xy_out != nullptr);
   if(landmarks.empty()) return;

   const bool write_conf = spec.has_confidence && conf_out != nullptr;

   auto write_point = [&](int i, const Landmark& l) {
      xy_out[2 * i + 0] = real(l.x) * image_w;
      xy_out[2 * i + 1] = real(l.y) * image_h;
      if(write_conf) conf_out[i] = real(l.visibility);
   };

   if(policy == LandmarkAssignment::LEGACY_BROADCAST_LAST) {
      const auto& last = landmarks.back();
      for(auto i = 0; i < spec.n_points; ++i) write_point(i, last);
      return;
   }

   const auto n = std::min<int>(spec.n_points, int(landmarks.size()));
   for(auto i = 0; i < n; ++i) write_point(i, landmarks[size_t(i)]);
}

// --------------------------------------------------------------- extract-frame
//
void extract_frame(const LandmarkSet& landmarks,
                   const size_t frame_no,
                   PerCameraArrays& arrays,
                   const LandmarkAssignment policy) noexcept
{
   Expects(frame_no < arrays.n_frames());

   const auto w = real(arrays.image_width);
   const auto h = real(arrays.image_height);

   for(const auto p : k_body_parts) {
      const auto& ll = landmarks.part(p);
      if(!ll.has_value()) continue;
      const auto& spec = body_part_spec(p);
      extract_part(spec,
                   *ll,
                   w,
                   h,
                   arrays.part_row(p, frame_no),
                   spec.has_confidence ? arrays.confidence_row(frame_no)
                                       : nullptr,
                   policy);
   }
}

} // namespace mocap
