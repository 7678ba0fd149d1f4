#include "visibility.hpp"

namespace mocap
{
bool is_part_visible(const PerCameraArrays& arrays,
                     const BodyPart part,
                     const size_t frame_no) noexcept
{
   Expects(frame_no < arrays.n_frames());
   const auto& A    = arrays.part(part);
   const real* row  = arrays.part_row(part, frame_no);
   const real* row1 = row + A.stride(0);
   return std::none_of(row, row1, [](real x) { return std::isnan(x); });
}

bool is_frame_visible(const PerCameraArrays& arrays,
                      const size_t frame_no) noexcept
{
   return std::all_of(cbegin(k_body_parts), cend(k_body_parts), [&](auto p) {
      return is_part_visible(arrays, p, frame_no);
   });
}

VisibilityFlags calc_visibility_flags(const PerCameraArrays& arrays) noexcept
{
   const auto n_frames = arrays.n_frames();

   VisibilityFlags flags;
   for(auto& v : flags.parts) v.resize(n_frames, false);
   flags.all.resize(n_frames, false);

   for(size_t t = 0; t < n_frames; ++t) {
      bool all_visible = true;
      for(const auto p : k_body_parts) {
         const bool visible        = is_part_visible(arrays, p, t);
         flags.parts[size_t(p)][t] = visible;
         all_visible               = all_visible && visible;
      }
      flags.all[t] = all_visible;
   }

   return flags;
}

size_t count_visible_frames(const VisibilityFlags& flags,
                            const BodyPart part) noexcept
{
   const auto& v = flags.part(part);
   return size_t(std::count(cbegin(v), cend(v), true));
}

size_t count_visible_frames(const VisibilityFlags& flags) noexcept
{
   return size_t(std::count(cbegin(flags.all), cend(flags.all), true));
}

} // namespace mocap
