
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/landmarks/camera-aggregator.hpp"
#include "mocap/landmarks/visibility.hpp"

namespace mocap
{
static LandmarkSet make_full_set() noexcept
{
   LandmarkSet o;
   for(const auto p : k_body_parts) {
      const auto n = body_part_spec(p).n_points;
      auto& ll     = o.part(p);
      ll           = LandmarkSet::landmark_list(size_t(n));
      for(auto i = 0; i < n; ++i)
         ll->at(size_t(i)) = Landmark(0.5f, 0.25f, 1.0f);
   }
   return o;
}

CATCH_TEST_CASE("visibility", "[visibility]")
{
   // Frame 0: everything, 1: no face, 2: nothing, 3: short right hand
   vector<LandmarkSet> frames(4, make_full_set());
   frames[1].face.reset();
   frames[2] = LandmarkSet{};
   frames[3].right_hand->resize(20);

   const auto arrays = aggregate_camera(frames, 640, 480);

   CATCH_SECTION("is-part-visible")
   {
      for(const auto p : k_body_parts) {
         CATCH_REQUIRE(is_part_visible(arrays, p, 0));
         CATCH_REQUIRE(!is_part_visible(arrays, p, 2));
      }
      CATCH_REQUIRE(is_part_visible(arrays, BodyPart::BODY, 1));
      CATCH_REQUIRE(!is_part_visible(arrays, BodyPart::FACE, 1));
      CATCH_REQUIRE(!is_part_visible(arrays, BodyPart::RIGHT_HAND, 3));
      CATCH_REQUIRE(is_part_visible(arrays, BodyPart::LEFT_HAND, 3));
   }

   CATCH_SECTION("is-frame-visible")
   {
      CATCH_REQUIRE(is_frame_visible(arrays, 0));
      CATCH_REQUIRE(!is_frame_visible(arrays, 1));
      CATCH_REQUIRE(!is_frame_visible(arrays, 2));
      CATCH_REQUIRE(!is_frame_visible(arrays, 3));
   }

   CATCH_SECTION("visibility-flags")
   {
      const auto flags = calc_visibility_flags(arrays);
      CATCH_REQUIRE(flags.n_frames() == 4);
      CATCH_REQUIRE(flags.all == vector<bool>{true, false, false, false});
      CATCH_REQUIRE(flags.part(BodyPart::FACE)
                    == vector<bool>{true, false, false, true});
      CATCH_REQUIRE(flags.part(BodyPart::RIGHT_HAND)
                    == vector<bool>{true, true, false, false});

      CATCH_REQUIRE(count_visible_frames(flags, BodyPart::BODY) == 3);
      CATCH_REQUIRE(count_visible_frames(flags, BodyPart::LEFT_HAND) == 3);
      CATCH_REQUIRE(count_visible_frames(flags, BodyPart::RIGHT_HAND) == 2);
      CATCH_REQUIRE(count_visible_frames(flags) == 1);
   }

   CATCH_SECTION("single-nan-cell")
   {
      auto copy = arrays;
      copy.part(BodyPart::LEFT_HAND)(0, 20, 1) = dNAN;
      CATCH_REQUIRE(!is_part_visible(copy, BodyPart::LEFT_HAND, 0));
      CATCH_REQUIRE(!is_frame_visible(copy, 0));
   }
}

} // namespace mocap
