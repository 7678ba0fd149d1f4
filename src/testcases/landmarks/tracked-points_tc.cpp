
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/landmarks/tracked-points.hpp"

namespace mocap
{
CATCH_TEST_CASE("tracked-points", "[tracked_points]")
{
   CATCH_SECTION("point-counts")
   {
      CATCH_REQUIRE(body_part_spec(BodyPart::BODY).n_points == 33);
      CATCH_REQUIRE(body_part_spec(BodyPart::RIGHT_HAND).n_points == 21);
      CATCH_REQUIRE(body_part_spec(BodyPart::LEFT_HAND).n_points == 21);
      CATCH_REQUIRE(body_part_spec(BodyPart::FACE).n_points == 478);
      CATCH_REQUIRE(k_n_tracked_points == 553);

      int total = 0;
      for(const auto p : k_body_parts) {
         const auto& spec = body_part_spec(p);
         CATCH_REQUIRE(spec.part == p);
         CATCH_REQUIRE(spec.offset == total);
         CATCH_REQUIRE(spec.has_confidence == (p == BodyPart::BODY));
         total += spec.n_points;
      }
      CATCH_REQUIRE(total == k_n_tracked_points);
   }

   CATCH_SECTION("point-names")
   {
      const auto& names = all_tracked_point_names();
      CATCH_REQUIRE(names.size() == size_t(k_n_tracked_points));

      // Names are unique
      hashset<string> seen(cbegin(names), cend(names));
      CATCH_REQUIRE(seen.size() == names.size());

      CATCH_REQUIRE(names[0] == "nose");
      CATCH_REQUIRE(names[32] == "right_foot_index");
      CATCH_REQUIRE(names[33] == "right_hand_wrist");
      CATCH_REQUIRE(names[54] == "left_hand_wrist");
      CATCH_REQUIRE(names[75] == "face_000");
      CATCH_REQUIRE(names[75 + 467] == "face_467");
      CATCH_REQUIRE(names[75 + 468] == "right_iris_center");
      CATCH_REQUIRE(names[552] == "left_iris_3");
   }

   CATCH_SECTION("point-index")
   {
      CATCH_REQUIRE(tracked_point_index("nose") == 0);
      CATCH_REQUIRE(tracked_point_index("left_hand_pinky_tip") == 74);
      CATCH_REQUIRE(tracked_point_index("left_iris_3") == 552);
      CATCH_REQUIRE(tracked_point_index("tail") == -1);

      for(const auto p : k_body_parts) {
         const auto& spec  = body_part_spec(p);
         const auto& names = tracked_point_names(p);
         for(size_t i = 0; i < names.size(); ++i)
            CATCH_REQUIRE(tracked_point_index(names[i])
                          == spec.offset + int(i));
      }
   }

   CATCH_SECTION("body-part-strings")
   {
      for(const auto p : k_body_parts) {
         CATCH_REQUIRE(to_body_part(str(p)) == p);
         CATCH_REQUIRE(int_to_body_part(int(p)) == p);
      }
      CATCH_REQUIRE_THROWS_AS(to_body_part("tail"), std::runtime_error);
   }
}

} // namespace mocap
