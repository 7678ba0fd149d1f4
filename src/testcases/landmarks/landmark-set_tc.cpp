
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/io/json-io.hpp"
#include "mocap/landmarks/landmark-set.hpp"

namespace mocap
{
CATCH_TEST_CASE("landmark-set", "[landmark_set]")
{
   CATCH_SECTION("landmark-json")
   {
      const Landmark a{0.25f, 0.5f, 0.75f};
      const Landmark b{0.25f, 0.5f};

      Landmark c, d;
      c.read(a.to_json());
      d.read(b.to_json());
      CATCH_REQUIRE(a == c);
      CATCH_REQUIRE(b == d);
      CATCH_REQUIRE(std::isnan(d.visibility));
      CATCH_REQUIRE(a != b);

      CATCH_REQUIRE(b.to_json().size() == 2);
      CATCH_REQUIRE_THROWS_AS(c.read(parse_json("[0.1]")), std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(c.read(parse_json("{\"x\": 0.1}")),
                              std::runtime_error);
   }

   CATCH_SECTION("absent-vs-empty")
   {
      LandmarkSet s;
      CATCH_REQUIRE(s.empty());
      s.left_hand = LandmarkSet::landmark_list{};
      CATCH_REQUIRE(!s.empty());
      CATCH_REQUIRE(s.has_part(BodyPart::LEFT_HAND));
      CATCH_REQUIRE(!s.has_part(BodyPart::RIGHT_HAND));
   }

   CATCH_SECTION("landmark-set-json")
   {
      LandmarkSet s;
      s.body
          = LandmarkSet::landmark_list{{0.1f, 0.2f, 0.9f}, {0.3f, 0.4f, 0.8f}};
      s.face = LandmarkSet::landmark_list{{0.5f, 0.6f}};

      const auto o = s.to_json();
      CATCH_REQUIRE(o["right_hand"].isNull());
      CATCH_REQUIRE(o["body"].size() == 2);

      LandmarkSet t;
      t.read(o);
      CATCH_REQUIRE(s == t);
      CATCH_REQUIRE(!t.has_part(BodyPart::LEFT_HAND));
      CATCH_REQUIRE(str(t) == "LandmarkSet{body=2, right_hand=-, "
                              "left_hand=-, face=1}");
   }

   CATCH_SECTION("landmark-set-missing-keys")
   {
      LandmarkSet t;
      t.right_hand = LandmarkSet::landmark_list{{0.1f, 0.1f}};
      t.read(parse_json(R"({"body": [[0.5, 0.5, 1.0]]})"));
      CATCH_REQUIRE(t.has_part(BodyPart::BODY));
      CATCH_REQUIRE(!t.has_part(BodyPart::RIGHT_HAND));
      CATCH_REQUIRE(t.body->at(0) == Landmark(0.5f, 0.5f, 1.0f));
   }

   CATCH_SECTION("landmark-set-bad-json")
   {
      LandmarkSet t;
      CATCH_REQUIRE_THROWS_AS(t.read(parse_json("[]")), std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(t.read(parse_json(R"({"face": 3})")),
                              std::runtime_error);
      CATCH_REQUIRE_THROWS_AS(
          t.read(parse_json(R"({"body": [[0.5, "x"]]})")),
          std::runtime_error);
   }
}

} // namespace mocap
