
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/landmarks/camera-aggregator.hpp"
#include "mocap/landmarks/frame-extractor.hpp"

namespace mocap
{
static constexpr int k_width  = 1920;
static constexpr int k_height = 1080;

// `n` landmarks with distinct coordinates and visibilities
static vector<Landmark> make_landmarks(int n, float seed = 0.0f)
{
   vector<Landmark> o;
   o.reserve(size_t(n));
   for(auto i = 0; i < n; ++i)
      o.emplace_back((seed + float(i + 1)) / 1000.0f,
                     (seed + float(i + 2)) / 2000.0f,
                     float(i) / float(n));
   return o;
}

static bool all_nan(const real* first, const real* last)
{
   return std::all_of(first, last, [](real x) { return std::isnan(x); });
}

CATCH_TEST_CASE("frame-extractor", "[frame_extractor]")
{
   CATCH_SECTION("per-point-assignment")
   {
      LandmarkSet lms;
      lms.body = make_landmarks(k_n_body_points);

      auto arrays = PerCameraArrays::make(1, k_width, k_height);
      extract_frame(lms, 0, arrays, LandmarkAssignment::PER_POINT);

      const auto& A = arrays.part(BodyPart::BODY);
      for(auto k = 0; k < k_n_body_points; ++k) {
         const auto& l = lms.body->at(size_t(k));
         CATCH_REQUIRE(A(0, k, 0) == real(l.x) * k_width);
         CATCH_REQUIRE(A(0, k, 1) == real(l.y) * k_height);
         CATCH_REQUIRE(arrays.body_confidence(0, k) == real(l.visibility));
         if(k > 0) {
            CATCH_REQUIRE(A(0, k, 0) != A(0, k - 1, 0));
            CATCH_REQUIRE(A(0, k, 1) != A(0, k - 1, 1));
         }
      }

      // Absent parts stay NaN
      for(const auto p :
          {BodyPart::RIGHT_HAND, BodyPart::LEFT_HAND, BodyPart::FACE}) {
         const auto& B = arrays.part(p);
         CATCH_REQUIRE(all_nan(B.data(), B.data() + B.size()));
      }
   }

   CATCH_SECTION("legacy-broadcast-last-regression")
   {
      // The legacy policy collapses every point onto the last landmark
      LandmarkSet lms;
      lms.body       = make_landmarks(k_n_body_points);
      lms.right_hand = make_landmarks(k_n_hand_points, 7.0f);

      auto per_point = PerCameraArrays::make(1, k_width, k_height);
      auto legacy    = PerCameraArrays::make(1, k_width, k_height);
      extract_frame(lms, 0, per_point, LandmarkAssignment::PER_POINT);
      extract_frame(lms, 0, legacy, LandmarkAssignment::LEGACY_BROADCAST_LAST);

      for(const auto p : {BodyPart::BODY, BodyPart::RIGHT_HAND}) {
         const auto& last = lms.part(p)->back();
         const auto& L    = legacy.part(p);
         const auto& P    = per_point.part(p);
         const auto n     = int(L.shape(1));

         size_t n_distinct = 0;
         for(auto k = 0; k < n; ++k) {
            CATCH_REQUIRE(L(0, k, 0) == real(last.x) * k_width);
            CATCH_REQUIRE(L(0, k, 1) == real(last.y) * k_height);
            if(k > 0 && P(0, k, 0) != P(0, k - 1, 0)) ++n_distinct;
         }
         CATCH_REQUIRE(n_distinct == size_t(n - 1));
         CATCH_REQUIRE(P(0, n - 1, 0) == L(0, n - 1, 0));
         CATCH_REQUIRE(P(0, 0, 0) != L(0, 0, 0));
      }

      const auto last_vis = real(lms.body->back().visibility);
      for(auto k = 0; k < k_n_body_points; ++k)
         CATCH_REQUIRE(legacy.body_confidence(0, k) == last_vis);
   }

   CATCH_SECTION("short-and-long-lists")
   {
      LandmarkSet lms;
      lms.right_hand = make_landmarks(5);
      lms.body       = make_landmarks(k_n_body_points + 7);

      auto arrays = PerCameraArrays::make(2, k_width, k_height);
      extract_frame(lms, 1, arrays);

      const auto& R = arrays.part(BodyPart::RIGHT_HAND);
      for(auto k = 0; k < k_n_hand_points; ++k) {
         CATCH_REQUIRE(std::isnan(R(0, k, 0)));
         CATCH_REQUIRE(std::isnan(R(1, k, 0)) == (k >= 5));
      }

      // Surplus landmarks are dropped
      const auto& B = arrays.part(BodyPart::BODY);
      const auto& l = lms.body->at(k_n_body_points - 1);
      CATCH_REQUIRE(B(1, k_n_body_points - 1, 0) == real(l.x) * k_width);
      CATCH_REQUIRE(all_nan(arrays.part_row(BodyPart::BODY, 0),
                            arrays.part_row(BodyPart::BODY, 1)));
   }

   CATCH_SECTION("empty-list-writes-nothing")
   {
      LandmarkSet lms;
      lms.face = LandmarkSet::landmark_list{};

      for(const auto policy : {LandmarkAssignment::PER_POINT,
                               LandmarkAssignment::LEGACY_BROADCAST_LAST}) {
         auto arrays = PerCameraArrays::make(1, k_width, k_height);
         extract_frame(lms, 0, arrays, policy);
         const auto& F = arrays.part(BodyPart::FACE);
         CATCH_REQUIRE(all_nan(F.data(), F.data() + F.size()));
      }
   }

   CATCH_SECTION("assignment-strings")
   {
      for(const auto policy : {LandmarkAssignment::PER_POINT,
                               LandmarkAssignment::LEGACY_BROADCAST_LAST})
         CATCH_REQUIRE(to_landmark_assignment(str(policy)) == policy);
      CATCH_REQUIRE_THROWS_AS(to_landmark_assignment("sideways"),
                              std::runtime_error);
   }
}

CATCH_TEST_CASE("camera-aggregator", "[camera_aggregator]")
{
   CATCH_SECTION("constant-shape")
   {
      vector<LandmarkSet> frames(4);
      frames[1].body      = make_landmarks(k_n_body_points);
      frames[2].face      = make_landmarks(k_n_face_points);
      frames[3].left_hand = make_landmarks(k_n_hand_points);

      const auto arrays = aggregate_camera(frames, k_width, k_height);
      CATCH_REQUIRE(arrays.n_frames() == 4);
      CATCH_REQUIRE(arrays.image_width == k_width);
      CATCH_REQUIRE(arrays.image_height == k_height);
      for(const auto p : k_body_parts) {
         const auto& A = arrays.part(p);
         CATCH_REQUIRE(A.shape(0) == 4);
         CATCH_REQUIRE(int(A.shape(1)) == body_part_spec(p).n_points);
         CATCH_REQUIRE(A.shape(2) == 2);
      }
      CATCH_REQUIRE(arrays.body_confidence.shape(0) == 4);
      CATCH_REQUIRE(arrays.body_confidence.shape(1) == 33);

      // Frame 0 detected nothing
      for(const auto p : k_body_parts) {
         const real* row = arrays.part_row(p, 0);
         CATCH_REQUIRE(all_nan(row, row + arrays.part(p).stride(0)));
      }
      CATCH_REQUIRE(!std::isnan(arrays.part(BodyPart::BODY)(1, 0, 0)));
      CATCH_REQUIRE(std::isnan(arrays.part(BodyPart::BODY)(2, 0, 0)));
      CATCH_REQUIRE(!std::isnan(arrays.part(BodyPart::FACE)(2, 477, 1)));
      CATCH_REQUIRE(!std::isnan(arrays.part(BodyPart::LEFT_HAND)(3, 20, 1)));
   }

   CATCH_SECTION("no-frames")
   {
      const auto arrays = aggregate_camera({}, k_width, k_height);
      CATCH_REQUIRE(arrays.n_frames() == 0);
      CATCH_REQUIRE(arrays.part(BodyPart::FACE).shape(1) == 478);
   }
}

} // namespace mocap
