
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/landmarks/camera-aggregator.hpp"
#include "mocap/landmarks/multi-camera-assembler.hpp"

namespace mocap
{
static LandmarkSet make_body_only(float x) noexcept
{
   LandmarkSet o;
   o.body = LandmarkSet::landmark_list(size_t(k_n_body_points),
                                       Landmark(x, 0.5f, 0.9f));
   return o;
}

static vector<LandmarkSet> make_frames(size_t n) noexcept
{
   vector<LandmarkSet> o;
   for(size_t i = 0; i < n; ++i) o.push_back(make_body_only(0.1f * float(i)));
   return o;
}

CATCH_TEST_CASE("multi-camera-assembler", "[multi_camera_assembler]")
{
   CATCH_SECTION("two-cameras-three-frames")
   {
      // Camera A: body in frames {0, 2}. Camera B: body in all frames.
      auto frames_a = make_frames(3);
      frames_a[1]   = LandmarkSet{};
      const auto frames_b = make_frames(3);

      vector<PerCameraArrays> cameras;
      cameras.push_back(aggregate_camera(frames_a, 100, 200));
      cameras.push_back(aggregate_camera(frames_b, 100, 200));

      const auto A = assemble_multi_camera(cameras);
      CATCH_REQUIRE(A.shape() == DenseArray<4>::shape_type{2, 3, 553, 2});

      for(auto k = 0; k < k_n_body_points; ++k) {
         CATCH_REQUIRE(std::isnan(A(0, 1, k, 0)));
         CATCH_REQUIRE(std::isnan(A(0, 1, k, 1)));
         CATCH_REQUIRE(!std::isnan(A(0, 0, k, 0)));
         CATCH_REQUIRE(!std::isnan(A(0, 2, k, 1)));
         CATCH_REQUIRE(!std::isnan(A(1, 1, k, 0)));
      }
      CATCH_REQUIRE(A(1, 1, 0, 1) == real(0.5f) * 200.0);

      // Hands and face were never detected
      for(auto k = k_n_body_points; k < k_n_tracked_points; ++k)
         CATCH_REQUIRE(std::isnan(A(1, 2, k, 0)));

      const auto C = assemble_body_confidence(cameras);
      CATCH_REQUIRE(C.shape() == DenseArray<3>::shape_type{2, 3, 33});
      CATCH_REQUIRE(std::isnan(C(0, 1, 0)));
      CATCH_REQUIRE(C(1, 1, 0) == real(0.9f));
   }

   CATCH_SECTION("stack-parts-order")
   {
      LandmarkSet lms;
      for(const auto p : k_body_parts) {
         const auto n = body_part_spec(p).n_points;
         lms.part(p)  = LandmarkSet::landmark_list(
             size_t(n), Landmark(0.01f * float(int(p) + 1), 0.5f));
      }
      const auto arrays = aggregate_camera({lms}, 1000, 1000);
      const auto S      = stack_parts(arrays);
      CATCH_REQUIRE(S.shape() == DenseArray<3>::shape_type{1, 553, 2});
      for(const auto p : k_body_parts) {
         const auto& spec = body_part_spec(p);
         const real x     = real(0.01f * float(int(p) + 1)) * 1000.0;
         CATCH_REQUIRE(S(0, spec.offset, 0) == x);
         CATCH_REQUIRE(S(0, spec.offset + spec.n_points - 1, 0) == x);
      }
   }

   CATCH_SECTION("frame-count-mismatch")
   {
      vector<PerCameraArrays> cameras;
      cameras.push_back(aggregate_camera(make_frames(10), 100, 100));
      cameras.push_back(aggregate_camera(make_frames(9), 100, 100));

      bool caught = false;
      try {
         assemble_multi_camera(cameras);
      } catch(ShapeMismatch& e) {
         caught = true;
         CATCH_REQUIRE(e.camera_index() == 1);
         CATCH_REQUIRE(e.expected() == vector<size_t>{10, 553, 2});
         CATCH_REQUIRE(e.actual() == vector<size_t>{9, 553, 2});
         CATCH_REQUIRE(string(e.what()).find("camera 1") != string::npos);
      }
      CATCH_REQUIRE(caught);

      CATCH_REQUIRE_THROWS_AS(assemble_body_confidence(cameras),
                              ShapeMismatch);
   }

   CATCH_SECTION("third-camera-mismatch")
   {
      vector<PerCameraArrays> cameras;
      cameras.push_back(aggregate_camera(make_frames(4), 100, 100));
      cameras.push_back(aggregate_camera(make_frames(4), 100, 100));
      cameras.push_back(aggregate_camera(make_frames(5), 100, 100));

      try {
         assemble_multi_camera(cameras);
         CATCH_REQUIRE(false);
      } catch(ShapeMismatch& e) {
         CATCH_REQUIRE(e.camera_index() == 2);
         CATCH_REQUIRE(e.actual()[0] == 5);
      }
   }

   CATCH_SECTION("point-count-mismatch")
   {
      // Same frame count, but camera 1 has the 468-point face mesh
      vector<PerCameraArrays> cameras;
      cameras.push_back(aggregate_camera(make_frames(3), 100, 100));
      cameras.push_back(aggregate_camera(make_frames(3), 100, 100));
      cameras[1].part(BodyPart::FACE)
          = DenseArray<3>(DenseArray<3>::shape_type{3, 468, 2});

      bool caught = false;
      try {
         assemble_multi_camera(cameras);
      } catch(ShapeMismatch& e) {
         caught = true;
         CATCH_REQUIRE(e.camera_index() == 1);
         CATCH_REQUIRE(e.expected() == vector<size_t>{3, 553, 2});
         CATCH_REQUIRE(e.actual() == vector<size_t>{3, 543, 2});
         CATCH_REQUIRE(string(e.what()).find("tracked point layout")
                       != string::npos);
      }
      CATCH_REQUIRE(caught);
   }

   CATCH_SECTION("body-point-count-mismatch")
   {
      vector<PerCameraArrays> cameras;
      cameras.push_back(aggregate_camera(make_frames(3), 100, 100));
      cameras.push_back(aggregate_camera(make_frames(3), 100, 100));
      cameras[1].body_confidence
          = DenseArray<2>(DenseArray<2>::shape_type{3, 25});

      bool caught = false;
      try {
         assemble_body_confidence(cameras);
      } catch(ShapeMismatch& e) {
         caught = true;
         CATCH_REQUIRE(e.camera_index() == 1);
         CATCH_REQUIRE(e.expected() == vector<size_t>{3, 33});
         CATCH_REQUIRE(e.actual() == vector<size_t>{3, 25});
         CATCH_REQUIRE(string(e.what()).find("body point count")
                       != string::npos);
      }
      CATCH_REQUIRE(caught);
   }

   CATCH_SECTION("spatial-dims-must-be-2")
   {
      vector<PerCameraArrays> cameras;
      cameras.push_back(aggregate_camera(make_frames(2), 100, 100));
      cameras.push_back(aggregate_camera(make_frames(2), 100, 100));
      cameras[1].part(BodyPart::FACE)
          = DenseArray<3>(DenseArray<3>::shape_type{2, 478, 3});

      try {
         assemble_multi_camera(cameras);
         CATCH_REQUIRE(false);
      } catch(ShapeMismatch& e) {
         CATCH_REQUIRE(e.camera_index() == 1);
         CATCH_REQUIRE(e.actual() == vector<size_t>{2, 478, 3});
      }
   }

   CATCH_SECTION("no-cameras")
   {
      CATCH_REQUIRE_THROWS_AS(assemble_multi_camera({}), std::invalid_argument);
      CATCH_REQUIRE_THROWS_AS(assemble_body_confidence({}),
                              std::invalid_argument);
   }
}

} // namespace mocap
