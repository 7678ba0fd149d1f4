
#include <algorithm>
#include <iterator>
#include <numbers>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/movie/render-landmarks.hpp"

#include <opencv2/core/core.hpp>

namespace mocap
{
static int count_lit(const cv::Mat& im)
{
   int n = 0;
   for(auto y = 0; y < im.rows; ++y)
      for(auto x = 0; x < im.cols; ++x)
         if(im.at<cv::Vec3b>(y, x) != cv::Vec3b(0, 0, 0)) ++n;
   return n;
}

CATCH_TEST_CASE("render-landmarks", "[render_landmarks]")
{
   CATCH_SECTION("connections-are-in-range")
   {
      for(const auto& c : get_pose_connections()) {
         CATCH_REQUIRE(c.kp0 >= 0);
         CATCH_REQUIRE(c.kp1 < k_n_body_points);
      }
      for(const auto& c : get_hand_connections()) {
         CATCH_REQUIRE(c.kp0 >= 0);
         CATCH_REQUIRE(c.kp1 < k_n_hand_points);
      }
      CATCH_REQUIRE(get_hand_connections().size() == 21);

      // 36 oval, 40 lips, 2 x (16 eye, 8 eyebrow, 4 iris)
      CATCH_REQUIRE(get_face_connections().size() == 132);
      for(const auto& c : get_face_connections()) {
         CATCH_REQUIRE(c.kp0 >= 0);
         CATCH_REQUIRE(c.kp1 >= 0);
         CATCH_REQUIRE(c.kp0 < k_n_face_points);
         CATCH_REQUIRE(c.kp1 < k_n_face_points);
         CATCH_REQUIRE(c.kp0 != c.kp1);
      }
   }

   CATCH_SECTION("draws-face-contours")
   {
      // Points on a circle, so every contour edge has length
      LandmarkSet lms;
      lms.face = LandmarkSet::landmark_list{};
      for(auto i = 0; i < k_n_face_points; ++i) {
         const auto theta
             = 2.0 * std::numbers::pi * real(i) / real(k_n_face_points);
         lms.face->emplace_back(float(0.5 + 0.4 * std::cos(theta)),
                                float(0.5 + 0.4 * std::sin(theta)));
      }

      cv::Mat im = cv::Mat::zeros(120, 160, CV_8UC3);
      render_landmarks(im, lms);
      CATCH_REQUIRE(count_lit(im) > 0);

      // A face without irises (468 points) still draws
      lms.face->resize(468);
      cv::Mat im2 = cv::Mat::zeros(120, 160, CV_8UC3);
      render_landmarks(im2, lms);
      CATCH_REQUIRE(count_lit(im2) > 0);
   }

   CATCH_SECTION("absent-parts-draw-nothing")
   {
      cv::Mat im = cv::Mat::zeros(120, 160, CV_8UC3);
      render_landmarks(im, LandmarkSet{});
      CATCH_REQUIRE(count_lit(im) == 0);

      // NaN coordinates are skipped
      LandmarkSet lms;
      lms.body = LandmarkSet::landmark_list(size_t(k_n_body_points));
      render_landmarks(im, lms);
      CATCH_REQUIRE(count_lit(im) == 0);
   }

   CATCH_SECTION("draws-body-and-hands")
   {
      LandmarkSet lms;
      lms.body = LandmarkSet::landmark_list{};
      for(auto i = 0; i < k_n_body_points; ++i)
         lms.body->emplace_back(0.1f + 0.02f * float(i), 0.5f, 0.9f);
      lms.left_hand = LandmarkSet::landmark_list{};
      for(auto i = 0; i < k_n_hand_points; ++i)
         lms.left_hand->emplace_back(0.5f, 0.1f + 0.03f * float(i));

      cv::Mat im = cv::Mat::zeros(120, 160, CV_8UC3);
      render_landmarks(im, lms);
      CATCH_REQUIRE(count_lit(im) > 0);

      // Landmarks off the image are clipped, not an error
      for(auto& l : *lms.body) l.x += 5.0f;
      cv::Mat im2 = cv::Mat::zeros(120, 160, CV_8UC3);
      render_landmarks(im2, lms);
   }

   CATCH_SECTION("ignores-other-image-types")
   {
      LandmarkSet lms;
      lms.face = LandmarkSet::landmark_list(size_t(k_n_face_points),
                                            Landmark(0.5f, 0.5f));
      cv::Mat grey = cv::Mat::zeros(32, 32, CV_8UC1);
      render_landmarks(grey, lms);
      CATCH_REQUIRE(cv::countNonZero(grey) == 0);
   }
}

} // namespace mocap
