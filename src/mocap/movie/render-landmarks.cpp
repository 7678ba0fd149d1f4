#include "stdinc.hpp"

#include "render-landmarks.hpp"

#include <initializer_list>
#include <iterator>

#include <opencv2/core/core.hpp>
#include <opencv2/imgproc/imgproc.hpp>

namespace mocap
{
static constexpr uint32_t k_left_kolour   = 0x00FF8000u; // orange
static constexpr uint32_t k_right_kolour  = 0x0000C8FFu; // azure
static constexpr uint32_t k_centre_kolour = 0x00E0E0E0u; // light grey
static constexpr uint32_t k_face_kolour   = 0x00C0C0C0u;
static constexpr uint32_t k_thumb_kolour  = 0x00FFE000u;
static constexpr uint32_t k_finger_kolour = 0x0080FF80u;

static cv::Scalar kolour_to_scalar(uint32_t k) noexcept
{
   return cv::Scalar((k >> 0) & 0xff, (k >> 8) & 0xff, (k >> 16) & 0xff);
}

// ------------------------------------------------------------ pose connections
//
const vector<LandmarkConnection>& get_pose_connections() noexcept
{
   static const vector<LandmarkConnection> bones_ = {
       // face
       {0, 1, k_left_kolour},
       {1, 2, k_left_kolour},
       {2, 3, k_left_kolour},
       {3, 7, k_left_kolour},
       {0, 4, k_right_kolour},
       {4, 5, k_right_kolour},
       {5, 6, k_right_kolour},
       {6, 8, k_right_kolour},
       {9, 10, k_centre_kolour},
       // torso
       {11, 12, k_centre_kolour},
       {11, 23, k_left_kolour},
       {12, 24, k_right_kolour},
       {23, 24, k_centre_kolour},
       // left arm
       {11, 13, k_left_kolour},
       {13, 15, k_left_kolour},
       {15, 17, k_left_kolour},
       {15, 19, k_left_kolour},
       {15, 21, k_left_kolour},
       {17, 19, k_left_kolour},
       // right arm
       {12, 14, k_right_kolour},
       {14, 16, k_right_kolour},
       {16, 18, k_right_kolour},
       {16, 20, k_right_kolour},
       {16, 22, k_right_kolour},
       {18, 20, k_right_kolour},
       // left leg
       {23, 25, k_left_kolour},
       {25, 27, k_left_kolour},
       {27, 29, k_left_kolour},
       {29, 31, k_left_kolour},
       {27, 31, k_left_kolour},
       // right leg
       {24, 26, k_right_kolour},
       {26, 28, k_right_kolour},
       {28, 30, k_right_kolour},
       {30, 32, k_right_kolour},
       {28, 32, k_right_kolour}};
   return bones_;
}

// ------------------------------------------------------------ hand connections
//
const vector<LandmarkConnection>& get_hand_connections() noexcept
{
   static const vector<LandmarkConnection> bones_ = {
       {0, 1, k_thumb_kolour},    {1, 2, k_thumb_kolour},
       {2, 3, k_thumb_kolour},    {3, 4, k_thumb_kolour},
       {0, 5, k_centre_kolour},   {5, 9, k_centre_kolour},
       {9, 13, k_centre_kolour},  {13, 17, k_centre_kolour},
       {0, 17, k_centre_kolour},  {5, 6, k_finger_kolour},
       {6, 7, k_finger_kolour},   {7, 8, k_finger_kolour},
       {9, 10, k_finger_kolour},  {10, 11, k_finger_kolour},
       {11, 12, k_finger_kolour}, {13, 14, k_finger_kolour},
       {14, 15, k_finger_kolour}, {15, 16, k_finger_kolour},
       {17, 18, k_finger_kolour}, {18, 19, k_finger_kolour},
       {19, 20, k_finger_kolour}};
   return bones_;
}

// ------------------------------------------------------------ face connections
//
const vector<LandmarkConnection>& get_face_connections() noexcept
{
   using chain_type = std::initializer_list<int16_t>;
   auto make_bones  = []() {
      vector<LandmarkConnection> o;
      auto push_chain = [&](const chain_type& chain, uint32_t k) {
         for(auto ii = std::next(cbegin(chain)); ii != cend(chain); ++ii)
            o.push_back({*std::prev(ii), *ii, k});
      };

      // face oval
      push_chain({10,  338, 297, 332, 284, 251, 389, 356, 454, 323,
                  361, 288, 397, 365, 379, 378, 400, 377, 152, 148,
                  176, 149, 150, 136, 172, 58,  132, 93,  234, 127,
                  162, 21,  54,  103, 67,  109, 10},
                 k_face_kolour);

      // lips, outer then inner
      push_chain({61, 146, 91, 181, 84, 17, 314, 405, 321, 375, 291},
                 k_face_kolour);
      push_chain({61, 185, 40, 39, 37, 0, 267, 269, 270, 409, 291},
                 k_face_kolour);
      push_chain({78, 95, 88, 178, 87, 14, 317, 402, 318, 324, 308},
                 k_face_kolour);
      push_chain({78, 191, 80, 81, 82, 13, 312, 311, 310, 415, 308},
                 k_face_kolour);

      // left eye, eyebrow, and iris
      push_chain({263, 249, 390, 373, 374, 380, 381, 382, 362},
                 k_left_kolour);
      push_chain({263, 466, 388, 387, 386, 385, 384, 398, 362},
                 k_left_kolour);
      push_chain({276, 283, 282, 295, 285}, k_left_kolour);
      push_chain({300, 293, 334, 296, 336}, k_left_kolour);
      push_chain({474, 475, 476, 477, 474}, k_left_kolour);

      // right eye, eyebrow, and iris
      push_chain({33, 7, 163, 144, 145, 153, 154, 155, 133}, k_right_kolour);
      push_chain({33, 246, 161, 160, 159, 158, 157, 173, 133},
                 k_right_kolour);
      push_chain({46, 53, 52, 65, 55}, k_right_kolour);
      push_chain({70, 63, 105, 66, 107}, k_right_kolour);
      push_chain({469, 470, 471, 472, 469}, k_right_kolour);

      return o;
   };

   static const vector<LandmarkConnection> bones_ = make_bones();
   return bones_;
}

// ------------------------------------------------------------ render-landmarks
//
void render_landmarks(cv::Mat& im,
                      const LandmarkSet& landmarks) noexcept(false)
{
   if(im.empty() || im.type() != CV_8UC3) return;

   const auto w = real(im.cols);
   const auto h = real(im.rows);

   auto to_pixel = [&](const Landmark& l, cv::Point& out) {
      const auto x = real(l.x) * w;
      const auto y = real(l.y) * h;
      if(!std::isfinite(x) || !std::isfinite(y)) return false;
      out = cv::Point(int(std::round(x)), int(std::round(y)));
      return true;
   };

   auto draw_connections = [&](const vector<Landmark>& ll,
                               const vector<LandmarkConnection>& bones) {
      cv::Point a, b;
      for(const auto& bone : bones) {
         if(size_t(bone.kp0) >= ll.size() || size_t(bone.kp1) >= ll.size())
            continue;
         if(to_pixel(ll[size_t(bone.kp0)], a)
            && to_pixel(ll[size_t(bone.kp1)], b))
            cv::line(im, a, b, kolour_to_scalar(bone.kolour), 1, cv::LINE_AA);
      }
   };

   auto draw_points = [&](const vector<Landmark>& ll, uint32_t k, int radius) {
      cv::Point a;
      for(const auto& l : ll)
         if(to_pixel(l, a))
            cv::circle(im, a, radius, kolour_to_scalar(k), cv::FILLED);
   };

   if(landmarks.face)
      draw_connections(*landmarks.face, get_face_connections());

   if(landmarks.body) {
      draw_connections(*landmarks.body, get_pose_connections());
      draw_points(*landmarks.body, k_centre_kolour, 2);
   }

   if(landmarks.left_hand)
      draw_connections(*landmarks.left_hand, get_hand_connections());
   if(landmarks.right_hand)
      draw_connections(*landmarks.right_hand, get_hand_connections());
}

} // namespace mocap
