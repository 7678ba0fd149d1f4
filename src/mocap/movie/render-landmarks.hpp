#pragma once

#include "mocap/landmarks/landmark-set.hpp"

namespace cv
{
class Mat;
}

namespace mocap
{
// A line between two tracked points of the same body part
struct LandmarkConnection final
{
   int16_t kp0     = 0;
   int16_t kp1     = 0;
   uint32_t kolour = 0x00FFFFFFu; // 0xRRGGBB
};

const vector<LandmarkConnection>& get_pose_connections() noexcept;
const vector<LandmarkConnection>& get_hand_connections() noexcept;

// Face oval, lips, eyes, eyebrows, and irises of the 478 point face mesh
const vector<LandmarkConnection>& get_face_connections() noexcept;

// Draws the landmarks over `im` (BGR, CV_8UC3). Absent parts, and points with
// non-finite coordinates, are skipped.
void render_landmarks(cv::Mat& im,
                      const LandmarkSet& landmarks) noexcept(false);

} // namespace mocap
