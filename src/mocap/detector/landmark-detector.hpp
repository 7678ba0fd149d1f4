#pragma once

#include "params.hpp"

#include "mocap/landmarks/landmark-set.hpp"

namespace cv
{
class Mat;
}

namespace mocap
{
// ------------------------------------------------------------ LandmarkDetector
//
// A long-lived handle on a landmark model. `detect` is called once per
// decoded frame, in decode order, and blocks until the result is ready.
class LandmarkDetector
{
 public:
   virtual ~LandmarkDetector() = default;

   // Called before the first frame of each video
   virtual void begin_video(const string_view fname) noexcept(false) = 0;

   // `image` is BGR, as decoded by OpenCV
   virtual LandmarkSet detect(const cv::Mat& image) noexcept(false) = 0;

   virtual const char* name() const noexcept = 0;
};

// Throws std::runtime_error if the backend cannot be created
unique_ptr<LandmarkDetector>
make_landmark_detector(const detector::Params& params) noexcept(false);

} // namespace mocap
