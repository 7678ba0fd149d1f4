#pragma once

#include "frame-io.hpp"

namespace cv
{
class VideoCapture;
} // namespace cv

namespace mocap
{
class MovieReader final : public FrameSource
{
 private:
   int n_frames_ = 0;
   int frame_no_ = -1;
   int width_    = 0;
   int height_   = 0;
   real fps_     = 0.0;
   unique_ptr<cv::VideoCapture> video_;

 public:
   MovieReader();
   MovieReader(const MovieReader&) = delete;
   MovieReader(MovieReader&&)      = default;
   ~MovieReader() override;
   MovieReader& operator=(const MovieReader&) = delete;
   MovieReader& operator=(MovieReader&&) = default;

   bool open(string_view fname) noexcept;

   bool read(cv::Mat& im) noexcept(false) override;

   int width() const noexcept override { return width_; }
   int height() const noexcept override { return height_; }
   real fps() const noexcept override { return fps_; }

   int frame_no() const noexcept { return frame_no_; } // last frame read
   int n_frames() const noexcept { return n_frames_; } // container estimate
};

} // namespace mocap
