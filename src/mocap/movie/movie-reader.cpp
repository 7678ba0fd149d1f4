#include "stdinc.hpp"

#include "movie-reader.hpp"

#include <opencv2/core/core.hpp>
#include <opencv2/videoio.hpp>

#define This MovieReader

namespace mocap
{
This::This()  = default;
This::~This() = default;

bool This::open(string_view fname) noexcept
{
   video_    = make_unique<cv::VideoCapture>(string(fname));
   frame_no_ = -1;
   if(!video_ || !video_->isOpened()) {
      video_.reset();
      n_frames_ = width_ = height_ = 0;
      fps_                         = 0.0;
      return false;
   }
   n_frames_ = int(video_->get(cv::CAP_PROP_FRAME_COUNT));
   width_    = int(video_->get(cv::CAP_PROP_FRAME_WIDTH));
   height_   = int(video_->get(cv::CAP_PROP_FRAME_HEIGHT));
   fps_      = video_->get(cv::CAP_PROP_FPS);
   return true;
}

bool This::read(cv::Mat& im) noexcept(false)
{
   if(!video_) throw std::logic_error("reading from a movie that isn't open");
   if(!video_->read(im) || im.empty()) return false;
   ++frame_no_;
   return true;
}

} // namespace mocap

#undef This
