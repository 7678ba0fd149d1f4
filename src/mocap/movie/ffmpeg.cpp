#include "stdinc.hpp"

#include "ffmpeg.hpp"

#include <opencv2/core/core.hpp>
#include <opencv2/imgproc/imgproc.hpp>

#include <boost/process.hpp>

#include <csignal>

#define This StreamingFFMpegEncoder

namespace mocap::movie
{
namespace bp = boost::process;

// ----------------------------------------------------------------------- Pimpl
//
struct This::Pimpl
{
   bp::pipe pipe;
   bp::child subprocess;
   cv::Mat rgb;
   string output_fname;
   int width       = 0;
   int height      = 0;
   real frame_rate = 0.0;

   ~Pimpl()
   {
      try {
         close();
      } catch(std::exception& e) {
         WARN(format("error closing '{}': {}", output_fname, e.what()));
      }
   }

   void init(const string_view output_fname, int w, int h, real frame_rate)
   {
      if(w <= 0 || h <= 0)
         throw std::runtime_error(
             format("invalid video size {}x{} for '{}'", w, h, output_fname));
      if(!std::isfinite(frame_rate) || !(frame_rate > 0.0))
         throw std::runtime_error(
             format("invalid frame rate {} for '{}'",
                    frame_rate,
                    output_fname));

      this->output_fname = output_fname;
      this->width        = w;
      this->height       = h;
      this->frame_rate   = frame_rate;

      auto find_ffmpeg_exe = [&]() { // attempt to find the ffmpeg executable
         const char* exe = "ffmpeg";
         const auto path = bp::search_path(exe);
         if(path.empty())
            throw std::runtime_error(
                format("failed to find executable '{}' on path", exe));
         return path;
      };
      const auto exe_path = find_ffmpeg_exe();

      // A write to an exited ffmpeg must fail with EPIPE, not kill us
      std::signal(SIGPIPE, SIG_IGN);

      subprocess = bp::child(exe_path,
                             "-hide_banner",
                             "-y", // allow overwrite
                             "-f", // input format
                             "rawvideo",
                             "-pix_fmt", // input pixel format
                             "rgb24",
                             "-video_size",
                             format("{}x{}", width, height),
                             "-r", // framerate
                             str(frame_rate),
                             "-i", // input
                             "-",
                             "-c:v", // video codec
                             "mpeg4",
                             "-qscale:v", // quality
                             "2",
                             this->output_fname,
                             bp::std_out > bp::null,
                             bp::std_err > bp::null,
                             bp::std_in < pipe);
   }

   void push_frame(const cv::Mat& im)
   {
      if(!pipe.is_open())
         throw std::runtime_error(
             format("pushing a frame to closed encoder '{}'", output_fname));
      if((im.rows != height) || (im.cols != width))
         throw std::runtime_error(format("frame shape mismatch: {}x{} != {}x{}",
                                         im.cols,
                                         im.rows,
                                         width,
                                         height));
      if(!subprocess.running())
         throw std::runtime_error(
             format("ffmpeg exited early (code {}) encoding '{}'",
                    subprocess.exit_code(),
                    output_fname));

      switch(im.type()) {
      case CV_8UC3: cv::cvtColor(im, rgb, cv::COLOR_BGR2RGB); break;
      case CV_8UC1: cv::cvtColor(im, rgb, cv::COLOR_GRAY2RGB); break;
      default:
         throw std::runtime_error(format(
             "unsupported color space: cv::Mat.type() == {}", im.type()));
      }

      const int row_bytes = width * 3;
      for(auto y = 0; y < height; ++y)
         if(pipe.write(rgb.ptr<char>(y), row_bytes) != row_bytes)
            throw std::runtime_error(
                format("short write piping frame to ffmpeg for '{}'",
                       output_fname));
   }

   int close()
   {
      if(pipe.is_open()) {
         pipe.close();
         std::error_code ec;
         subprocess.wait(ec);
         if(ec) {
            throw std::runtime_error(
                format("error waiting for ffmpeg to end: {}", ec.message()));
         }
      }
      return subprocess.valid() ? subprocess.exit_code() : -1;
   }
};

This::This()
    : pimpl_(new Pimpl)
{}
This::This(This&&) noexcept = default;
This::~This()                = default;
This& This::operator=(This&&) noexcept = default;
void This::push_frame(const cv::Mat& frame) { pimpl_->push_frame(frame); }
int This::close() { return pimpl_->close(); }

StreamingFFMpegEncoder This::create(const string_view output_fname,
                                    const int width,
                                    const int height,
                                    const real frame_rate) noexcept(false)
{
   StreamingFFMpegEncoder o;
   o.pimpl_->init(output_fname, width, height, frame_rate);
   return o;
}

} // namespace mocap::movie

#undef This
