#pragma once

#include "mocap/foundation.hpp"

namespace cv
{
class Mat;
}

namespace mocap
{
// ----------------------------------------------------------------- FrameSource
//
// Sequential video decoder.
class FrameSource
{
 public:
   virtual ~FrameSource() = default;

   // Decodes the next frame (BGR) into `im`. Returns false at end of stream,
   // or if the frame could not be decoded.
   virtual bool read(cv::Mat& im) noexcept(false) = 0;

   virtual int width() const noexcept  = 0;
   virtual int height() const noexcept = 0;
   virtual real fps() const noexcept   = 0;
};

// ------------------------------------------------------------------- FrameSink
//
// Sequential video encoder.
class FrameSink
{
 public:
   virtual ~FrameSink() = default;

   virtual void push_frame(const cv::Mat& im) noexcept(false) = 0;

   // Flushes and finalizes the output. Returns the encoder's exit code.
   virtual int close() noexcept(false) = 0;
};

} // namespace mocap
