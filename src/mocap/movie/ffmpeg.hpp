#pragma once

#include "frame-io.hpp"

namespace mocap::movie
{
// ------------------------------------------------- call ffmpeg to make a movie
// Streaming encoder... encodes on the fly, by piping rgb24 frames into an
// `ffmpeg` subprocess.
//
// EXAMPLE
//
// MovieReader reader;
// if(!reader.open(movie_filename)) FATAL("failed to open movie");
// auto encoder = movie::StreamingFFMpegEncoder::create(
//     output_fname, reader.width(), reader.height(), 30.0);
//
// cv::Mat im;
// while(reader.read(im)) encoder.push_frame(im);
//
// return encoder.close();
//
class StreamingFFMpegEncoder final : public FrameSink
{
 private:
   struct Pimpl;
   unique_ptr<Pimpl> pimpl_;

   StreamingFFMpegEncoder();

 public:
   StreamingFFMpegEncoder(const StreamingFFMpegEncoder&) = delete;
   StreamingFFMpegEncoder(StreamingFFMpegEncoder&&) noexcept;
   ~StreamingFFMpegEncoder() override;
   StreamingFFMpegEncoder& operator=(const StreamingFFMpegEncoder&) = delete;
   StreamingFFMpegEncoder& operator=(StreamingFFMpegEncoder&&) noexcept;

   // Throws std::runtime_error if `ffmpeg` cannot be found or started
   static StreamingFFMpegEncoder create(const string_view output_fname,
                                        const int width,
                                        const int height,
                                        const real frame_rate) noexcept(false);

   void push_frame(const cv::Mat& frame) noexcept(false) override;
   int close() noexcept(false) override; // waits for ffmpeg, returns exit-code
};

} // namespace mocap::movie
