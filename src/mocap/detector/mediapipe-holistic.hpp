#pragma once

#include "landmark-detector.hpp"

namespace mocap
{
// Runs a MediaPipe holistic landmark graph. Only available when built with
// MOCAP_WITH_MEDIAPIPE; otherwise the constructor throws.
class MediapipeHolistic final : public LandmarkDetector
{
 private:
   struct Pimpl;
   unique_ptr<Pimpl> pimpl_;

 public:
   explicit MediapipeHolistic(const detector::Params& params) noexcept(false);
   MediapipeHolistic(const MediapipeHolistic&) = delete;
   MediapipeHolistic(MediapipeHolistic&&)      = default;
   ~MediapipeHolistic() override;
   MediapipeHolistic& operator=(const MediapipeHolistic&) = delete;
   MediapipeHolistic& operator=(MediapipeHolistic&&) = default;

   void begin_video(const string_view fname) noexcept(false) override;
   LandmarkSet detect(const cv::Mat& image) noexcept(false) override;
   const char* name() const noexcept override { return "mediapipe"; }
};

} // namespace mocap
