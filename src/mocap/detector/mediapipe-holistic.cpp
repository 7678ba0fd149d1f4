#include "stdinc.hpp"

#include "mediapipe-holistic.hpp"

#ifndef MOCAP_WITH_MEDIAPIPE

namespace mocap
{
// -----------------------------------------------------------------------------
// -----------------------------------------------------------------------------
// -----------------------------------------------------------------------------

struct MediapipeHolistic::Pimpl
{};

MediapipeHolistic::MediapipeHolistic(const detector::Params&) noexcept(false)
{
   throw std::runtime_error(
       "the 'mediapipe' detector backend was requested, but mediapipe wasn't "
       "compiled in! (Rebuild with MOCAP_WITH_MEDIAPIPE=ON)");
}

MediapipeHolistic::~MediapipeHolistic() = default;

void MediapipeHolistic::begin_video(const string_view) noexcept(false) {}

LandmarkSet MediapipeHolistic::detect(const cv::Mat&) noexcept(false)
{
   return LandmarkSet{};
}

} // namespace mocap

// -----------------------------------------------------------------------------
// -----------------------------------------------------------------------------
// -----------------------------------------------------------------------------

#else

#include "mocap/utils/file-system.hpp"

#include <opencv2/core/core.hpp>
#include <opencv2/imgproc/imgproc.hpp>

#include <map>

#include "mediapipe/calculators/tensor/tensors_to_detections_calculator.pb.h"
#include "mediapipe/calculators/util/thresholding_calculator.pb.h"
#include "mediapipe/framework/calculator_framework.h"
#include "mediapipe/framework/formats/image_frame.h"
#include "mediapipe/framework/formats/image_frame_opencv.h"
#include "mediapipe/framework/formats/landmark.pb.h"
#include "mediapipe/framework/port/parse_text_proto.h"
#include "mediapipe/framework/port/status.h"
#include "mediapipe/framework/validated_graph_config.h"

namespace mocap
{
static constexpr const char* k_input_stream = "input_video";

static constexpr array<std::pair<BodyPart, const char*>, k_n_body_parts>
    k_output_streams = {{{BodyPart::BODY, "pose_landmarks"},
                         {BodyPart::RIGHT_HAND, "right_hand_landmarks"},
                         {BodyPart::LEFT_HAND, "left_hand_landmarks"},
                         {BodyPart::FACE, "face_landmarks"}}};

// Calculators (inside the expanded holistic graph) that hold the thresholds
static constexpr string_view k_detection_calculator
    = "posedetectioncpu__TensorsToDetectionsCalculator";
static constexpr string_view k_tracking_calculator
    = "tensorstoposelandmarksandsegmentation__ThresholdingCalculator";

static void check_status(const absl::Status& status, const string_view op)
{
   if(!status.ok())
      throw std::runtime_error(
          format("mediapipe error while {}: {}", op, status.ToString()));
}

// Expands the subgraphs of `config`, and sets the confidence thresholds
static mediapipe::CalculatorGraphConfig
apply_confidence_thresholds(const mediapipe::CalculatorGraphConfig& config,
                            const detector::Params& params) noexcept(false)
{
   mediapipe::ValidatedGraphConfig validated;
   check_status(validated.Initialize(config), "expanding the holistic graph");

   auto expanded       = validated.Config();
   int n_detection_set = 0;
   int n_tracking_set  = 0;
   for(auto& node : *expanded.mutable_node()) {
      if(ends_with(node.name(), k_detection_calculator)) {
         node.mutable_options()
             ->MutableExtension(
                 mediapipe::TensorsToDetectionsCalculatorOptions::ext)
             ->set_min_score_thresh(float(params.min_detection_confidence));
         ++n_detection_set;
      } else if(ends_with(node.name(), k_tracking_calculator)) {
         node.mutable_options()
             ->MutableExtension(mediapipe::ThresholdingCalculatorOptions::ext)
             ->set_threshold(params.min_tracking_confidence);
         ++n_tracking_set;
      }
   }

   if(n_detection_set == 0 || n_tracking_set == 0)
      WARN(format("holistic graph has no '{}' or '{}' node; confidence "
                  "thresholds left at the graph's defaults",
                  k_detection_calculator,
                  k_tracking_calculator));

   return expanded;
}

// ----------------------------------------------------------------------- pimpl
//
struct MediapipeHolistic::Pimpl
{
   detector::Params params;
   mediapipe::CalculatorGraphConfig config;
   unique_ptr<mediapipe::CalculatorGraph> graph;
   int64_t frame_no = 0;
   bool is_running  = false;
   LandmarkSet current; // written by the output stream observers

   void init_graph() noexcept(false)
   {
      std::map<std::string, mediapipe::Packet> side_packets;
      side_packets["model_complexity"]
          = mediapipe::MakePacket<int>(params.model_complexity);
      side_packets["smooth_landmarks"]
          = mediapipe::MakePacket<bool>(params.smooth_landmarks);
      side_packets["refine_face_landmarks"]
          = mediapipe::MakePacket<bool>(params.refine_face_landmarks);

      const auto expanded = apply_confidence_thresholds(config, params);
      graph               = make_unique<mediapipe::CalculatorGraph>();
      check_status(graph->Initialize(expanded, side_packets),
                   "initializing the holistic graph");

      for(const auto& [part, stream] : k_output_streams) {
         const auto p = part;
         check_status(
             graph->ObserveOutputStream(
                 stream,
                 [this, p](const mediapipe::Packet& packet) -> absl::Status {
                    const auto& lms
                        = packet.Get<mediapipe::NormalizedLandmarkList>();
                    LandmarkSet::landmark_list ll;
                    ll.reserve(size_t(lms.landmark_size()));
                    for(const auto& l : lms.landmark())
                       ll.emplace_back(
                           l.x(),
                           l.y(),
                           l.has_visibility() ? l.visibility() : fNAN);
                    current.part(p) = std::move(ll);
                    return absl::OkStatus();
                 }),
             format("observing stream '{}'", stream));
      }
   }

   void start() noexcept(false)
   {
      init_graph();
      check_status(graph->StartRun({}), "starting the holistic graph");
      frame_no   = 0;
      is_running = true;
   }

   void stop() noexcept
   {
      if(!is_running) return;
      is_running = false;
      auto status = graph->CloseAllInputStreams();
      if(status.ok()) status = graph->WaitUntilDone();
      if(!status.ok())
         WARN(format("error shutting down mediapipe graph: {}",
                     status.ToString()));
   }
};

// ---------------------------------------------------------------- construction
//
MediapipeHolistic::MediapipeHolistic(const detector::Params& params) noexcept(
    false)
    : pimpl_(make_unique<Pimpl>())
{
   pimpl_->params = params;
   if(params.graph_config.empty())
      throw std::runtime_error(
          "the mediapipe backend requires 'graph_config', or "
          "MOCAP_MEDIAPIPE_GRAPH");

   const auto contents = file_get_contents(params.graph_config);
   if(!mediapipe::ParseTextProto<mediapipe::CalculatorGraphConfig>(
          contents, &pimpl_->config))
      throw std::runtime_error(format("failed to parse mediapipe graph '{}'",
                                      params.graph_config));

   if(params.feedback)
      INFO(format("loaded mediapipe holistic graph '{}'", params.graph_config));
}

MediapipeHolistic::~MediapipeHolistic()
{
   if(pimpl_) pimpl_->stop();
}

// ----------------------------------------------------------------- begin-video
// Restarting the graph resets landmark smoothing between videos.
void MediapipeHolistic::begin_video(const string_view fname) noexcept(false)
{
   pimpl_->stop();
   pimpl_->start();
   if(pimpl_->params.feedback)
      INFO(format("mediapipe holistic graph started for '{}'", fname));
}

// ---------------------------------------------------------------------- detect
//
LandmarkSet MediapipeHolistic::detect(const cv::Mat& image) noexcept(false)
{
   Expects(pimpl_->is_running);

   cv::Mat rgb;
   cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);

   auto frame = std::make_unique<mediapipe::ImageFrame>(
       mediapipe::ImageFormat::SRGB,
       rgb.cols,
       rgb.rows,
       mediapipe::ImageFrame::kDefaultAlignmentBoundary);
   cv::Mat view = mediapipe::formats::MatView(frame.get());
   rgb.copyTo(view);

   // Microseconds, at a nominal 30fps
   const auto timestamp = mediapipe::Timestamp(pimpl_->frame_no++ * 33333);

   pimpl_->current = LandmarkSet{};
   check_status(
       pimpl_->graph->AddPacketToInputStream(
           k_input_stream, mediapipe::Adopt(frame.release()).At(timestamp)),
       "sending a frame to the holistic graph");
   check_status(pimpl_->graph->WaitUntilIdle(),
                "waiting for the holistic graph");

   return pimpl_->current;
}

} // namespace mocap

#endif
