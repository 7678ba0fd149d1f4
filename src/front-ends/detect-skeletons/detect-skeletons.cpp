#include "stdinc.hpp"

#include "detect-skeletons-inc.hpp"

#include "mocap/detector/landmark-detector.hpp"
#include "mocap/pipeline/cli-args.hpp"
#include "mocap/pipeline/session-pipeline.hpp"

namespace mocap::detect_skeletons
{
// -------------------------------------------------------------------- run main
//
int run_main(int argc, char** argv)
{
   const auto config = pipeline::parse_command_line(argc, argv);
   if(config.show_help) {
      pipeline::show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(config.has_error) {
      LOG_ERR(format("aborting due to previous errors..."));
      return EXIT_FAILURE;
   }

   // Output the configuration info
   INFO(format("Mocap Configuration:"));
   std::cout << environment_info() << std::endl;

   bool success = false;
   try {
      const auto& data_dir
          = config.data_dir.empty() ? mocap_data_dir() : config.data_dir;
      const auto paths
          = pipeline::SessionPaths::make(data_dir, config.session_id);

      if(config.params.feedback) {
         std::cout << str(paths) << std::endl;
         std::cout << str(config.params) << std::endl;
      }

      auto detector = make_landmark_detector(config.params.detector_params);
      INFO(format("landmark detector: {}", detector->name()));

      const auto result
          = pipeline::process_session(paths, *detector, config.params);

      INFO(format("{} cameras, {} frames, saved to '{}'",
                  result.n_cameras(),
                  result.data2d.shape(1),
                  paths.output_data_dir));
      success = true;
   } catch(std::exception& e) {
      LOG_ERR(format("failed: {}", e.what()));
   }

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace mocap::detect_skeletons
