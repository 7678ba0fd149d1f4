#include "cli-args.hpp"

#include "mocap/utils/cli-utils.hpp"
#include "mocap/utils/file-system.hpp"

#include "json/json.h"

#define This CliArgs

namespace mocap::pipeline
{
// ------------------------------------------------------------------- meta data
//
const vector<MemberMetaData>& This::meta_data() const noexcept
{
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(This, STRING, version, true));
      m.push_back(MAKE_META(This, BOOL, show_help, true));
      m.push_back(MAKE_META(This, BOOL, has_error, true));
      m.push_back(MAKE_META(This, STRING, session_id, true));
      m.push_back(MAKE_META(This, STRING, data_dir, true));
      m.push_back(MAKE_META(This, COMPATIBLE_OBJECT, params, true));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

// ------------------------------------------------------------------- show help
//
void show_help(string argv0) noexcept
{
   Params defaults;
   cout << format(R"V0G0N(

   Usage: {} detect-skeletons -s <session-id> [OPTIONS...]

      Runs the landmark detector over every camera video of a session, and
      saves pixel-space landmarks as [cameras, frames, 553, 2] float64 `.npy`.

      Reads:   <data-dir>/<session-id>/synchronized_videos/*{}
      Writes:  <data-dir>/<session-id>/output_data/
               <data-dir>/<session-id>/annotated_videos/

   Options:

      -s <session-id>          Session folder name. Required.
      --data-dir <dir>         Overrides MOCAP_DATA_DIR.

      -p <filename>            Parameters json file.
      --p-json <json>          Parameters as a json string.
                               (See `dump-default-params`.)

      --backend <name>         Landmark detector: 'replay' or 'mediapipe'.
                               Default is '{}'.
      --replay-dir <dir>       Directory of '<video-stem>_landmarks.json'
                               recordings. Overrides MOCAP_REPLAY_DIR.
      --graph <pbtxt>          MediaPipe holistic graph config.
                               Overrides MOCAP_MEDIAPIPE_GRAPH.

      --fps <number>           Frame rate of annotated videos. Default is {}.
      --no-annotated-videos    Do not render annotated videos.
      --legacy-broadcast       Write the last landmark of each body part
                               into every point of that part.

   Environment:

      MOCAP_DATA_DIR, MOCAP_REPLAY_DIR, MOCAP_MEDIAPIPE_GRAPH,
      MOCAP_TRACE_MODE, MOCAP_LOG_LEVEL

)V0G0N",
                  basename(argv0),
                  defaults.video_extension,
                  str(defaults.detector_params.backend),
                  defaults.annotated_video_fps);
}

// ---------------------------------------------------------- parse command line
//
CliArgs parse_command_line(
    int argc,
    char** argv,
    std::function<bool(int argc, char** argv, int& i)> callback) noexcept
{
   CliArgs config;
   auto has_error = false;

   // (*) ---- Search for '-h/--help'
   for(int i = 1; i < argc and !config.show_help; ++i)
      if(strcmp(argv[i], "-h") == 0 or strcmp(argv[i], "--help") == 0)
         config.show_help = true;
   if(config.show_help) return config;

   // (*) ---- Parse command line
   string params_fname    = ""s;
   string params_json_str = ""s;
   string backend_str     = ""s;
   string replay_dir      = ""s;
   string graph_config    = ""s;
   real fps               = dNAN;
   bool no_annotated      = false;
   bool legacy_broadcast  = false;

   for(int i = 1; i < argc; ++i) {
      const string arg = argv[i];
      try {
         if(callback and callback(argc, argv, i)) {
            continue;
         } else if(arg == "-s"s or arg == "--session"s) {
            config.session_id = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--data-dir"s) {
            config.data_dir = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "-p"s) {
            params_fname = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--p-json"s) {
            params_json_str = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--backend"s) {
            backend_str = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--replay-dir"s) {
            replay_dir = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--graph"s) {
            graph_config = cli::safe_arg_str(argc, argv, i);
         } else if(arg == "--fps"s) {
            fps = cli::safe_arg_real(argc, argv, i);
         } else if(arg == "--no-annotated-videos"s) {
            no_annotated = true;
         } else if(arg == "--legacy-broadcast"s) {
            legacy_broadcast = true;
         } else {
            LOG_ERR(format("unexpected command-line argument: '{}'", arg));
            has_error = true;
         }
      } catch(std::runtime_error& e) {
         LOG_ERR(format("error on command-line: {}", e.what()));
         has_error = true;
      }
   }

   // (*) ---- Perform sanity checks
   if(config.session_id.empty()) {
      LOG_ERR(format("must specify a session id (i.e., -s <session-id>)"));
      has_error = true;
   }

   if(!config.data_dir.empty() and !is_directory(config.data_dir)) {
      LOG_ERR(format("failed to find data directory '{}'", config.data_dir));
      has_error = true;
   }

   if(!params_fname.empty() and !params_json_str.empty()) {
      LOG_ERR(format("cannot specify both -p and --p-json"));
      has_error = true;
   }

   // Handle parameters
   Json::Value params_json{Json::nullValue};
   if(!params_json_str.empty()) {
      if(!parse_json(params_json_str, params_json)) {
         LOG_ERR(format("failed to parse params json string: '{}'",
                        params_json_str));
         has_error = true;
      }
   } else if(!params_fname.empty()) {
      try {
         params_json = parse_json(file_get_contents(params_fname));
      } catch(std::exception& e) {
         LOG_ERR(format(
             "failed to load json file '{}': {}", params_fname, e.what()));
         has_error = true;
      }
   }

   if(params_json.type() != Json::nullValue) {
      try {
         mocap::read(config.params, params_json);
      } catch(std::exception& e) {
         LOG_ERR(format("failed to read parameters: {}", e.what()));
         has_error = true;
      }
   }

   // Individual overrides
   auto& det = config.params.detector_params;
   if(!backend_str.empty()) {
      try {
         det.backend = detector::to_backend(backend_str);
      } catch(std::runtime_error& e) {
         LOG_ERR(format("--backend: {}", e.what()));
         has_error = true;
      }
   }
   if(!replay_dir.empty()) det.replay_dir = replay_dir;
   if(!graph_config.empty()) det.graph_config = graph_config;
   if(!std::isnan(fps)) config.params.annotated_video_fps = fps;
   if(no_annotated) config.params.save_annotated_videos = false;
   if(legacy_broadcast) config.params.legacy_broadcast_last_landmark = true;

   if(!det.replay_dir.empty() and !is_directory(det.replay_dir)) {
      LOG_ERR(format("failed to find replay directory '{}'", det.replay_dir));
      has_error = true;
   }

   if(det.backend == detector::Backend::MEDIAPIPE and !k_has_mediapipe) {
      LOG_ERR(format("the mediapipe backend wasn't compiled in"));
      has_error = true;
   }

   if(!(config.params.annotated_video_fps > 0.0)
      or !std::isfinite(config.params.annotated_video_fps)) {
      LOG_ERR(format("invalid annotated_video_fps = {}",
                     config.params.annotated_video_fps));
      has_error = true;
   }

   // (*) ---- Finalize and return result
   config.has_error = has_error;

   return config;
}

} // namespace mocap::pipeline
