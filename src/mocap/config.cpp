#include "config.hpp"

#include "stdinc.hpp"

#include "mocap/utils/file-system.hpp"

#include "json/json.h"

#include <stdlib.h>
#include <unistd.h>

#include <mutex>

#include <boost/lexical_cast.hpp>

namespace mocap
{
struct EnvironmentVariables
{
   bool is_init                = false;
   std::string data_dir        = ""s;
   std::string replay_dir      = ""s;
   std::string mediapipe_graph = ""s;
   bool trace_mode             = false;
   int log_level               = 0;

   string make_config_info_str();
   void init_config(const Json::Value& o);
};

static EnvironmentVariables env_vars_;

static void init_instance(const Json::Value& o) noexcept
{
   env_vars_.init_config(o);
}

static EnvironmentVariables& instance()
{
   if(!env_vars_.is_init)
      FATAL(format("Must call 'load_environment_variables()' before attempting "
                   "to load any environmental variables"));
   return env_vars_;
}

// -------------------------------------------------------- make config info str
//
string EnvironmentVariables::make_config_info_str()
{
   auto make_build_str = []() {
      std::stringstream ss{""};
      bool needs_comma = false;
      auto push_ss     = [&](const string_view s) {
         if(needs_comma) ss << ", ";
         ss << s;
         needs_comma = true;
      };
      auto push_bool = [&](bool val, const string_view s) {
         if(val) push_ss(s);
      };
      push_bool(k_is_cli_build, "cli");
      push_bool(k_is_testcase_build, "testcases");
      push_bool(k_is_debug_build, "debug");
      push_bool(k_is_release_build, "release");
      push_bool(k_is_asan_build, "asan");
      push_bool(k_has_mediapipe, "mediapipe");
      return ss.str();
   };

   return format(R"V0G0N(
   k-mocap-version               = '{}'
   build-configuration           =  {}
   MOCAP_DATA_DIR                = '{}'
   MOCAP_REPLAY_DIR              = '{}'
   MOCAP_MEDIAPIPE_GRAPH         = '{}'
   MOCAP_TRACE_MODE              =  {}
   MOCAP_LOG_LEVEL               =  {}
)V0G0N",
                 k_version,
                 make_build_str(),
                 data_dir,
                 replay_dir,
                 mediapipe_graph,
                 str(trace_mode),
                 log_level);
}

// -------------------------------------------------------------------- read-env
//
static Json::Value read_env()
{
   Json::Value o{Json::objectValue};

   auto get_w_default
       = [&o](const std::string_view name,
              const std::string_view default_value) -> std::string {
      const char* ss = getenv(name.data());
      const auto ret
          = (ss == nullptr) ? std::string(default_value) : std::string(ss);
      o[string(name)] = ret;
      return ret;
   };

   auto get_bool_w_default = [&](const std::string_view name) -> bool {
      const auto val  = get_w_default(name, "");
      const auto ret  = (val == std::string("1") or val == std::string("true"));
      o[string(name)] = ret;
      return ret;
   };

   auto get_int_w_default = [&](const std::string_view name, int def) -> int {
      const auto s = get_w_default(name, "");
      int ret      = def;
      if(s.size() > 0) {
         using boost::lexical_cast;
         using boost::bad_lexical_cast;
         try {
            ret = lexical_cast<int>(s);
         } catch(bad_lexical_cast&) {
            FATAL(
                format("bad lexical cast reading environment variable {}='{}' "
                       "as an integer",
                       name,
                       s));
         }
      }
      o[string(name)] = ret;
      return ret;
   };

   get_w_default("MOCAP_DATA_DIR", ""s);
   get_w_default("MOCAP_REPLAY_DIR", ""s);
   get_w_default("MOCAP_MEDIAPIPE_GRAPH", ""s);
   get_bool_w_default("MOCAP_TRACE_MODE");
   get_int_w_default("MOCAP_LOG_LEVEL", 1);

   return o;
}

const Json::Value& get_env_data()
{
   static std::mutex padlock_;
   static bool first_run_ = true;
   static Json::Value env_data_;
   {
      std::lock_guard<decltype(padlock_)> lock(padlock_);
      if(first_run_) {
         env_data_  = read_env();
         first_run_ = false;
      }
   }

   return env_data_;
}

// ----------------------------------------------------------------- init config
//
void EnvironmentVariables::init_config(const Json::Value& o)
{
   auto make_default_data_dir = []() {
      const auto home_s     = getenv("HOME");
      const string home_dir = (home_s == nullptr) ? "" : home_s;
      if(home_dir.empty()) {
         FATAL(format("failed to find $HOME environment variable, and "
                      "MOCAP_DATA_DIR is not set, aborting."));
      } else if(!is_directory(home_dir)) {
         FATAL(format("Environment variable HOME='{}' is not a directory!",
                      home_dir));
      }
      return format("{}/mocap_data", home_dir);
   };

   data_dir = o["MOCAP_DATA_DIR"].asString();
   if(data_dir.empty()) data_dir = make_default_data_dir();
   if(!is_directory(data_dir))
      WARN(format("MOCAP_DATA_DIR='{}' does not exist (yet)", data_dir));

   replay_dir      = o["MOCAP_REPLAY_DIR"].asString();
   mediapipe_graph = o["MOCAP_MEDIAPIPE_GRAPH"].asString();
   trace_mode      = o["MOCAP_TRACE_MODE"].asBool();
   log_level       = o["MOCAP_LOG_LEVEL"].asInt();

   if(log_level >= 1 && log_level <= 3) Logger::set_log_level(log_level);

   is_init = true;
}

// -------------------------------------------------- load environment variables
//

void load_environment_variables() noexcept { init_instance(get_env_data()); }

// --------------------------------------------------------------------- getters
//
const std::string& mocap_data_dir() noexcept { return instance().data_dir; }

const std::string& mocap_replay_dir() noexcept
{
   return instance().replay_dir;
}

const std::string& mocap_mediapipe_graph() noexcept
{
   return instance().mediapipe_graph;
}

bool mocap_trace_mode() noexcept { return instance().trace_mode; }

// ---------------------------------------------------------- configuration-info
//
string environment_info() noexcept { return instance().make_config_info_str(); }

} // namespace mocap
