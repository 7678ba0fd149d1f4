#include "params.hpp"

namespace mocap::detector
{
// --------------------------------------------------------------------- backend
//
Backend to_backend(const string_view val) noexcept(false)
{
   const auto s = string_to_lowercase(val);
   if(s == "replay") return Backend::REPLAY;
   if(s == "mediapipe") return Backend::MEDIAPIPE;
   throw std::runtime_error(
       format("could not convert '{}' to a detector backend", val));
}

const char* str(const Backend x) noexcept
{
   switch(x) {
   case Backend::REPLAY: return "replay";
   case Backend::MEDIAPIPE: return "mediapipe";
   }
   return "<unknown>";
}

// ----------------------------------------------------------- Params::meta-data
//
const vector<MemberMetaData>& Params::meta_data() const noexcept
{
#define ThisParams Params
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back({meta_type::STRING,
                   "backend"s,
                   true,
                   [](const void* ptr) -> std::any {
                      const auto& o = *reinterpret_cast<const ThisParams*>(ptr);
                      return std::any(string(str(o.backend)));
                   },
                   [](void* ptr, const std::any& x) -> void {
                      auto& o         = *reinterpret_cast<ThisParams*>(ptr);
                      const string& s = std::any_cast<const string>(x);
                      o.backend       = to_backend(s);
                   }});
      m.push_back(MAKE_META(ThisParams, STRING, replay_dir, true));
      m.push_back(MAKE_META(ThisParams, STRING, graph_config, true));
      m.push_back(MAKE_META(ThisParams, INT, model_complexity, true));
      m.push_back(MAKE_META(ThisParams, BOOL, smooth_landmarks, true));
      m.push_back(MAKE_META(ThisParams, BOOL, refine_face_landmarks, true));
      m.push_back(MAKE_META(ThisParams, REAL, min_detection_confidence, true));
      m.push_back(MAKE_META(ThisParams, REAL, min_tracking_confidence, true));
      m.push_back(MAKE_META(ThisParams, BOOL, feedback, false));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
#undef ThisParams
}

} // namespace mocap::detector
