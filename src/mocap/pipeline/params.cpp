#include "params.hpp"

#define This Params

namespace mocap::pipeline
{
const vector<MemberMetaData>& This::meta_data() const noexcept
{
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(This, COMPATIBLE_OBJECT, detector_params, true));
      m.push_back(MAKE_META(This, BOOL, save_annotated_videos, true));
      m.push_back(MAKE_META(This, REAL, annotated_video_fps, true));
      m.push_back(MAKE_META(This, STRING, video_extension, true));
      m.push_back(MAKE_META(This, BOOL, legacy_broadcast_last_landmark, true));
      m.push_back(MAKE_META(This, BOOL, save_body_confidence, true));
      m.push_back(MAKE_META(This, BOOL, feedback, false));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
}

} // namespace mocap::pipeline
