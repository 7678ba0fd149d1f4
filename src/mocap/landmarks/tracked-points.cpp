#include "tracked-points.hpp"

namespace mocap
{
// ------------------------------------------------------------------- body part
//
const BodyPartSpec& body_part_spec(const BodyPart part) noexcept
{
   static const array<BodyPartSpec, k_n_body_parts> specs = {
       BodyPartSpec{BodyPart::BODY, k_n_body_points, true, 0},
       BodyPartSpec{
           BodyPart::RIGHT_HAND, k_n_hand_points, false, k_n_body_points},
       BodyPartSpec{BodyPart::LEFT_HAND,
                    k_n_hand_points,
                    false,
                    k_n_body_points + k_n_hand_points},
       BodyPartSpec{BodyPart::FACE,
                    k_n_face_points,
                    false,
                    k_n_body_points + 2 * k_n_hand_points}};
   return specs[size_t(part)];
}

BodyPart int_to_body_part(int val) noexcept
{
   const auto r = BodyPart(val);
   switch(r) {
#define E(x) \
   case BodyPart::x: return BodyPart::x;
      E(BODY);
      E(RIGHT_HAND);
      E(LEFT_HAND);
      E(FACE);
   default: FATAL(format("enumerated body-part out of range: {}", val));
#undef E
   }
   return r;
}

const char* str(const BodyPart r) noexcept
{
   switch(r) {
   case BodyPart::BODY: return "body";
   case BodyPart::RIGHT_HAND: return "right_hand";
   case BodyPart::LEFT_HAND: return "left_hand";
   case BodyPart::FACE: return "face";
   }
   return "<unknown>";
}

BodyPart to_body_part(const string_view val) noexcept(false)
{
   for(const auto part : k_body_parts)
      if(val == str(part)) return part;
   throw std::runtime_error(
       format("could not convert '{}' to a body part", val));
}

// ----------------------------------------------------------------- point names
//
static vector<string> make_body_names()
{
   return {"nose",            "left_eye_inner",  "left_eye",
           "left_eye_outer",  "right_eye_inner", "right_eye",
           "right_eye_outer", "left_ear",        "right_ear",
           "mouth_left",      "mouth_right",     "left_shoulder",
           "right_shoulder",  "left_elbow",      "right_elbow",
           "left_wrist",      "right_wrist",     "left_pinky",
           "right_pinky",     "left_index",      "right_index",
           "left_thumb",      "right_thumb",     "left_hip",
           "right_hip",       "left_knee",       "right_knee",
           "left_ankle",      "right_ankle",     "left_heel",
           "right_heel",      "left_foot_index", "right_foot_index"};
}

static vector<string> make_hand_names(const string_view prefix)
{
   static const char* hand_points[] = {"wrist",
                                       "thumb_cmc",
                                       "thumb_mcp",
                                       "thumb_ip",
                                       "thumb_tip",
                                       "index_finger_mcp",
                                       "index_finger_pip",
                                       "index_finger_dip",
                                       "index_finger_tip",
                                       "middle_finger_mcp",
                                       "middle_finger_pip",
                                       "middle_finger_dip",
                                       "middle_finger_tip",
                                       "ring_finger_mcp",
                                       "ring_finger_pip",
                                       "ring_finger_dip",
                                       "ring_finger_tip",
                                       "pinky_mcp",
                                       "pinky_pip",
                                       "pinky_dip",
                                       "pinky_tip"};
   vector<string> o;
   o.reserve(k_n_hand_points);
   for(const auto s : hand_points) o.push_back(format("{}{}", prefix, s));
   return o;
}

static vector<string> make_face_names()
{
   vector<string> o;
   o.reserve(k_n_face_points);
   for(auto i = 0; i < k_n_face_mesh; ++i)
      o.push_back(format("face_{:03d}", i));
   for(const auto side : {"right", "left"}) {
      o.push_back(format("{}_iris_center", side));
      for(auto i = 0; i < 4; ++i) o.push_back(format("{}_iris_{}", side, i));
   }
   return o;
}

const vector<string>& tracked_point_names(const BodyPart part) noexcept
{
   static const array<vector<string>, k_n_body_parts> names
       = {make_body_names(),
          make_hand_names("right_hand_"),
          make_hand_names("left_hand_"),
          make_face_names()};
   const auto& o = names[size_t(part)];
   Ensures(int(o.size()) == body_part_spec(part).n_points);
   return o;
}

const vector<string>& all_tracked_point_names() noexcept
{
   static const vector<string> names = []() {
      vector<string> o;
      o.reserve(k_n_tracked_points);
      for(const auto part : k_body_parts) {
         const auto& part_names = tracked_point_names(part);
         o.insert(end(o), cbegin(part_names), cend(part_names));
      }
      return o;
   }();
   return names;
}

int tracked_point_index(const string_view name) noexcept
{
   static const hashmap<string, int> lookup = []() {
      hashmap<string, int> o;
      const auto& names = all_tracked_point_names();
      for(size_t i = 0; i < names.size(); ++i) o[names[i]] = int(i);
      return o;
   }();
   const auto ii = lookup.find(string(name));
   return (ii == cend(lookup)) ? -1 : ii->second;
}

} // namespace mocap
