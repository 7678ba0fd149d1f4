#include "landmark-set.hpp"

#include "mocap/io/json-io.hpp"

namespace mocap
{
static bool float_eq(float a, float b) noexcept
{
   return (a == b) || (std::isnan(a) && std::isnan(b));
}

// -------------------------------------------------------------------- Landmark
//
bool Landmark::operator==(const Landmark& o) const noexcept
{
   return float_eq(x, o.x) && float_eq(y, o.y)
          && float_eq(visibility, o.visibility);
}

bool Landmark::operator!=(const Landmark& o) const noexcept
{
   return !(*this == o);
}

Json::Value Landmark::to_json() const noexcept
{
   Json::Value o{Json::arrayValue};
   o.append(json_save(x));
   o.append(json_save(y));
   if(!std::isnan(visibility)) o.append(json_save(visibility));
   return o;
}

void Landmark::read(const Json::Value& o) noexcept(false)
{
   if(!o.isArray() || (o.size() != 2 && o.size() != 3))
      throw std::runtime_error(
          format("expected landmark [x, y] or [x, y, visibility], got {}",
                 trim_copy(str(o))));
   json_load(o[0], x);
   json_load(o[1], y);
   visibility = fNAN;
   if(o.size() == 3) json_load(o[2], visibility);
}

// ----------------------------------------------------------------- LandmarkSet
//
const std::optional<LandmarkSet::landmark_list>&
LandmarkSet::part(const BodyPart p) const noexcept
{
   switch(p) {
   case BodyPart::BODY: return body;
   case BodyPart::RIGHT_HAND: return right_hand;
   case BodyPart::LEFT_HAND: return left_hand;
   case BodyPart::FACE: return face;
   }
   FATAL(format("body-part out of range: {}", int(p)));
   return body;
}

std::optional<LandmarkSet::landmark_list>&
LandmarkSet::part(const BodyPart p) noexcept
{
   const auto& self = *this;
   return const_cast<std::optional<landmark_list>&>(self.part(p));
}

bool LandmarkSet::empty() const noexcept
{
   return std::none_of(cbegin(k_body_parts),
                       cend(k_body_parts),
                       [this](auto p) { return has_part(p); });
}

bool LandmarkSet::operator==(const LandmarkSet& o) const noexcept
{
   return body == o.body && right_hand == o.right_hand
          && left_hand == o.left_hand && face == o.face;
}

bool LandmarkSet::operator!=(const LandmarkSet& o) const noexcept
{
   return !(*this == o);
}

Json::Value LandmarkSet::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   for(const auto p : k_body_parts) {
      const auto& ll = part(p);
      if(!ll.has_value()) {
         o[str(p)] = Json::Value{Json::nullValue};
         continue;
      }
      Json::Value arr{Json::arrayValue};
      for(const auto& l : *ll) arr.append(l.to_json());
      o[str(p)] = arr;
   }
   return o;
}

void LandmarkSet::read(const Json::Value& o) noexcept(false)
{
   if(!o.isObject())
      throw std::runtime_error("expected a JSON object for a landmark set");

   for(const auto p : k_body_parts) {
      auto& ll = part(p);
      ll.reset();
      if(!has_key(o, str(p))) continue;
      const auto& node = o[str(p)];
      if(node.isNull()) continue;
      if(!node.isArray())
         throw std::runtime_error(
             format("expected '{}' to be an array of landmarks", str(p)));

      landmark_list lms(node.size());
      for(auto i = 0u; i < node.size(); ++i) {
         try {
            lms[i].read(node[i]);
         } catch(std::runtime_error& e) {
            throw std::runtime_error(
                format("error reading {}[{}]: {}", str(p), i, e.what()));
         }
      }
      ll = std::move(lms);
   }
}

string LandmarkSet::to_string() const noexcept
{
   auto part_s = [this](BodyPart p) -> string {
      const auto& ll = part(p);
      return ll.has_value() ? format("{}", ll->size()) : "-"s;
   };
   return format("LandmarkSet{{body={}, right_hand={}, left_hand={}, face={}}}",
                 part_s(BodyPart::BODY),
                 part_s(BodyPart::RIGHT_HAND),
                 part_s(BodyPart::LEFT_HAND),
                 part_s(BodyPart::FACE));
}

} // namespace mocap
