#pragma once

#include "tracked-points.hpp"

#include "json/json.h"

namespace mocap
{
// -------------------------------------------------------------------- Landmark
//
// Normalized image coordinates, (0, 0) is top-left and (1, 1) bottom-right.
// `visibility` is NaN when the model does not report one.
struct Landmark final
{
   float x          = fNAN;
   float y          = fNAN;
   float visibility = fNAN;

   Landmark() = default;
   Landmark(float x_, float y_, float vis_ = fNAN)
       : x(x_)
       , y(y_)
       , visibility(vis_)
   {}

   bool operator==(const Landmark& o) const noexcept;
   bool operator!=(const Landmark& o) const noexcept;

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);
};

// ----------------------------------------------------------------- LandmarkSet
//
// The detector output for one frame. Each part is either absent (nullopt) or
// a list of landmarks in tracked-point order.
struct LandmarkSet final
{
   using landmark_list = vector<Landmark>;

   std::optional<landmark_list> body;
   std::optional<landmark_list> right_hand;
   std::optional<landmark_list> left_hand;
   std::optional<landmark_list> face;

   const std::optional<landmark_list>& part(const BodyPart) const noexcept;
   std::optional<landmark_list>& part(const BodyPart) noexcept;

   bool has_part(const BodyPart p) const noexcept
   {
      return part(p).has_value();
   }
   bool empty() const noexcept; // no parts present

   bool operator==(const LandmarkSet& o) const noexcept;
   bool operator!=(const LandmarkSet& o) const noexcept;

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);

   string to_string() const noexcept;
   friend string str(const LandmarkSet& o) noexcept { return o.to_string(); }
};

} // namespace mocap
