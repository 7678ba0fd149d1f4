#pragma once

#include "mocap/foundation.hpp"

namespace mocap
{
// -------------------------------------------------------------------- BodyPart
//
enum class BodyPart : int8_t { BODY = 0, RIGHT_HAND, LEFT_HAND, FACE };

constexpr int k_n_body_parts     = 4;
constexpr int k_n_body_points    = 33;
constexpr int k_n_hand_points    = 21;
constexpr int k_n_face_mesh      = 468;
constexpr int k_n_iris_points    = 10;
constexpr int k_n_face_points    = k_n_face_mesh + k_n_iris_points;
constexpr int k_n_tracked_points = k_n_body_points + 2 * k_n_hand_points
                                   + k_n_face_points; // 553
constexpr int k_n_spatial_dims   = 2;                 // pixel XY

// Body parts in stacking order
constexpr array<BodyPart, k_n_body_parts> k_body_parts
    = {BodyPart::BODY,
       BodyPart::RIGHT_HAND,
       BodyPart::LEFT_HAND,
       BodyPart::FACE};

struct BodyPartSpec
{
   BodyPart part       = BodyPart::BODY;
   int n_points        = 0;
   bool has_confidence = false;
   int offset          = 0; // column of the first point in the stacked array
};

const BodyPartSpec& body_part_spec(const BodyPart part) noexcept;

BodyPart int_to_body_part(int) noexcept;
const char* str(const BodyPart) noexcept; // "body", "right_hand", ...
BodyPart to_body_part(const string_view val) noexcept(false);

// --------------------------------------------------------- Tracked point names
//
// Index order is stable: index `i` of a part always names the same point.
const vector<string>& tracked_point_names(const BodyPart part) noexcept;

// All 553 names, in stacking order (body, right hand, left hand, face)
const vector<string>& all_tracked_point_names() noexcept;

// Index into the stacked point axis, or -1 if `name` is not a tracked point
int tracked_point_index(const string_view name) noexcept;

} // namespace mocap
