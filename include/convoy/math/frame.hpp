#pragma once

/// @file frame.hpp
/// @brief Placement frame (position + rotation) for convoy_math

#include "types.hpp"

namespace convoy_math {

/// Rigid placement without scale
///
/// A vehicle's frame is in world space. Children mounted on a vehicle keep
/// their frame relative to it, so the world places them on whatever vehicle
/// they are anchored to.
struct Frame {
    Vec3 position = vec3::ZERO;
    Quat rotation = quat::IDENTITY;

    Frame() = default;
    Frame(const Vec3& pos, const Quat& rot) noexcept : position(pos), rotation(rot) {}
};

} // namespace convoy_math
