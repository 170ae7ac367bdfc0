#pragma once

/// @file types.hpp
/// @brief Core type definitions for convoy_math

#define GLM_FORCE_RADIANS

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "fwd.hpp"

namespace convoy_math {

// =============================================================================
// Constants
// =============================================================================

namespace vec3 {
    inline constexpr Vec3 ZERO = Vec3(0.0f, 0.0f, 0.0f);
}

namespace quat {
    inline const Quat IDENTITY = Quat(1.0f, 0.0f, 0.0f, 0.0f); // w, x, y, z
}

} // namespace convoy_math
