#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for convoy_math types

#include <glm/fwd.hpp>

namespace convoy_math {

// =============================================================================
// Vector and Quaternion Types (GLM aliases)
// =============================================================================
using Vec3 = glm::vec3;
using Quat = glm::quat;

// =============================================================================
// Forward Declarations (convoy_math types)
// =============================================================================
struct Frame;
struct Color32;

} // namespace convoy_math
