#pragma once

/// @file types.hpp
/// @brief Value types exchanged with the live world

#include "fwd.hpp"
#include <convoy/catalog/fwd.hpp>
#include <convoy/core/blob.hpp>
#include <convoy/core/guid.hpp>
#include <convoy/math/color.hpp>
#include <convoy/math/frame.hpp>

#include <cstdint>
#include <optional>

namespace convoy_world {

// =============================================================================
// Regions
// =============================================================================

/// Spatial region holding the children planted on one vehicle
struct RegionHandle {
    std::uint32_t vehicle_instance_id = 0;

    bool operator==(const RegionHandle&) const = default;
};

// =============================================================================
// Items
// =============================================================================

/// Live item value
struct Item {
    std::uint16_t id = 0;
    std::uint8_t amount = 0;
    std::uint8_t quality = 0;
    convoy_core::Blob state;
};

/// Item placed at a grid position inside a container page
struct ItemJar {
    std::uint8_t x = 0;
    std::uint8_t y = 0;
    std::uint8_t rotation = 0;
    Item item;
};

// =============================================================================
// Mounted Children
// =============================================================================

/// Barricade as stored in a region
struct BarricadeDrop {
    std::uint32_t instance_id = 0;
    std::uint16_t id = 0;
    convoy_core::Guid guid;
    std::uint16_t health = 0;
    std::uint64_t owner = 0;
    std::uint64_t group = 0;
    convoy_core::Blob state;
    convoy_math::Frame local;   ///< Relative to the anchor vehicle
    bool destroyed = false;
};

/// Structure as stored in a region
struct StructureDrop {
    std::uint32_t instance_id = 0;
    std::uint16_t id = 0;
    convoy_core::Guid guid;
    std::uint16_t health = 0;
    std::uint64_t owner = 0;
    std::uint64_t group = 0;
    convoy_math::Frame local;   ///< Relative to the anchor vehicle
    bool destroyed = false;
};

/// Request to plant a barricade on a vehicle
struct BarricadePlacement {
    std::uint16_t health = 0;
    std::uint64_t owner = 0;
    std::uint64_t group = 0;
    convoy_core::Blob state;
    convoy_math::Frame local;
};

/// Request to plant a structure on a vehicle
struct StructurePlacement {
    std::uint16_t health = 0;
    std::uint64_t owner = 0;
    std::uint64_t group = 0;
    convoy_math::Frame local;
};

// =============================================================================
// Vehicle Creation
// =============================================================================

/// Everything the world needs to create a vehicle
struct VehicleSpawnParams {
    const convoy_catalog::VehicleDef* definition = nullptr;
    std::uint16_t skin_variant = 0;
    std::uint16_t mythic_variant = 0;
    float placement_offset = 0.0f;
    convoy_math::Frame frame;
    std::uint16_t fuel = 0;
    std::uint16_t integrity = 0;
    std::uint16_t auxiliary_charge = 0;
    std::uint64_t owner = 0;
    std::uint64_t group = 0;
    bool locked = false;
    std::optional<convoy_math::Color32> paint;  ///< nullopt keeps the definition default
};

} // namespace convoy_world
