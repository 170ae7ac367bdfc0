#pragma once

/// @file types.hpp
/// @brief Definition records resolved by the catalog
///
/// Definitions are addressed by a stable 128-bit GUID and by a legacy
/// 16-bit id. The GUID is authoritative; the id is kept for old data.

#include "fwd.hpp"
#include <convoy/core/blob.hpp>
#include <convoy/core/guid.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace convoy_catalog {

/// Kind names used in error messages and logs
namespace kind {
    inline constexpr const char* VEHICLE = "vehicle";
    inline constexpr const char* ITEM = "item";
    inline constexpr const char* BARRICADE = "barricade";
    inline constexpr const char* STRUCTURE = "structure";
}

// =============================================================================
// Vehicle
// =============================================================================

/// One weapon mount on a vehicle, backed by an item definition
struct TurretMount {
    std::uint16_t item_id = 0;
};

/// Vehicle asset definition
struct VehicleDef {
    std::uint16_t id = 0;
    convoy_core::Guid guid;
    std::string name;

    std::uint8_t tire_count = 0;
    std::vector<TurretMount> turrets;

    /// Trunk page size; 0x0 means the vehicle has no trunk
    std::uint8_t trunk_width = 0;
    std::uint8_t trunk_height = 0;

    std::uint16_t max_fuel = 0;
    std::uint16_t max_health = 0;
    std::uint16_t max_battery = 0;

    [[nodiscard]] bool has_trunk() const noexcept { return trunk_width > 0 && trunk_height > 0; }
};

// =============================================================================
// Item
// =============================================================================

/// Item asset definition
struct ItemDef {
    std::uint16_t id = 0;
    convoy_core::Guid guid;
    std::string name;

    std::uint8_t default_amount = 1;
    std::uint8_t default_quality = 100;

    /// State a freshly created item of this kind carries
    convoy_core::Blob default_state;
};

// =============================================================================
// Placeables
// =============================================================================

/// Barricade asset definition (placeables that carry a state payload)
struct BarricadeDef {
    std::uint16_t id = 0;
    convoy_core::Guid guid;
    std::string name;
    std::uint16_t max_health = 0;
};

/// Structure asset definition
struct StructureDef {
    std::uint16_t id = 0;
    convoy_core::Guid guid;
    std::string name;
    std::uint16_t max_health = 0;
};

} // namespace convoy_catalog
