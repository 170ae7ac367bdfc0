#pragma once

/// @file vehicle.hpp
/// @brief Flat snapshot of a vehicle and everything mounted on it

#include "barricade.hpp"
#include "cargo.hpp"
#include "paint.hpp"
#include "structure.hpp"
#include "types.hpp"

#include <convoy/core/guid.hpp>
#include <convoy/math/color.hpp>
#include <convoy/math/types.hpp>

#include <optional>
#include <vector>

namespace convoy_snapshot {

/// Immutable capture of a vehicle composite.
///
/// tires and turret_states describe the captured vehicle only; restore
/// reconciles them against the slot counts of the vehicle it creates.
/// instance_id is informational and is never reused.
struct VehicleSnapshot {
    std::uint16_t definition_id = 0;
    convoy_core::Guid definition_guid;
    std::uint32_t instance_id = 0;

    std::uint16_t skin_variant = 0;
    std::uint16_t mythic_variant = 0;
    float placement_offset = 0.0f;

    std::uint16_t integrity = 0;
    std::uint16_t fuel_level = 0;
    std::uint16_t auxiliary_charge = 0;

    std::uint64_t owner = 0;
    std::uint64_t group = 0;

    std::vector<bool> tires;
    std::vector<TurretState> turret_states;
    CargoSnapshot cargo;
    std::vector<BarricadeSnapshot> barricades;
    std::vector<StructureSnapshot> structures;

    convoy_math::Vec3 position = convoy_math::vec3::ZERO;
    convoy_math::Quat rotation = convoy_math::quat::IDENTITY;

    /// nullopt means "no paint"
    std::optional<convoy_math::Color32> paint;

    /// Wire form of the paint ({0,0,0,0} when absent)
    [[nodiscard]] PaintBytes paint_bytes() const noexcept { return paint_to_bytes(paint); }

    /// Set paint from its wire form
    void set_paint_bytes(const PaintBytes& bytes) noexcept { paint = paint_from_bytes(bytes); }

    [[nodiscard]] std::size_t child_count() const noexcept { return barricades.size() + structures.size(); }

    bool operator==(const VehicleSnapshot&) const = default;
};

} // namespace convoy_snapshot
