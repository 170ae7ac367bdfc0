#pragma once

/// @file barricade.hpp
/// @brief Snapshot of a barricade mounted on a vehicle

#include "types.hpp"
#include <convoy/catalog/fwd.hpp>
#include <convoy/core/error.hpp>
#include <convoy/core/guid.hpp>
#include <convoy/math/types.hpp>

#include <optional>

namespace convoy_snapshot {

/// Barricade child; position and rotation are local to the anchor vehicle.
/// An entry with id 0 is an empty placeholder and is never spawned.
struct BarricadeSnapshot {
    std::uint16_t id = 0;
    convoy_core::Guid guid;
    std::uint16_t health = 0;
    std::uint64_t owner = 0;
    std::uint64_t group = 0;
    convoy_core::Blob state;
    convoy_math::Vec3 position = convoy_math::vec3::ZERO;
    convoy_math::Quat rotation = convoy_math::quat::IDENTITY;

    [[nodiscard]] bool is_placeholder() const noexcept { return id == 0; }

    [[nodiscard]] static BarricadeSnapshot capture(const convoy_world::BarricadeDrop& drop);

    /// Plant on the anchor; owner_override replaces the recorded owner/group
    [[nodiscard]] convoy_core::Result<std::uint32_t> spawn(
        convoy_world::IWorld& world,
        const convoy_catalog::ICatalog& catalog,
        const convoy_world::IVehicle& anchor,
        const std::optional<Claimant>& owner_override) const;

    bool operator==(const BarricadeSnapshot&) const = default;
};

} // namespace convoy_snapshot
