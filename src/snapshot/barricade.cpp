/// @file barricade.cpp
/// @brief Barricade child capture and spawn

#include <convoy/snapshot/barricade.hpp>
#include <convoy/catalog/catalog.hpp>
#include <convoy/world/world.hpp>
#include <convoy/core/log.hpp>

namespace convoy_snapshot {

BarricadeSnapshot BarricadeSnapshot::capture(const convoy_world::BarricadeDrop& drop) {
    BarricadeSnapshot snap;
    snap.id = drop.id;
    snap.guid = drop.guid;
    snap.health = drop.health;
    snap.owner = drop.owner;
    snap.group = drop.group;
    snap.state = drop.state;
    snap.position = drop.local.position;
    snap.rotation = drop.local.rotation;
    return snap;
}

convoy_core::Result<std::uint32_t> BarricadeSnapshot::spawn(
    convoy_world::IWorld& world,
    const convoy_catalog::ICatalog& catalog,
    const convoy_world::IVehicle& anchor,
    const std::optional<Claimant>& owner_override) const
{
    const auto* def = catalog.find_barricade(guid, id);
    if (!def) {
        convoy_core::Error error = convoy_core::CatalogError::definition_not_found(
            convoy_catalog::kind::BARRICADE, guid.to_string(), id);
        convoy_core::debug::record_error(error);
        return error;
    }

    convoy_world::BarricadePlacement placement;
    placement.health = health;
    placement.owner = owner_override ? owner_override->owner : owner;
    placement.group = owner_override ? owner_override->group : group;
    placement.state = state;
    placement.local = convoy_math::Frame(position, rotation);

    auto placed = world.place_barricade(*def, placement, anchor);
    if (!placed) {
        placed.error().with_context("barricade_id", std::to_string(id));
        return placed;
    }

    convoy_core::snapshot_logger()->trace("Barricade {} re-planted as instance {} (owner {})",
        id, *placed, placement.owner);
    return placed;
}

} // namespace convoy_snapshot
