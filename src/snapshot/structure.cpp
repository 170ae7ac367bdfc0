/// @file structure.cpp
/// @brief Structure child capture and spawn

#include <convoy/snapshot/structure.hpp>
#include <convoy/catalog/catalog.hpp>
#include <convoy/world/world.hpp>
#include <convoy/core/log.hpp>

namespace convoy_snapshot {

StructureSnapshot StructureSnapshot::capture(const convoy_world::StructureDrop& drop) {
    StructureSnapshot snap;
    snap.id = drop.id;
    snap.guid = drop.guid;
    snap.health = drop.health;
    snap.owner = drop.owner;
    snap.group = drop.group;
    snap.position = drop.local.position;
    snap.rotation = drop.local.rotation;
    return snap;
}

convoy_core::Result<std::uint32_t> StructureSnapshot::spawn(
    convoy_world::IWorld& world,
    const convoy_catalog::ICatalog& catalog,
    const convoy_world::IVehicle& anchor,
    const std::optional<Claimant>& owner_override) const
{
    const auto* def = catalog.find_structure(guid, id);
    if (!def) {
        convoy_core::Error error = convoy_core::CatalogError::definition_not_found(
            convoy_catalog::kind::STRUCTURE, guid.to_string(), id);
        convoy_core::debug::record_error(error);
        return error;
    }

    convoy_world::StructurePlacement placement;
    placement.health = health;
    placement.owner = owner_override ? owner_override->owner : owner;
    placement.group = owner_override ? owner_override->group : group;
    placement.local = convoy_math::Frame(position, rotation);

    auto placed = world.place_structure(*def, placement, anchor);
    if (!placed) {
        placed.error().with_context("structure_id", std::to_string(id));
    }
    return placed;
}

} // namespace convoy_snapshot
