/// @file service.cpp
/// @brief Vehicle composite capture and restore

#include <convoy/snapshot/service.hpp>
#include <convoy/catalog/catalog.hpp>
#include <convoy/engine/config.hpp>
#include <convoy/world/world.hpp>
#include <convoy/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace convoy_snapshot {

// =============================================================================
// RestoreOptions / RestoreReport
// =============================================================================

RestoreOptions RestoreOptions::from_config(const convoy_engine::ConfigManager& config) {
    namespace keys = convoy_engine::config_keys;

    RestoreOptions options;
    options.rollback_on_error = config.get_bool(keys::RESTORE_ROLLBACK_ON_ERROR, true);
    options.rebind_child_ownership = config.get_bool(keys::RESTORE_REBIND_CHILD_OWNERSHIP, false);

    if (config.contains(keys::RESTORE_OWNER) || config.contains(keys::RESTORE_GROUP)) {
        options.claimant = Claimant{config.get_uint(keys::RESTORE_OWNER, 0), config.get_uint(keys::RESTORE_GROUP, 0)};
    }
    return options;
}

std::string RestoreReport::summary() const {
    std::ostringstream ss;
    ss << "tires " << tires_applied << " applied";
    if (tires_ignored > 0) {
        ss << " (" << tires_ignored << " ignored)";
    }
    ss << ", cargo " << cargo_inserted << " inserted / " << cargo_rejected << " rejected"
       << ", children " << barricades_spawned << " barricades + " << structures_spawned << " structures"
       << " (" << children_skipped << " skipped)"
       << ", turrets " << turret_path_name(turret_path) << " "
       << turrets_assigned << " assigned / " << turrets_untouched << " untouched";
    return ss.str();
}

// =============================================================================
// Capture
// =============================================================================

VehicleSnapshot SnapshotService::capture(const convoy_world::IVehicle& vehicle) const {
    VehicleSnapshot snap;

    snap.definition_id = vehicle.definition_id();
    snap.definition_guid = vehicle.definition_guid();
    snap.instance_id = vehicle.instance_id();
    snap.skin_variant = vehicle.skin_variant();
    snap.mythic_variant = vehicle.mythic_variant();
    snap.placement_offset = vehicle.placement_offset();
    snap.integrity = vehicle.integrity();
    snap.fuel_level = vehicle.fuel_level();
    snap.auxiliary_charge = vehicle.auxiliary_charge();
    snap.owner = vehicle.owner();
    snap.group = vehicle.group();

    auto frame = vehicle.frame();
    snap.position = frame.position;
    snap.rotation = frame.rotation;
    snap.paint = normalize_paint(vehicle.paint_color());

    // One entry per mount, index aligned; unbacked mounts record an empty blob
    snap.turret_states.reserve(vehicle.turret_count());
    for (std::size_t i = 0; i < vehicle.turret_count(); ++i) {
        snap.turret_states.emplace_back(vehicle.turret_state(i).value_or(convoy_core::Blob{}));
    }

    snap.tires.reserve(vehicle.tire_count());
    for (std::size_t i = 0; i < vehicle.tire_count(); ++i) {
        snap.tires.push_back(vehicle.is_tire_alive(i));
    }

    snap.cargo = CargoSnapshot::capture(vehicle.trunk());

    if (auto region = m_world.find_attached_region(vehicle)) {
        for (const auto& drop : m_world.barricades_in(*region)) {
            if (!drop.destroyed) {
                snap.barricades.push_back(BarricadeSnapshot::capture(drop));
            }
        }
        for (const auto& drop : m_world.structures_in(*region)) {
            if (!drop.destroyed) {
                snap.structures.push_back(StructureSnapshot::capture(drop));
            }
        }
    }

    convoy_core::snapshot_logger()->debug(
        "Captured vehicle {} (definition {}): {} tires, {} turrets, {} cargo items, {} children",
        snap.instance_id, snap.definition_id, snap.tires.size(), snap.turret_states.size(),
        snap.cargo.items.size(), snap.child_count());
    return snap;
}

// =============================================================================
// Restore
// =============================================================================

convoy_core::Result<RestoreOutcome> SnapshotService::restore(
    const VehicleSnapshot& snapshot, const RestoreOptions& options) const
{
    CONVOY_LOG_SCOPE("SnapshotService::restore");
    auto logger = convoy_core::snapshot_logger();

    auto resolved = m_catalog.resolve_vehicle(snapshot.definition_guid, snapshot.definition_id);
    if (!resolved) {
        logger->error("Restore aborted: {}", convoy_core::build_error_chain(resolved.error()));
        return resolved.error();
    }
    const convoy_catalog::VehicleDef& def = **resolved;

    // Identity overrides never touch the snapshot
    Claimant effective = options.claimant.value_or(Claimant{snapshot.owner, snapshot.group});

    convoy_world::VehicleSpawnParams params;
    params.definition = &def;
    params.skin_variant = snapshot.skin_variant;
    params.mythic_variant = snapshot.mythic_variant;
    params.placement_offset = snapshot.placement_offset;
    params.frame = convoy_math::Frame(snapshot.position, snapshot.rotation);
    params.fuel = snapshot.fuel_level;
    params.integrity = snapshot.integrity;
    params.auxiliary_charge = snapshot.auxiliary_charge;
    params.owner = effective.owner;
    params.group = effective.group;
    params.locked = effective.owner != 0;
    params.paint = snapshot.paint;

    auto spawned = m_world.spawn_vehicle(params);
    if (!spawned) {
        logger->error("Restore aborted: {}", convoy_core::build_error_chain(spawned.error()));
        return spawned.error();
    }
    convoy_world::IVehicle& vehicle = **spawned;
    const std::uint32_t instance_id = vehicle.instance_id();

    std::optional<Claimant> child_override;
    if (options.rebind_child_ownership) {
        child_override = effective;
    }

    RestoreReport report;
    auto applied = apply(snapshot, def, child_override, vehicle, report);
    if (!applied) {
        convoy_core::Error error = applied.error();
        if (options.rollback_on_error) {
            auto destroyed = m_world.destroy_vehicle(instance_id);
            if (destroyed) {
                logger->warn("Rolled back vehicle instance {}", instance_id);
            } else {
                logger->error("Rollback of vehicle instance {} failed: {}", instance_id, destroyed.error().message());
                error.with_context("rollback_error", destroyed.error().message());
            }
        } else {
            error.with_context("instance_id", std::to_string(instance_id));
        }
        convoy_core::debug::record_error(error);
        logger->error("Restore of definition {} failed: {}", def.id, convoy_core::build_error_chain(error));
        return error;
    }

    logger->info("Restored {} (definition {}) as instance {} for owner {}: {}",
        def.name, def.id, instance_id, effective.owner, report.summary());
    return convoy_core::Ok(RestoreOutcome{&vehicle, report});
}

convoy_core::Result<RestoreOutcome> SnapshotService::claim(
    const VehicleSnapshot& snapshot, const Claimant& claimant) const
{
    RestoreOptions options;
    options.claimant = claimant;
    options.rebind_child_ownership = true;
    return restore(snapshot, options);
}

convoy_core::Result<void> SnapshotService::apply(
    const VehicleSnapshot& snapshot,
    const convoy_catalog::VehicleDef& def,
    const std::optional<Claimant>& child_override,
    convoy_world::IVehicle& vehicle,
    RestoreReport& report) const
{
    auto logger = convoy_core::snapshot_logger();

    reconcile_tires(snapshot, vehicle, report);

    if (auto* trunk = vehicle.trunk(); trunk && !snapshot.cargo.empty()) {
        auto counts = snapshot.cargo.restore_into(*trunk);
        report.cargo_inserted = counts.inserted;
        report.cargo_rejected = counts.rejected;
    } else if (!snapshot.cargo.empty()) {
        logger->warn("Vehicle {} has no trunk; {} recorded cargo items dropped",
            def.id, snapshot.cargo.items.size());
        report.cargo_rejected = snapshot.cargo.items.size();
    }

    for (const auto& barricade : snapshot.barricades) {
        if (barricade.is_placeholder()) {
            ++report.children_skipped;
            continue;
        }
        auto placed = barricade.spawn(m_world, m_catalog, vehicle, child_override);
        if (!placed) {
            return placed.error();
        }
        ++report.barricades_spawned;
    }

    for (const auto& structure : snapshot.structures) {
        if (structure.is_placeholder()) {
            ++report.children_skipped;
            continue;
        }
        auto placed = structure.spawn(m_world, m_catalog, vehicle, child_override);
        if (!placed) {
            return placed.error();
        }
        ++report.structures_spawned;
    }

    if (report.children_skipped > 0) {
        logger->debug("Skipped {} empty child entries", report.children_skipped);
    }

    reconcile_turrets(snapshot, def, vehicle, report);
    return convoy_core::Ok();
}

void SnapshotService::reconcile_tires(
    const VehicleSnapshot& snapshot, convoy_world::IVehicle& vehicle, RestoreReport& report) const
{
    const std::size_t count = std::min(snapshot.tires.size(), vehicle.tire_count());
    for (std::size_t i = 0; i < count; ++i) {
        vehicle.set_tire_alive(i, snapshot.tires[i]);
    }
    vehicle.send_tire_alive_mask_update();

    report.tires_applied = count;
    report.tires_ignored = snapshot.tires.size() - count;
    if (snapshot.tires.size() != vehicle.tire_count()) {
        convoy_core::snapshot_logger()->info("Tire count mismatch: recorded {}, vehicle has {}; applied {}",
            snapshot.tires.size(), vehicle.tire_count(), count);
    }
}

void SnapshotService::reconcile_turrets(
    const VehicleSnapshot& snapshot,
    const convoy_catalog::VehicleDef& def,
    convoy_world::IVehicle& vehicle,
    RestoreReport& report) const
{
    auto logger = convoy_core::snapshot_logger();
    const std::size_t mounts = vehicle.turret_count();

    if (snapshot.turret_states.size() == mounts) {
        report.turret_path = TurretPath::Matched;
        for (std::size_t i = 0; i < mounts; ++i) {
            const auto& recorded = snapshot.turret_states[i];
            if (!recorded || !vehicle.turret_state(i) || !vehicle.set_turret_state(i, *recorded)) {
                ++report.turrets_untouched;
                continue;
            }
            ++report.turrets_assigned;
        }
        return;
    }

    // The mount layout changed since capture; recorded states no longer line up
    report.turret_path = TurretPath::Defaults;
    logger->info("Turret count mismatch: recorded {}, vehicle has {}; resetting mounts to item defaults",
        snapshot.turret_states.size(), mounts);

    for (std::size_t i = 0; i < mounts; ++i) {
        if (!vehicle.turret_state(i)) {
            ++report.turrets_untouched;
            continue;
        }

        const convoy_catalog::ItemDef* item = i < def.turrets.size() ? m_catalog.find_item(def.turrets[i].item_id) : nullptr;
        if (!item) {
            logger->warn("Mount {} of vehicle {} has no resolvable item; left untouched", i, def.id);
            ++report.turrets_untouched;
            continue;
        }

        if (vehicle.set_turret_state(i, m_catalog.default_state(*item))) {
            ++report.turrets_assigned;
        } else {
            ++report.turrets_untouched;
        }
    }
}

} // namespace convoy_snapshot
