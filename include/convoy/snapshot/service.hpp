#pragma once

/// @file service.hpp
/// @brief Capture and restore of vehicle composites
///
/// Restore order:
/// 1. resolve the vehicle definition (GUID first, legacy id fallback)
/// 2. create the vehicle with the effective owner/group and paint override
/// 3. tires, then cargo
/// 4. barricades, then structures, anchored to the new vehicle
/// 5. turrets
///
/// Everything runs synchronously on the world-owning thread.

#include "vehicle.hpp"
#include "types.hpp"
#include <convoy/catalog/fwd.hpp>
#include <convoy/core/error.hpp>
#include <convoy/world/fwd.hpp>

namespace convoy_snapshot {

class SnapshotService {
public:
    SnapshotService(convoy_world::IWorld& world, const convoy_catalog::ICatalog& catalog)
        : m_world(world), m_catalog(catalog) {}

    /// Capture a live vehicle and its non-destroyed children; no side effects
    [[nodiscard]] VehicleSnapshot capture(const convoy_world::IVehicle& vehicle) const;

    /// Build a live vehicle from a snapshot.
    /// On failure after creation the vehicle is destroyed when
    /// options.rollback_on_error is set; otherwise the error carries
    /// its "instance_id" context.
    [[nodiscard]] convoy_core::Result<RestoreOutcome> restore(
        const VehicleSnapshot& snapshot, const RestoreOptions& options = {}) const;

    /// Restore for a new owner; children are rebound to the claimant
    [[nodiscard]] convoy_core::Result<RestoreOutcome> claim(
        const VehicleSnapshot& snapshot, const Claimant& claimant) const;

private:
    convoy_core::Result<void> apply(
        const VehicleSnapshot& snapshot,
        const convoy_catalog::VehicleDef& def,
        const std::optional<Claimant>& child_override,
        convoy_world::IVehicle& vehicle,
        RestoreReport& report) const;

    void reconcile_tires(const VehicleSnapshot& snapshot, convoy_world::IVehicle& vehicle, RestoreReport& report) const;

    void reconcile_turrets(
        const VehicleSnapshot& snapshot,
        const convoy_catalog::VehicleDef& def,
        convoy_world::IVehicle& vehicle,
        RestoreReport& report) const;

private:
    convoy_world::IWorld& m_world;
    const convoy_catalog::ICatalog& m_catalog;
};

} // namespace convoy_snapshot
