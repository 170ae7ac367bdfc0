#pragma once

/// @file types.hpp
/// @brief Restore options and reconciliation report

#include "fwd.hpp"
#include <convoy/core/blob.hpp>
#include <convoy/engine/fwd.hpp>
#include <convoy/world/fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace convoy_snapshot {

/// Turret mount state; nullopt when the mount had nothing to record
using TurretState = std::optional<convoy_core::Blob>;

// =============================================================================
// Restore Options
// =============================================================================

/// Identity taking ownership of a restored vehicle
struct Claimant {
    std::uint64_t owner = 0;
    std::uint64_t group = 0;

    bool operator==(const Claimant&) const = default;
};

/// How a snapshot is turned back into a live vehicle
struct RestoreOptions {
    /// Replaces the snapshot's owner/group on the vehicle when set
    std::optional<Claimant> claimant;

    /// Give mounted children the effective owner/group instead of their recorded ones
    bool rebind_child_ownership = false;

    /// Destroy the half-built vehicle when a step after creation fails
    bool rollback_on_error = true;

    /// Read restore.* keys (restore.owner / restore.group make a claimant)
    [[nodiscard]] static RestoreOptions from_config(const convoy_engine::ConfigManager& config);
};

// =============================================================================
// Restore Report
// =============================================================================

/// Which turret reconciliation path restore took
enum class TurretPath : std::uint8_t {
    Matched,    ///< Snapshot length matched the mounts; states copied
    Defaults,   ///< Length mismatch; mounts reset to their item defaults
};

[[nodiscard]] inline const char* turret_path_name(TurretPath path) {
    switch (path) {
        case TurretPath::Matched: return "matched";
        case TurretPath::Defaults: return "defaults";
        default: return "unknown";
    }
}

/// What restore reconciled, for logs and callers that care
struct RestoreReport {
    std::size_t tires_applied = 0;
    std::size_t tires_ignored = 0;      ///< Recorded slots beyond the new vehicle's tire count

    std::size_t cargo_inserted = 0;
    std::size_t cargo_rejected = 0;

    std::size_t barricades_spawned = 0;
    std::size_t structures_spawned = 0;
    std::size_t children_skipped = 0;   ///< Empty (id 0) entries

    TurretPath turret_path = TurretPath::Matched;
    std::size_t turrets_assigned = 0;
    std::size_t turrets_untouched = 0;

    [[nodiscard]] std::size_t children_spawned() const { return barricades_spawned + structures_spawned; }

    [[nodiscard]] std::string summary() const;
};

/// Result of a successful restore
struct RestoreOutcome {
    convoy_world::IVehicle* vehicle = nullptr;
    RestoreReport report;
};

} // namespace convoy_snapshot
