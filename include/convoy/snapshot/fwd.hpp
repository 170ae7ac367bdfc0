#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for convoy_snapshot

namespace convoy_snapshot {

struct Claimant;
struct RestoreOptions;
struct RestoreReport;
struct RestoreOutcome;

struct ItemSnapshot;
struct ItemJarSnapshot;
struct CargoSnapshot;
struct BarricadeSnapshot;
struct StructureSnapshot;
struct VehicleSnapshot;

class SnapshotService;

} // namespace convoy_snapshot
