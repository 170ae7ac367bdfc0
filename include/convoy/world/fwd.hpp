#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for convoy_world

namespace convoy_world {

struct RegionHandle;
struct Item;
struct ItemJar;
struct BarricadeDrop;
struct StructureDrop;
struct BarricadePlacement;
struct StructurePlacement;
struct VehicleSpawnParams;

class IItemContainer;
class IVehicle;
class IWorld;

class MemoryItemContainer;
class MemoryVehicle;
class MemoryWorld;

} // namespace convoy_world
