#pragma once

/// @file fixture.hpp
/// @brief Shared catalog and world setup for convoy tests

#include <convoy/catalog/catalog.hpp>
#include <convoy/snapshot/service.hpp>
#include <convoy/world/memory_world.hpp>

namespace convoy_test {

inline constexpr std::uint16_t TRUCK_ID = 10;
inline constexpr std::uint16_t BIKE_ID = 11;
inline constexpr std::uint16_t CANNON_ITEM = 120;
inline constexpr std::uint16_t MG_ITEM = 121;
inline constexpr std::uint16_t CRATE_ITEM = 200;
inline constexpr std::uint16_t BARRICADE_ID = 7;
inline constexpr std::uint16_t STRUCTURE_ID = 31;

inline const convoy_core::Guid TRUCK_GUID = convoy_core::Guid::from_halves(0x0a0a0a0a0a0a0a0aULL, 0x1000000000000010ULL);
inline const convoy_core::Guid BIKE_GUID = convoy_core::Guid::from_halves(0x0b0b0b0b0b0b0b0bULL, 0x1100000000000011ULL);
inline const convoy_core::Guid BARRICADE_GUID = convoy_core::Guid::from_halves(0x0707070707070707ULL, 0x7ULL);
inline const convoy_core::Guid STRUCTURE_GUID = convoy_core::Guid::from_halves(0x3131313131313131ULL, 0x31ULL);

/// Rotations compare equal when q and -q describe the same orientation
inline bool same_rotation(const convoy_math::Quat& a, const convoy_math::Quat& b, float epsilon = 1e-4f) {
    return glm::abs(glm::dot(a, b)) >= 1.0f - epsilon;
}

inline const convoy_core::Blob CANNON_DEFAULT = {0xC0, 0x01};
inline const convoy_core::Blob MG_DEFAULT = {0x4D, 0x47, 0x00};

/// Armed truck (4 tires, 2 mounts, 6x4 trunk), a bike, one barricade and one structure kind
inline void populate(convoy_catalog::DefinitionCatalog& catalog) {
    convoy_catalog::ItemDef cannon;
    cannon.id = CANNON_ITEM;
    cannon.name = "cannon";
    cannon.default_state = CANNON_DEFAULT;
    catalog.register_item(cannon).unwrap();

    convoy_catalog::ItemDef mg;
    mg.id = MG_ITEM;
    mg.name = "machine gun";
    mg.default_state = MG_DEFAULT;
    catalog.register_item(mg).unwrap();

    convoy_catalog::ItemDef crate;
    crate.id = CRATE_ITEM;
    crate.name = "crate";
    catalog.register_item(crate).unwrap();

    convoy_catalog::VehicleDef truck;
    truck.id = TRUCK_ID;
    truck.guid = TRUCK_GUID;
    truck.name = "armed truck";
    truck.tire_count = 4;
    truck.turrets = {{CANNON_ITEM}, {MG_ITEM}};
    truck.trunk_width = 6;
    truck.trunk_height = 4;
    truck.max_fuel = 500;
    truck.max_health = 1000;
    truck.max_battery = 800;
    catalog.register_vehicle(truck).unwrap();

    convoy_catalog::VehicleDef bike;
    bike.id = BIKE_ID;
    bike.guid = BIKE_GUID;
    bike.name = "bike";
    bike.tire_count = 2;
    bike.max_fuel = 50;
    bike.max_health = 200;
    catalog.register_vehicle(bike).unwrap();

    convoy_catalog::BarricadeDef plate;
    plate.id = BARRICADE_ID;
    plate.guid = BARRICADE_GUID;
    plate.name = "metal plate";
    plate.max_health = 250;
    catalog.register_barricade(plate).unwrap();

    convoy_catalog::StructureDef floor;
    floor.id = STRUCTURE_ID;
    floor.guid = STRUCTURE_GUID;
    floor.name = "floor";
    floor.max_health = 500;
    catalog.register_structure(floor).unwrap();
}

/// Catalog + in-memory world + service wired together
struct Fixture {
    convoy_catalog::DefinitionCatalog catalog;
    convoy_world::MemoryWorld world{catalog};
    convoy_snapshot::SnapshotService service{world, catalog};

    Fixture() { populate(catalog); }

    /// Spawn a truck with plain resources
    convoy_world::MemoryVehicle& spawn_truck(std::uint64_t owner = 0, std::uint64_t group = 0) {
        convoy_world::VehicleSpawnParams params;
        params.definition = catalog.find_vehicle(TRUCK_GUID, TRUCK_ID);
        params.frame = convoy_math::Frame(convoy_math::Vec3(100.0f, 5.0f, -40.0f), convoy_math::quat::IDENTITY);
        params.fuel = 300;
        params.integrity = 900;
        params.auxiliary_charge = 400;
        params.owner = owner;
        params.group = group;
        params.locked = owner != 0;
        auto spawned = world.spawn_vehicle(params);
        return *world.find_vehicle(spawned.unwrap()->instance_id());
    }

    /// Plant a barricade on a vehicle
    std::uint32_t plant_barricade(const convoy_world::IVehicle& anchor, std::uint64_t owner,
        const convoy_math::Vec3& local = convoy_math::Vec3(0.0f, 1.0f, 0.0f))
    {
        convoy_world::BarricadePlacement placement;
        placement.health = 200;
        placement.owner = owner;
        placement.group = 5;
        placement.state = {0x01, 0x02};
        placement.local = convoy_math::Frame(local, convoy_math::quat::IDENTITY);
        return world.place_barricade(*catalog.find_barricade(BARRICADE_GUID, BARRICADE_ID), placement, anchor).unwrap();
    }

    /// Plant a structure on a vehicle
    std::uint32_t plant_structure(const convoy_world::IVehicle& anchor, std::uint64_t owner) {
        convoy_world::StructurePlacement placement;
        placement.health = 450;
        placement.owner = owner;
        placement.group = 5;
        placement.local = convoy_math::Frame(convoy_math::Vec3(0.0f, 0.5f, -1.0f), convoy_math::quat::IDENTITY);
        return world.place_structure(*catalog.find_structure(STRUCTURE_GUID, STRUCTURE_ID), placement, anchor).unwrap();
    }
};

} // namespace convoy_test
