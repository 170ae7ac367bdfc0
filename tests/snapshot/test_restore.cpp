// convoy_snapshot restore tests

#include <catch2/catch_test_macros.hpp>
#include <convoy/snapshot/snapshot.hpp>

#include "../support/fixture.hpp"

using namespace convoy_snapshot;
using namespace convoy_test;
using convoy_core::Blob;
using convoy_core::ErrorCode;
using convoy_math::Color32;

namespace {

/// Hand-built truck snapshot with no children and empty cargo
VehicleSnapshot truck_snapshot() {
    VehicleSnapshot snap;
    snap.definition_id = TRUCK_ID;
    snap.definition_guid = TRUCK_GUID;
    snap.instance_id = 77;
    snap.integrity = 800;
    snap.fuel_level = 250;
    snap.auxiliary_charge = 100;
    snap.owner = 42;
    snap.group = 5;
    snap.tires = {true, true, true, true};
    snap.turret_states = {Blob{0x0A}, Blob{0x0B}};
    snap.position = convoy_math::Vec3(12.0f, 3.0f, 4.0f);
    return snap;
}

BarricadeSnapshot plate_at(const convoy_math::Vec3& local, std::uint64_t owner = 42) {
    BarricadeSnapshot b;
    b.id = BARRICADE_ID;
    b.guid = BARRICADE_GUID;
    b.health = 180;
    b.owner = owner;
    b.group = 5;
    b.state = {0x01};
    b.position = local;
    return b;
}

StructureSnapshot floor_at(const convoy_math::Vec3& local, std::uint64_t owner = 42) {
    StructureSnapshot s;
    s.id = STRUCTURE_ID;
    s.guid = STRUCTURE_GUID;
    s.health = 400;
    s.owner = owner;
    s.group = 5;
    s.position = local;
    return s;
}

convoy_world::MemoryVehicle& live(Fixture& fx, const RestoreOutcome& outcome) {
    return *fx.world.find_vehicle(outcome.vehicle->instance_id());
}

} // anonymous namespace

// =============================================================================
// Round Trip
// =============================================================================

TEST_CASE("Restore reproduces a captured vehicle", "[snapshot][restore]") {
    Fixture fx;
    auto& original = fx.spawn_truck(42, 5);
    original.set_cosmetics(2, 4);
    original.set_placement_offset(0.75f);
    original.set_paint(Color32(200, 100, 50));
    original.set_tire_alive(3, false);
    REQUIRE(original.set_turret_state(0, {0xEE}));
    REQUIRE(original.memory_trunk()->try_add(convoy_world::Item{CRATE_ITEM, 2, 90, {0x05}}, 1, 2, 0));

    VehicleSnapshot before = fx.service.capture(original);
    auto outcome = fx.service.restore(before);
    REQUIRE(outcome.is_ok());

    auto& restored = live(fx, *outcome);
    REQUIRE(restored.instance_id() != original.instance_id());

    VehicleSnapshot after = fx.service.capture(restored);
    after.instance_id = before.instance_id;
    REQUIRE(after == before);
    REQUIRE(restored.is_locked());

    const auto& report = outcome->report;
    REQUIRE(report.tires_applied == 4);
    REQUIRE(report.tires_ignored == 0);
    REQUIRE(report.cargo_inserted == 1);
    REQUIRE(report.turret_path == TurretPath::Matched);
    REQUIRE(report.turrets_assigned == 2);
    REQUIRE(report.children_spawned() == 0);
}

TEST_CASE("Restore with children re-anchors them", "[snapshot][restore][children]") {
    Fixture fx;
    auto& original = fx.spawn_truck(42);
    fx.plant_barricade(original, 42, convoy_math::Vec3(0.0f, 1.0f, 0.0f));
    fx.plant_structure(original, 42);

    VehicleSnapshot snap = fx.service.capture(original);
    snap.position = convoy_math::Vec3(-500.0f, 10.0f, 500.0f);

    auto outcome = fx.service.restore(snap);
    REQUIRE(outcome.is_ok());
    REQUIRE(outcome->report.barricades_spawned == 1);
    REQUIRE(outcome->report.structures_spawned == 1);

    auto region = fx.world.find_attached_region(*outcome->vehicle);
    REQUIRE(region.has_value());
    auto barricades = fx.world.barricades_in(*region);
    REQUIRE(barricades.size() == 1);
    REQUIRE(barricades[0].local.position == convoy_math::Vec3(0.0f, 1.0f, 0.0f));
    REQUIRE(barricades[0].owner == 42);
    REQUIRE(barricades[0].state == Blob{0x01, 0x02});
    REQUIRE(fx.world.structures_in(*region)[0].health == 450);

    // The original composite is untouched
    REQUIRE(fx.world.barricades_in(*fx.world.find_attached_region(original)).size() == 1);
}

TEST_CASE("Restore never mutates the snapshot", "[snapshot][restore]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();
    snap.barricades.push_back(plate_at(convoy_math::Vec3(0.0f, 1.0f, 0.0f)));
    const VehicleSnapshot copy = snap;

    REQUIRE(fx.service.claim(snap, Claimant{99, 7}).is_ok());
    REQUIRE(fx.service.restore(snap).is_ok());
    REQUIRE(snap == copy);
}

// =============================================================================
// Paint
// =============================================================================

TEST_CASE("Restore applies paint only when recorded", "[snapshot][restore][paint]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();

    SECTION("no paint") {
        snap.set_paint_bytes(NO_PAINT);
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE_FALSE(outcome->vehicle->paint_color().has_value());
    }

    SECTION("opaque black") {
        snap.set_paint_bytes({0, 0, 0, 255});
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->vehicle->paint_color() == Color32(0, 0, 0, 255));
    }
}

// =============================================================================
// Tires
// =============================================================================

TEST_CASE("Restore reconciles tire counts", "[snapshot][restore][tires]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();

    SECTION("more recorded tires than the vehicle has") {
        snap.tires = {false, true, false, true, false, false};
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());

        auto& truck = live(fx, *outcome);
        REQUIRE_FALSE(truck.is_tire_alive(0));
        REQUIRE(truck.is_tire_alive(1));
        REQUIRE_FALSE(truck.is_tire_alive(2));
        REQUIRE(truck.is_tire_alive(3));
        REQUIRE(outcome->report.tires_applied == 4);
        REQUIRE(outcome->report.tires_ignored == 2);
    }

    SECTION("fewer recorded tires keep the rest at their defaults") {
        snap.tires = {false, false};
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());

        auto& truck = live(fx, *outcome);
        REQUIRE_FALSE(truck.is_tire_alive(0));
        REQUIRE_FALSE(truck.is_tire_alive(1));
        REQUIRE(truck.is_tire_alive(2));
        REQUIRE(truck.is_tire_alive(3));
        REQUIRE(outcome->report.tires_applied == 2);
    }

    SECTION("exactly one tire mask update per restore") {
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE(live(fx, *outcome).tire_mask_updates() == 1);
    }

    SECTION("no recorded tires still sends the update") {
        snap.tires.clear();
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE(live(fx, *outcome).tire_mask_updates() == 1);
        REQUIRE(outcome->report.tires_applied == 0);
    }
}

// =============================================================================
// Turrets
// =============================================================================

TEST_CASE("Restore reconciles turret states", "[snapshot][restore][turrets]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();

    SECTION("matching count copies states by index") {
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());

        auto& truck = live(fx, *outcome);
        REQUIRE(truck.turret_state(0) == Blob{0x0A});
        REQUIRE(truck.turret_state(1) == Blob{0x0B});
        REQUIRE(outcome->report.turret_path == TurretPath::Matched);
    }

    SECTION("null entries leave the mount as spawned") {
        snap.turret_states[1] = std::nullopt;
        fx.world.seed_next_spawn_turrets(Blob{0xEE});
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());

        auto& truck = live(fx, *outcome);
        REQUIRE(truck.turret_state(0) == Blob{0x0A});
        REQUIRE(truck.turret_state(1) == Blob{0xEE});
        REQUIRE(outcome->report.turrets_assigned == 1);
        REQUIRE(outcome->report.turrets_untouched == 1);
    }

    SECTION("count mismatch falls back to item defaults") {
        snap.turret_states = {Blob{0x0A}, Blob{0x0B}, Blob{0x0C}};
        fx.world.seed_next_spawn_turrets(Blob{0xEE});
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());

        auto& truck = live(fx, *outcome);
        REQUIRE(truck.turret_state(0) == CANNON_DEFAULT);
        REQUIRE(truck.turret_state(1) == MG_DEFAULT);
        REQUIRE(outcome->report.turret_path == TurretPath::Defaults);
        REQUIRE(outcome->report.turrets_assigned == 2);
    }

    SECTION("no recorded turrets on an armed vehicle") {
        snap.turret_states.clear();
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->report.turret_path == TurretPath::Defaults);
        REQUIRE(live(fx, *outcome).turret_state(0) == CANNON_DEFAULT);
    }

    SECTION("unarmed vehicle ignores recorded turrets") {
        snap.definition_id = BIKE_ID;
        snap.definition_guid = BIKE_GUID;
        snap.tires = {true, true};
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->vehicle->turret_count() == 0);
        REQUIRE(outcome->report.turret_path == TurretPath::Defaults);
        REQUIRE(outcome->report.turrets_assigned == 0);
    }
}

// =============================================================================
// Cargo
// =============================================================================

TEST_CASE("Restore reinserts cargo at recorded positions", "[snapshot][restore][cargo]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();
    snap.cargo.width = 6;
    snap.cargo.height = 4;

    SECTION("all items fit") {
        snap.cargo.items = {
            ItemJarSnapshot{0, 0, 0, ItemSnapshot{CRATE_ITEM, 1, 100, {}}},
            ItemJarSnapshot{3, 2, 1, ItemSnapshot{CRATE_ITEM, 4, 50, {0x07}}},
        };
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());

        const auto& items = outcome->vehicle->trunk()->items();
        REQUIRE(items.size() == 2);
        REQUIRE(items[1].x == 3);
        REQUIRE(items[1].y == 2);
        REQUIRE(items[1].rotation == 1);
        REQUIRE(items[1].item.amount == 4);
        REQUIRE(items[1].item.state == Blob{0x07});
    }

    SECTION("rejected items do not abort the restore") {
        snap.cargo.items = {
            ItemJarSnapshot{0, 0, 0, ItemSnapshot{CRATE_ITEM, 1, 100, {}}},
            ItemJarSnapshot{0, 0, 0, ItemSnapshot{CRATE_ITEM, 1, 100, {}}},
            ItemJarSnapshot{9, 9, 0, ItemSnapshot{CRATE_ITEM, 1, 100, {}}},
        };
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->report.cargo_inserted == 1);
        REQUIRE(outcome->report.cargo_rejected == 2);
    }

    SECTION("vehicle without trunk drops recorded cargo") {
        snap.definition_id = BIKE_ID;
        snap.definition_guid = BIKE_GUID;
        snap.cargo.items = {ItemJarSnapshot{0, 0, 0, ItemSnapshot{CRATE_ITEM, 1, 100, {}}}};
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->report.cargo_rejected == 1);
    }
}

// =============================================================================
// Children
// =============================================================================

TEST_CASE("Restore skips empty child entries", "[snapshot][restore][children]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();
    snap.barricades.push_back(BarricadeSnapshot{});
    snap.barricades.push_back(plate_at(convoy_math::Vec3(0.0f, 1.0f, 0.0f)));
    snap.structures.push_back(StructureSnapshot{});

    auto outcome = fx.service.restore(snap);
    REQUIRE(outcome.is_ok());
    REQUIRE(outcome->report.children_skipped == 2);
    REQUIRE(outcome->report.barricades_spawned == 1);
    REQUIRE(outcome->report.structures_spawned == 0);

    auto region = fx.world.find_attached_region(*outcome->vehicle);
    REQUIRE(region.has_value());
    REQUIRE(fx.world.barricades_in(*region).size() == 1);
    REQUIRE(fx.world.structures_in(*region).empty());
}

TEST_CASE("Restore ownership", "[snapshot][restore][ownership]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();
    snap.barricades.push_back(plate_at(convoy_math::Vec3(0.0f, 1.0f, 0.0f), 42));
    snap.structures.push_back(floor_at(convoy_math::Vec3(0.0f, 0.0f, 1.0f), 43));

    SECTION("plain restore keeps recorded owners") {
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->vehicle->owner() == 42);
        REQUIRE(outcome->vehicle->group() == 5);

        auto region = *fx.world.find_attached_region(*outcome->vehicle);
        REQUIRE(fx.world.barricades_in(region)[0].owner == 42);
        REQUIRE(fx.world.structures_in(region)[0].owner == 43);
    }

    SECTION("claimant without rebind changes only the vehicle") {
        RestoreOptions options;
        options.claimant = Claimant{99, 7};
        auto outcome = fx.service.restore(snap, options);
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->vehicle->owner() == 99);
        REQUIRE(outcome->vehicle->group() == 7);
        REQUIRE(outcome->vehicle->is_locked());

        auto region = *fx.world.find_attached_region(*outcome->vehicle);
        REQUIRE(fx.world.barricades_in(region)[0].owner == 42);
    }

    SECTION("claim rebinds children too") {
        auto outcome = fx.service.claim(snap, Claimant{99, 7});
        REQUIRE(outcome.is_ok());
        REQUIRE(outcome->vehicle->owner() == 99);

        auto region = *fx.world.find_attached_region(*outcome->vehicle);
        REQUIRE(fx.world.barricades_in(region)[0].owner == 99);
        REQUIRE(fx.world.barricades_in(region)[0].group == 7);
        REQUIRE(fx.world.structures_in(region)[0].owner == 99);
    }

    SECTION("unowned snapshot restores unlocked") {
        snap.owner = 0;
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_ok());
        REQUIRE_FALSE(outcome->vehicle->is_locked());
    }
}

// =============================================================================
// Failure Handling
// =============================================================================

TEST_CASE("Restore fails when the definition is unknown", "[snapshot][restore][errors]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();
    snap.definition_id = 999;
    snap.definition_guid = convoy_core::Guid::from_halves(9, 9);

    auto outcome = fx.service.restore(snap);
    REQUIRE(outcome.is_err());
    REQUIRE(outcome.error().code() == ErrorCode::NotFound);
    REQUIRE(fx.world.vehicle_count() == 0);
}

TEST_CASE("Restore resolves by legacy id when the guid is unknown", "[snapshot][restore]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();
    snap.definition_guid = convoy_core::Guid{};

    auto outcome = fx.service.restore(snap);
    REQUIRE(outcome.is_ok());
    REQUIRE(outcome->vehicle->definition_guid() == TRUCK_GUID);
}

TEST_CASE("Restore propagates spawn failure", "[snapshot][restore][errors]") {
    Fixture fx;
    fx.world.fail_next_spawn();

    auto outcome = fx.service.restore(truck_snapshot());
    REQUIRE(outcome.is_err());
    REQUIRE(outcome.error().is<convoy_core::WorldError>());
    REQUIRE(fx.world.vehicle_count() == 0);
}

TEST_CASE("Restore child failure", "[snapshot][restore][errors]") {
    Fixture fx;
    VehicleSnapshot snap = truck_snapshot();
    snap.barricades.push_back(plate_at(convoy_math::Vec3(0.0f, 1.0f, 0.0f)));
    snap.barricades.push_back(plate_at(convoy_math::Vec3(1.0f, 1.0f, 0.0f)));

    SECTION("rollback destroys the partial vehicle") {
        fx.world.fail_next_placement(1);
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_err());
        REQUIRE(outcome.error().get_context("barricade_id") != nullptr);
        REQUIRE(fx.world.vehicle_count() == 0);
        REQUIRE(fx.world.region_count() == 0);
    }

    SECTION("without rollback the partial vehicle is reported") {
        fx.world.fail_next_placement(1);
        RestoreOptions options;
        options.rollback_on_error = false;
        auto outcome = fx.service.restore(snap, options);
        REQUIRE(outcome.is_err());
        REQUIRE(fx.world.vehicle_count() == 1);

        const std::string* id = outcome.error().get_context("instance_id");
        REQUIRE(id != nullptr);
        auto* partial = fx.world.find_vehicle(static_cast<std::uint32_t>(std::stoul(*id)));
        REQUIRE(partial != nullptr);
        REQUIRE(fx.world.barricades_in(*fx.world.find_attached_region(*partial)).size() == 1);
    }

    SECTION("unknown child definition is fatal") {
        snap.structures.push_back(floor_at(convoy_math::Vec3(0.0f, 0.0f, 1.0f)));
        snap.structures.back().id = 404;
        snap.structures.back().guid = convoy_core::Guid{};
        auto outcome = fx.service.restore(snap);
        REQUIRE(outcome.is_err());
        REQUIRE(outcome.error().is<convoy_core::CatalogError>());
        REQUIRE(fx.world.vehicle_count() == 0);
    }
}

// =============================================================================
// End To End
// =============================================================================

TEST_CASE("Claim a stored armed truck", "[snapshot][restore][scenario]") {
    Fixture fx;

    VehicleSnapshot snap = truck_snapshot();
    snap.tires = {true, false, true, true};
    snap.turret_states = {Blob{0xA0}, Blob{0xB0}};
    snap.paint = Color32(10, 20, 30, 255);
    snap.barricades.push_back(plate_at(convoy_math::Vec3(0.0f, 1.0f, 0.0f), 42));

    auto outcome = fx.service.claim(snap, Claimant{99, 0});
    REQUIRE(outcome.is_ok());

    auto& truck = live(fx, *outcome);
    REQUIRE(truck.owner() == 99);
    REQUIRE(truck.is_locked());
    REQUIRE(truck.paint_color() == Color32(10, 20, 30, 255));
    REQUIRE(truck.is_tire_alive(0));
    REQUIRE_FALSE(truck.is_tire_alive(1));
    REQUIRE(truck.turret_state(0) == Blob{0xA0});
    REQUIRE(truck.turret_state(1) == Blob{0xB0});
    REQUIRE(truck.tire_mask_updates() == 1);

    auto region = fx.world.find_attached_region(truck);
    REQUIRE(region.has_value());
    auto barricades = fx.world.barricades_in(*region);
    REQUIRE(barricades.size() == 1);
    REQUIRE(barricades[0].id == BARRICADE_ID);
    REQUIRE(barricades[0].owner == 99);

    REQUIRE_FALSE(outcome->report.summary().empty());
}
