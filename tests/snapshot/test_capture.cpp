// convoy_snapshot capture tests

#include <catch2/catch_test_macros.hpp>
#include <convoy/snapshot/snapshot.hpp>

#include "../support/fixture.hpp"

using namespace convoy_snapshot;
using namespace convoy_test;
using convoy_math::Color32;

// =============================================================================
// Vehicle Fields
// =============================================================================

TEST_CASE("Capture records vehicle identity and state", "[snapshot][capture]") {
    Fixture fx;
    auto& truck = fx.spawn_truck(42, 5);
    truck.set_cosmetics(3, 9);
    truck.set_placement_offset(0.5f);

    VehicleSnapshot snap = fx.service.capture(truck);

    REQUIRE(snap.definition_id == TRUCK_ID);
    REQUIRE(snap.definition_guid == TRUCK_GUID);
    REQUIRE(snap.instance_id == truck.instance_id());
    REQUIRE(snap.skin_variant == 3);
    REQUIRE(snap.mythic_variant == 9);
    REQUIRE(snap.placement_offset == 0.5f);
    REQUIRE(snap.fuel_level == 300);
    REQUIRE(snap.integrity == 900);
    REQUIRE(snap.auxiliary_charge == 400);
    REQUIRE(snap.owner == 42);
    REQUIRE(snap.group == 5);
    REQUIRE(snap.position == convoy_math::Vec3(100.0f, 5.0f, -40.0f));
    REQUIRE(same_rotation(snap.rotation, convoy_math::quat::IDENTITY));
}

TEST_CASE("Capture records tires and turrets per slot", "[snapshot][capture]") {
    Fixture fx;
    auto& truck = fx.spawn_truck();

    SECTION("tires in index order") {
        truck.set_tire_alive(1, false);
        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE(snap.tires == std::vector<bool>{true, false, true, true});
    }

    SECTION("turret states in mount order") {
        REQUIRE(truck.set_turret_state(1, {0x42}));
        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE(snap.turret_states.size() == 2);
        REQUIRE(snap.turret_states[0] == CANNON_DEFAULT);
        REQUIRE(snap.turret_states[1] == convoy_core::Blob{0x42});
    }

    SECTION("unbacked mount records an empty state") {
        truck.clear_turret_backing(0);
        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE(snap.turret_states.size() == 2);
        REQUIRE(snap.turret_states[0].has_value());
        REQUIRE(snap.turret_states[0]->empty());
    }
}

// =============================================================================
// Paint
// =============================================================================

TEST_CASE("Capture normalizes paint", "[snapshot][capture][paint]") {
    Fixture fx;
    auto& truck = fx.spawn_truck();

    SECTION("no paint") {
        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE_FALSE(snap.paint.has_value());
        REQUIRE(snap.paint_bytes() == NO_PAINT);
    }

    SECTION("transparent paint counts as none") {
        truck.set_paint(Color32(10, 20, 30, 0));
        REQUIRE_FALSE(fx.service.capture(truck).paint.has_value());
    }

    SECTION("opaque black is a real color") {
        truck.set_paint(Color32(0, 0, 0, 255));
        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE(snap.paint == Color32(0, 0, 0, 255));
        REQUIRE(snap.paint_bytes() == PaintBytes{0, 0, 0, 255});
    }
}

TEST_CASE("Paint wire form", "[snapshot][paint]") {
    REQUIRE_FALSE(paint_from_bytes(NO_PAINT).has_value());
    REQUIRE(paint_from_bytes({0, 0, 0, 255}) == Color32(0, 0, 0, 255));
    // Color bits with zero alpha are kept as recorded
    REQUIRE(paint_from_bytes({10, 20, 30, 0}) == Color32(10, 20, 30, 0));
    REQUIRE(paint_to_bytes(std::nullopt) == NO_PAINT);
    REQUIRE_FALSE(normalize_paint(Color32::clear()).has_value());
}

// =============================================================================
// Cargo
// =============================================================================

TEST_CASE("Capture records cargo in stored order", "[snapshot][capture][cargo]") {
    Fixture fx;
    auto& truck = fx.spawn_truck();

    SECTION("empty trunk gives empty cargo") {
        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE(snap.cargo.empty());
    }

    SECTION("items keep position, rotation and payload") {
        auto* trunk = truck.memory_trunk();
        REQUIRE(trunk->try_add(convoy_world::Item{CRATE_ITEM, 3, 80, {0x09}}, 2, 1, 1));
        REQUIRE(trunk->try_add(convoy_world::Item{CANNON_ITEM, 1, 100, {}}, 0, 0, 0));

        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE(snap.cargo.width == 6);
        REQUIRE(snap.cargo.height == 4);
        REQUIRE(snap.cargo.items.size() == 2);

        const auto& first = snap.cargo.items[0];
        REQUIRE(first.x == 2);
        REQUIRE(first.y == 1);
        REQUIRE(first.rotation == 1);
        REQUIRE(first.item.id == CRATE_ITEM);
        REQUIRE(first.item.amount == 3);
        REQUIRE(first.item.quality == 80);
        REQUIRE(first.item.state == convoy_core::Blob{0x09});
        REQUIRE(snap.cargo.items[1].item.id == CANNON_ITEM);
    }

    SECTION("vehicle without trunk") {
        convoy_world::VehicleSpawnParams params;
        params.definition = fx.catalog.find_vehicle(BIKE_GUID, BIKE_ID);
        auto bike = fx.world.spawn_vehicle(params);
        REQUIRE(bike.is_ok());
        REQUIRE(fx.service.capture(*bike.value()).cargo.empty());
    }
}

// =============================================================================
// Children
// =============================================================================

TEST_CASE("Capture records mounted children", "[snapshot][capture][children]") {
    Fixture fx;
    auto& truck = fx.spawn_truck(42);

    SECTION("vehicle without region has no children") {
        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE(snap.barricades.empty());
        REQUIRE(snap.structures.empty());
    }

    SECTION("children are captured in region order with local transforms") {
        fx.plant_barricade(truck, 42, convoy_math::Vec3(0.0f, 1.0f, 0.0f));
        fx.plant_barricade(truck, 43, convoy_math::Vec3(1.5f, 0.0f, -2.0f));
        fx.plant_structure(truck, 42);

        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE(snap.child_count() == 3);
        REQUIRE(snap.barricades.size() == 2);

        const auto& b = snap.barricades[1];
        REQUIRE(b.id == BARRICADE_ID);
        REQUIRE(b.guid == BARRICADE_GUID);
        REQUIRE(b.health == 200);
        REQUIRE(b.owner == 43);
        REQUIRE(b.group == 5);
        REQUIRE(b.state == convoy_core::Blob{0x01, 0x02});
        REQUIRE(b.position == convoy_math::Vec3(1.5f, 0.0f, -2.0f));

        const auto& s = snap.structures[0];
        REQUIRE(s.id == STRUCTURE_ID);
        REQUIRE(s.health == 450);
        REQUIRE(s.position == convoy_math::Vec3(0.0f, 0.5f, -1.0f));
    }

    SECTION("destroyed children are left out") {
        std::uint32_t doomed = fx.plant_barricade(truck, 42);
        fx.plant_barricade(truck, 42, convoy_math::Vec3(2.0f, 0.0f, 0.0f));
        REQUIRE(fx.world.mark_destroyed(doomed));

        VehicleSnapshot snap = fx.service.capture(truck);
        REQUIRE(snap.barricades.size() == 1);
        REQUIRE(snap.barricades[0].position == convoy_math::Vec3(2.0f, 0.0f, 0.0f));
    }
}

TEST_CASE("Capture does not modify the vehicle", "[snapshot][capture]") {
    Fixture fx;
    auto& truck = fx.spawn_truck(42);
    fx.plant_barricade(truck, 42);

    VehicleSnapshot first = fx.service.capture(truck);
    VehicleSnapshot second = fx.service.capture(truck);
    REQUIRE(first == second);
    REQUIRE(truck.tire_mask_updates() == 0);
}
