// convoy_catalog definition catalog tests

#include <catch2/catch_test_macros.hpp>
#include <convoy/catalog/catalog.hpp>
#include <convoy/core/blob.hpp>

#include <nlohmann/json.hpp>

#include "../support/fixture.hpp"

using namespace convoy_catalog;
using namespace convoy_test;
using convoy_core::ErrorCode;
using convoy_core::Guid;

// =============================================================================
// Registration Tests
// =============================================================================

TEST_CASE("DefinitionCatalog registration", "[catalog]") {
    DefinitionCatalog catalog;
    populate(catalog);

    REQUIRE(catalog.vehicle_count() == 2);
    REQUIRE(catalog.item_count() == 3);
    REQUIRE(catalog.barricade_count() == 1);
    REQUIRE(catalog.structure_count() == 1);

    SECTION("duplicate legacy id is rejected") {
        VehicleDef dup;
        dup.id = TRUCK_ID;
        dup.name = "other truck";
        auto result = catalog.register_vehicle(dup);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::AlreadyExists);
        REQUIRE(catalog.vehicle_count() == 2);
    }

    SECTION("duplicate guid is rejected") {
        BarricadeDef dup;
        dup.id = 99;
        dup.guid = BARRICADE_GUID;
        REQUIRE(catalog.register_barricade(dup).is_err());
    }

    SECTION("legacy id 0 is reserved") {
        ItemDef zero;
        zero.id = 0;
        auto result = catalog.register_item(zero);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
    }

    SECTION("a definition without guid resolves by id only") {
        StructureDef wall;
        wall.id = 32;
        wall.max_health = 100;
        REQUIRE(catalog.register_structure(wall).is_ok());
        REQUIRE(catalog.find_structure(Guid{}, 32) != nullptr);
    }
}

// =============================================================================
// Lookup Tests
// =============================================================================

TEST_CASE("DefinitionCatalog lookup order", "[catalog]") {
    DefinitionCatalog catalog;
    populate(catalog);

    SECTION("guid wins over a mismatched id") {
        const VehicleDef* def = catalog.find_vehicle(TRUCK_GUID, BIKE_ID);
        REQUIRE(def != nullptr);
        REQUIRE(def->id == TRUCK_ID);
    }

    SECTION("unknown guid falls back to legacy id") {
        const VehicleDef* def = catalog.find_vehicle(Guid::from_halves(1, 1), BIKE_ID);
        REQUIRE(def != nullptr);
        REQUIRE(def->guid == BIKE_GUID);
    }

    SECTION("empty guid uses legacy id") {
        REQUIRE(catalog.find_barricade(Guid{}, BARRICADE_ID) != nullptr);
    }

    SECTION("both keys unknown") {
        REQUIRE(catalog.find_vehicle(Guid::from_halves(1, 1), 999) == nullptr);
        REQUIRE(catalog.find_item(999) == nullptr);
    }

    SECTION("default state comes from the item definition") {
        const ItemDef* cannon = catalog.find_item(CANNON_ITEM);
        REQUIRE(cannon != nullptr);
        REQUIRE(catalog.default_state(*cannon) == CANNON_DEFAULT);
    }
}

TEST_CASE("DefinitionCatalog resolve_vehicle", "[catalog]") {
    DefinitionCatalog catalog;
    populate(catalog);

    SECTION("hit") {
        auto result = catalog.resolve_vehicle(TRUCK_GUID, TRUCK_ID);
        REQUIRE(result.is_ok());
        REQUIRE(result.value()->tire_count == 4);
        REQUIRE(result.value()->has_trunk());
    }

    SECTION("miss reports both keys") {
        convoy_core::debug::reset_error_stats();
        auto result = catalog.resolve_vehicle(Guid::from_halves(2, 2), 404);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
        const auto* kind = result.error().as<convoy_core::CatalogError>();
        REQUIRE(kind != nullptr);
        REQUIRE(kind->legacy_id == 404);
        REQUIRE(kind->guid == Guid::from_halves(2, 2).to_string());
        REQUIRE(convoy_core::debug::catalog_error_count() == 1);
    }
}

// =============================================================================
// JSON Loading Tests
// =============================================================================

TEST_CASE("DefinitionCatalog load_json", "[catalog][json]") {
    DefinitionCatalog catalog;

    SECTION("full document") {
        auto doc = nlohmann::json::parse(R"({
            "items": [
                {"id": 120, "name": "cannon", "state": "wAE="},
                {"id": 200, "name": "crate", "amount": 3, "quality": 80}
            ],
            "barricades": [{"id": 7, "guid": "07070707-0707-0707-0000-000000000007", "max_health": 250}],
            "structures": [{"id": 31, "max_health": 500}],
            "vehicles": [{
                "id": 10, "guid": "0a0a0a0a-0a0a-0a0a-1000-000000000010", "name": "armed truck",
                "tires": 4, "turrets": [120, 121], "trunk": {"width": 6, "height": 4},
                "max_fuel": 500, "max_health": 1000, "max_battery": 800
            }]
        })");
        REQUIRE(catalog.load_json(doc).is_ok());

        const VehicleDef* truck = catalog.find_vehicle(TRUCK_GUID, 0);
        REQUIRE(truck != nullptr);
        REQUIRE(truck->turrets.size() == 2);
        REQUIRE(truck->turrets[1].item_id == 121);
        REQUIRE(truck->trunk_width == 6);
        REQUIRE(truck->max_battery == 800);

        const ItemDef* cannon = catalog.find_item(120);
        REQUIRE(cannon != nullptr);
        REQUIRE(cannon->default_state == convoy_core::Blob{0xC0, 0x01});

        const ItemDef* crate = catalog.find_item(200);
        REQUIRE(crate->default_amount == 3);
        REQUIRE(crate->default_quality == 80);

        REQUIRE(catalog.find_barricade(BARRICADE_GUID, 0) != nullptr);
    }

    SECTION("out of range value") {
        auto doc = nlohmann::json::parse(R"({"vehicles": [{"id": 10, "tires": 300}]})");
        auto result = catalog.load_json(doc);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ValidationError);
        REQUIRE(result.error().get_context("index") != nullptr);
    }

    SECTION("malformed guid") {
        auto doc = nlohmann::json::parse(R"({"structures": [{"id": 3, "guid": "not-a-guid"}]})");
        REQUIRE(catalog.load_json(doc).is_err());
    }

    SECTION("bad item state encoding") {
        auto doc = nlohmann::json::parse(R"({"items": [{"id": 5, "state": "***"}]})");
        REQUIRE(catalog.load_json(doc).is_err());
    }

    SECTION("root must be an object") {
        auto result = catalog.load_json(nlohmann::json::array());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }
}

TEST_CASE("DefinitionCatalog load_json is all or nothing", "[catalog][json]") {
    DefinitionCatalog catalog;
    populate(catalog);

    const auto barricade_guid = Guid::parse("09090909-0909-0909-0000-000000000901");
    REQUIRE(barricade_guid.has_value());

    auto bad = nlohmann::json::parse(R"({
        "items": [{"id": 900}],
        "barricades": [{"id": 901, "guid": "09090909-0909-0909-0000-000000000901"}],
        "vehicles": [{"id": 902, "tires": 300}]
    })");
    REQUIRE(catalog.load_json(bad).is_err());

    REQUIRE(catalog.vehicle_count() == 2);
    REQUIRE(catalog.item_count() == 3);
    REQUIRE(catalog.barricade_count() == 1);
    REQUIRE(catalog.find_item(900) == nullptr);
    REQUIRE(catalog.find_barricade(*barricade_guid, 901) == nullptr);
    REQUIRE(catalog.find_item(CANNON_ITEM) != nullptr);

    SECTION("the same definitions load once corrected") {
        bad["vehicles"][0]["tires"] = 4;
        REQUIRE(catalog.load_json(bad).is_ok());
        REQUIRE(catalog.item_count() == 4);
        REQUIRE(catalog.find_barricade(*barricade_guid, 0) != nullptr);
        REQUIRE(catalog.find_vehicle(Guid{}, 902) != nullptr);
    }
}

TEST_CASE("DefinitionCatalog load_file", "[catalog][json]") {
    DefinitionCatalog catalog;
    auto result = catalog.load_file("/nonexistent/convoy/catalog.json");
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::IOError);
}
