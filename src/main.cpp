/// @file main.cpp
/// @brief convoy_inspect - inspect and test-restore vehicle snapshots
///
/// Usage:
///   convoy_inspect [--config=FILE] --catalog-path=FILE --snapshot-path=FILE [--inspect-restore]
///                  [--restore-owner=ID] [--restore-group=ID] [--log-level=LEVEL]
///
/// Catalog and snapshot may also be given as the first two positional
/// arguments. Every option can also come from a JSON config file or from
/// CONVOY_* environment variables (e.g. CONVOY_LOG_LEVEL=debug).

#include <convoy/catalog/catalog.hpp>
#include <convoy/core/log.hpp>
#include <convoy/engine/config.hpp>
#include <convoy/snapshot/snapshot.hpp>
#include <convoy/world/memory_world.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
namespace keys = convoy_engine::config_keys;

namespace {

void print_usage() {
    std::cout <<
        "usage: convoy_inspect [options] [CATALOG] [SNAPSHOT]\n"
        "\n"
        "  --config=FILE             JSON config layer\n"
        "  --catalog-path=FILE       definition catalog (JSON)\n"
        "  --snapshot-path=FILE      vehicle snapshot (JSON)\n"
        "  --inspect-restore         restore into an in-memory world and re-capture\n"
        "  --restore-owner=ID        claimant owner for the restore\n"
        "  --restore-group=ID        claimant group for the restore\n"
        "  --log-level=LEVEL         trace|debug|info|warn|error|off\n";
}

convoy_core::Result<std::string> read_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return convoy_core::Error(convoy_core::ErrorCode::IOError, "Failed to open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return convoy_core::Ok(buffer.str());
}

std::string describe_paint(const convoy_snapshot::VehicleSnapshot& snap) {
    if (!snap.paint) {
        return "none";
    }
    const auto& c = *snap.paint;
    std::ostringstream ss;
    ss << "rgba(" << int(c.r) << ", " << int(c.g) << ", " << int(c.b) << ", " << int(c.a) << ")";
    return ss.str();
}

void print_summary(const convoy_snapshot::VehicleSnapshot& snap, const convoy_catalog::ICatalog& catalog) {
    const auto* def = catalog.find_vehicle(snap.definition_guid, snap.definition_id);

    std::cout << "Vehicle snapshot\n";
    std::cout << "  definition:  " << snap.definition_id << " / " << snap.definition_guid;
    std::cout << (def ? " -> " + def->name : std::string(" (unresolved)")) << "\n";
    std::cout << "  instance:    " << snap.instance_id << "\n";
    std::cout << "  cosmetics:   skin " << snap.skin_variant << ", mythic " << snap.mythic_variant
              << ", paint " << describe_paint(snap) << "\n";
    std::cout << "  resources:   integrity " << snap.integrity << ", fuel " << snap.fuel_level
              << ", charge " << snap.auxiliary_charge << "\n";
    std::cout << "  ownership:   owner " << snap.owner << ", group " << snap.group << "\n";
    std::cout << "  position:    (" << snap.position.x << ", " << snap.position.y << ", " << snap.position.z
              << ") offset " << snap.placement_offset << "\n";

    std::cout << "  tires:       [";
    for (std::size_t i = 0; i < snap.tires.size(); ++i) {
        std::cout << (i ? " " : "") << (snap.tires[i] ? "o" : "x");
    }
    std::cout << "]\n";

    std::cout << "  turrets:     " << snap.turret_states.size();
    if (def && def->turrets.size() != snap.turret_states.size()) {
        std::cout << " (definition now has " << def->turrets.size() << ", defaults will be used)";
    }
    std::cout << "\n";

    std::cout << "  cargo:       " << snap.cargo.items.size() << " items in "
              << int(snap.cargo.width) << "x" << int(snap.cargo.height) << "\n";
    std::cout << "  children:    " << snap.barricades.size() << " barricades, "
              << snap.structures.size() << " structures\n";
}

int run(convoy_engine::ConfigManager& config) {
    const auto& positional = config.positional_args();
    std::string catalog_path = config.get_string(keys::CATALOG_PATH, positional.size() > 0 ? positional[0] : "");
    std::string snapshot_path = config.get_string(keys::SNAPSHOT_PATH, positional.size() > 1 ? positional[1] : "");

    if (catalog_path.empty() || snapshot_path.empty()) {
        print_usage();
        return 1;
    }

    convoy_catalog::DefinitionCatalog catalog;
    auto loaded = catalog.load_file(catalog_path);
    if (!loaded) {
        spdlog::error("{}", convoy_core::build_error_chain(loaded.error()));
        return 1;
    }

    auto text = read_file(snapshot_path);
    if (!text) {
        spdlog::error("{}", convoy_core::build_error_chain(text.error()));
        return 1;
    }

    auto snapshot = convoy_snapshot::codec::from_string(*text);
    if (!snapshot) {
        spdlog::error("{}", convoy_core::build_error_chain(snapshot.error().with_context("path", snapshot_path)));
        return 1;
    }

    print_summary(*snapshot, catalog);

    auto resolved = catalog.resolve_vehicle(snapshot->definition_guid, snapshot->definition_id);
    if (!resolved) {
        std::cout << "Definition does not resolve: " << resolved.error().message() << "\n";
        return 1;
    }

    if (!config.get_bool(keys::INSPECT_RESTORE, false)) {
        return 0;
    }

    convoy_world::MemoryWorld world(catalog);
    convoy_snapshot::SnapshotService service(world, catalog);

    auto options = convoy_snapshot::RestoreOptions::from_config(config);
    auto outcome = service.restore(*snapshot, options);
    if (!outcome) {
        spdlog::error("Restore failed: {}", convoy_core::build_error_chain(outcome.error()));
        return 1;
    }

    std::cout << "\nRestored as instance " << outcome->vehicle->instance_id() << "\n";
    std::cout << "  " << outcome->report.summary() << "\n\n";

    auto recaptured = service.capture(*outcome->vehicle);
    std::cout << convoy_snapshot::codec::to_string(recaptured) << "\n";
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    convoy_core::init_logging();

    convoy_engine::ConfigManager config;
    config.setup_defaults();

    auto parsed = config.parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message() << "\n";
        print_usage();
        return 1;
    }

    if (config.get_bool("help", false)) {
        print_usage();
        return 0;
    }

    config.load_environment();

    if (config.contains(keys::CONFIG_PATH)) {
        fs::path config_path = config.get_string(keys::CONFIG_PATH);
        auto loaded = config.load_json(config_path, "user");
        if (!loaded) {
            std::cerr << convoy_core::build_error_chain(loaded.error()) << "\n";
            return 1;
        }
    }

    convoy_core::configure_logging(convoy_engine::log_config_from(config));

    int code = run(config);

    if (convoy_core::debug::total_error_count() > 0) {
        CONVOY_LOG_DEBUG("{}", convoy_core::debug::error_stats_summary());
    }

    convoy_core::shutdown_logging();
    return code;
}
