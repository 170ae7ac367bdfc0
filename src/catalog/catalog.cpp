/// @file catalog.cpp
/// @brief Definition catalog implementation

#include <convoy/catalog/catalog.hpp>
#include <convoy/core/log.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>

namespace convoy_catalog {

// =============================================================================
// ICatalog
// =============================================================================

convoy_core::Result<const VehicleDef*> ICatalog::resolve_vehicle(
    const convoy_core::Guid& guid, std::uint16_t id) const
{
    if (const VehicleDef* def = find_vehicle(guid, id)) {
        return convoy_core::Ok(def);
    }

    convoy_core::Error error = convoy_core::CatalogError::definition_not_found(kind::VEHICLE, guid.to_string(), id);
    convoy_core::debug::record_error(error);
    return convoy_core::Err<const VehicleDef*>(std::move(error));
}

// =============================================================================
// JSON Helpers
// =============================================================================

namespace {

/// Read an optional unsigned field with range checking
template<typename T>
convoy_core::Result<void> read_uint(const nlohmann::json& j, const char* field, const char* kind_name, T& out) {
    if (!j.contains(field)) {
        return convoy_core::Ok();
    }
    const auto& v = j[field];
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<std::int64_t>() >= 0)) {
        return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind_name,
            std::string("'") + field + "' must be a non-negative integer"));
    }
    auto raw = v.get<std::uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind_name,
            std::string("'") + field + "' out of range: " + std::to_string(raw)));
    }
    out = static_cast<T>(raw);
    return convoy_core::Ok();
}

/// Read the shared id/guid/name header of a definition
convoy_core::Result<void> read_header(const nlohmann::json& j, const char* kind_name,
    std::uint16_t& id, convoy_core::Guid& guid, std::string& name)
{
    if (!j.is_object()) {
        return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind_name, "entry must be an object"));
    }

    auto id_result = read_uint(j, "id", kind_name, id);
    if (!id_result) return id_result;

    if (j.contains("guid")) {
        if (!j["guid"].is_string()) {
            return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind_name, "'guid' must be a string"));
        }
        auto text = j["guid"].get<std::string>();
        auto parsed = convoy_core::Guid::parse(text);
        if (!parsed) {
            return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind_name, "malformed guid '" + text + "'"));
        }
        guid = *parsed;
    }

    if (j.contains("name") && j["name"].is_string()) {
        name = j["name"].get<std::string>();
    }

    return convoy_core::Ok();
}

convoy_core::Result<VehicleDef> parse_vehicle(const nlohmann::json& j) {
    VehicleDef def;
    auto header = read_header(j, kind::VEHICLE, def.id, def.guid, def.name);
    if (!header) return header.error();

    for (auto result : {
            read_uint(j, "tires", kind::VEHICLE, def.tire_count),
            read_uint(j, "max_fuel", kind::VEHICLE, def.max_fuel),
            read_uint(j, "max_health", kind::VEHICLE, def.max_health),
            read_uint(j, "max_battery", kind::VEHICLE, def.max_battery)}) {
        if (!result) return result.error();
    }

    if (j.contains("turrets")) {
        if (!j["turrets"].is_array()) {
            return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind::VEHICLE, "'turrets' must be an array"));
        }
        for (const auto& mount : j["turrets"]) {
            if (!mount.is_number_unsigned() || mount.get<std::uint64_t>() > std::numeric_limits<std::uint16_t>::max()) {
                return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind::VEHICLE,
                    "turret mount item ids must be 16-bit unsigned integers"));
            }
            def.turrets.push_back(TurretMount{mount.get<std::uint16_t>()});
        }
    }

    if (j.contains("trunk") && j["trunk"].is_object()) {
        const auto& trunk = j["trunk"];
        auto w = read_uint(trunk, "width", kind::VEHICLE, def.trunk_width);
        if (!w) return w.error();
        auto h = read_uint(trunk, "height", kind::VEHICLE, def.trunk_height);
        if (!h) return h.error();
    }

    return convoy_core::Ok(std::move(def));
}

convoy_core::Result<ItemDef> parse_item(const nlohmann::json& j) {
    ItemDef def;
    auto header = read_header(j, kind::ITEM, def.id, def.guid, def.name);
    if (!header) return header.error();

    auto amount = read_uint(j, "amount", kind::ITEM, def.default_amount);
    if (!amount) return amount.error();
    auto quality = read_uint(j, "quality", kind::ITEM, def.default_quality);
    if (!quality) return quality.error();

    if (j.contains("state")) {
        if (!j["state"].is_string()) {
            return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind::ITEM, "'state' must be a base64 string"));
        }
        auto decoded = convoy_core::base64_decode(j["state"].get<std::string>());
        if (!decoded) {
            return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind::ITEM, "'state' is not valid base64"));
        }
        def.default_state = std::move(*decoded);
    }

    return convoy_core::Ok(std::move(def));
}

template<typename Def>
convoy_core::Result<Def> parse_placeable(const nlohmann::json& j, const char* kind_name) {
    Def def;
    auto header = read_header(j, kind_name, def.id, def.guid, def.name);
    if (!header) return header.error();

    auto health = read_uint(j, "max_health", kind_name, def.max_health);
    if (!health) return health.error();

    return convoy_core::Ok(std::move(def));
}

/// Parse every entry of an optional array and hand it to the registrar
template<typename Parse, typename Register>
convoy_core::Result<void> load_array(const nlohmann::json& document, const char* field, const char* kind_name,
    Parse&& parse, Register&& reg)
{
    if (!document.contains(field)) {
        return convoy_core::Ok();
    }
    if (!document[field].is_array()) {
        return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind_name, std::string("'") + field + "' must be an array"));
    }

    std::size_t index = 0;
    for (const auto& entry : document[field]) {
        auto parsed = parse(entry);
        if (!parsed) {
            parsed.error().with_context("index", std::to_string(index));
            return parsed.error();
        }
        auto registered = reg(std::move(parsed).value());
        if (!registered) {
            registered.error().with_context("index", std::to_string(index));
            return registered;
        }
        ++index;
    }
    return convoy_core::Ok();
}

} // anonymous namespace

// =============================================================================
// DefinitionCatalog
// =============================================================================

template<typename Def>
convoy_core::Result<void> DefinitionCatalog::Table<Def>::insert(Def def, const char* kind_name) {
    if (def.id == 0) {
        return convoy_core::Error(convoy_core::CatalogError::invalid_definition(kind_name, "legacy id 0 is reserved"));
    }

    bool guid_taken = !def.guid.is_empty() && by_guid.count(def.guid) > 0;
    if (guid_taken || by_id.count(def.id) > 0) {
        convoy_core::Error error = convoy_core::CatalogError::already_registered(kind_name, def.guid.to_string(), def.id);
        convoy_core::debug::record_error(error);
        return error;
    }

    auto owned = std::make_unique<Def>(std::move(def));
    const Def* ptr = owned.get();
    if (!ptr->guid.is_empty()) {
        by_guid.emplace(ptr->guid, ptr);
    }
    by_id.emplace(ptr->id, ptr);
    entries.push_back(std::move(owned));
    return convoy_core::Ok();
}

convoy_core::Result<void> DefinitionCatalog::register_vehicle(VehicleDef def) {
    return m_vehicles.insert(std::move(def), kind::VEHICLE);
}

convoy_core::Result<void> DefinitionCatalog::register_item(ItemDef def) {
    return m_items.insert(std::move(def), kind::ITEM);
}

convoy_core::Result<void> DefinitionCatalog::register_barricade(BarricadeDef def) {
    return m_barricades.insert(std::move(def), kind::BARRICADE);
}

convoy_core::Result<void> DefinitionCatalog::register_structure(StructureDef def) {
    return m_structures.insert(std::move(def), kind::STRUCTURE);
}

convoy_core::Result<void> DefinitionCatalog::load_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        return convoy_core::Error(convoy_core::ErrorCode::ParseError, "Catalog root must be a JSON object");
    }

    const std::size_t vehicles = m_vehicles.entries.size();
    const std::size_t items = m_items.entries.size();
    const std::size_t barricades = m_barricades.entries.size();
    const std::size_t structures = m_structures.entries.size();

    auto result = load_sections(document);
    if (!result) {
        m_vehicles.truncate(vehicles);
        m_items.truncate(items);
        m_barricades.truncate(barricades);
        m_structures.truncate(structures);
        convoy_core::catalog_logger()->warn("Catalog document rejected; definitions from it were discarded");
        return result;
    }

    convoy_core::catalog_logger()->info("Catalog loaded: {} vehicles, {} items, {} barricades, {} structures",
        vehicle_count(), item_count(), barricade_count(), structure_count());
    return convoy_core::Ok();
}

convoy_core::Result<void> DefinitionCatalog::load_sections(const nlohmann::json& document) {
    // Items first so vehicle mounts can be checked against them
    auto items = load_array(document, "items", kind::ITEM, parse_item,
        [this](ItemDef def) { return register_item(std::move(def)); });
    if (!items) return items;

    auto barricades = load_array(document, "barricades", kind::BARRICADE,
        [](const nlohmann::json& j) { return parse_placeable<BarricadeDef>(j, kind::BARRICADE); },
        [this](BarricadeDef def) { return register_barricade(std::move(def)); });
    if (!barricades) return barricades;

    auto structures = load_array(document, "structures", kind::STRUCTURE,
        [](const nlohmann::json& j) { return parse_placeable<StructureDef>(j, kind::STRUCTURE); },
        [this](StructureDef def) { return register_structure(std::move(def)); });
    if (!structures) return structures;

    auto vehicles = load_array(document, "vehicles", kind::VEHICLE, parse_vehicle,
        [this](VehicleDef def) {
            for (const auto& mount : def.turrets) {
                if (mount.item_id != 0 && !find_item(mount.item_id)) {
                    convoy_core::catalog_logger()->warn("Vehicle {} ({}) mounts unknown item {}",
                        def.id, def.name, mount.item_id);
                }
            }
            return register_vehicle(std::move(def));
        });
    return vehicles;
}

convoy_core::Result<void> DefinitionCatalog::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return convoy_core::Error(convoy_core::ErrorCode::IOError, "Failed to open catalog: " + path.string());
    }

    nlohmann::json document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        return convoy_core::Error(convoy_core::ErrorCode::ParseError, "Malformed JSON in " + path.string());
    }

    auto result = load_json(document);
    if (!result) {
        result.error().with_context("path", path.string());
        convoy_core::catalog_logger()->error("{}", convoy_core::build_error_chain(result.error()));
    }
    return result;
}

const VehicleDef* DefinitionCatalog::find_vehicle(const convoy_core::Guid& guid, std::uint16_t id) const {
    return m_vehicles.find(guid, id);
}

const ItemDef* DefinitionCatalog::find_item(std::uint16_t id) const {
    return m_items.find(convoy_core::Guid{}, id);
}

const BarricadeDef* DefinitionCatalog::find_barricade(const convoy_core::Guid& guid, std::uint16_t id) const {
    return m_barricades.find(guid, id);
}

const StructureDef* DefinitionCatalog::find_structure(const convoy_core::Guid& guid, std::uint16_t id) const {
    return m_structures.find(guid, id);
}

convoy_core::Blob DefinitionCatalog::default_state(const ItemDef& item) const {
    return item.default_state;
}

} // namespace convoy_catalog
