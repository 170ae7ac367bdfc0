#pragma once

/// @file catalog.hpp
/// @brief Read-only definition lookup and a JSON-loadable catalog
///
/// ICatalog is the narrow interface the snapshot layer depends on. It is
/// injected by reference, never reached through a global.
///
/// Every lookup tries the GUID first and falls back to the legacy id, so
/// snapshots written before GUIDs existed still resolve.

#include "types.hpp"
#include <convoy/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <memory>
#include <unordered_map>
#include <vector>

namespace convoy_catalog {

// =============================================================================
// ICatalog
// =============================================================================

/// Definition lookup by GUID (authoritative) or legacy id
class ICatalog {
public:
    virtual ~ICatalog() = default;

    [[nodiscard]] virtual const VehicleDef* find_vehicle(const convoy_core::Guid& guid, std::uint16_t id) const = 0;
    [[nodiscard]] virtual const ItemDef* find_item(std::uint16_t id) const = 0;
    [[nodiscard]] virtual const BarricadeDef* find_barricade(const convoy_core::Guid& guid, std::uint16_t id) const = 0;
    [[nodiscard]] virtual const StructureDef* find_structure(const convoy_core::Guid& guid, std::uint16_t id) const = 0;

    /// State payload a freshly created item of this kind carries
    [[nodiscard]] virtual convoy_core::Blob default_state(const ItemDef& item) const = 0;

    /// find_vehicle, reporting a miss as CatalogError::definition_not_found
    [[nodiscard]] convoy_core::Result<const VehicleDef*> resolve_vehicle(
        const convoy_core::Guid& guid, std::uint16_t id) const;
};

// =============================================================================
// DefinitionCatalog
// =============================================================================

/// In-memory catalog populated from code or JSON
///
/// JSON layout:
/// @code
/// {
///   "vehicles":   [{"id": 1, "guid": "...", "name": "...", "tires": 4,
///                   "turrets": [120, 121], "trunk": {"width": 6, "height": 4},
///                   "max_fuel": 500, "max_health": 1000, "max_battery": 1000}],
///   "items":      [{"id": 120, "guid": "...", "amount": 1, "quality": 100, "state": "<base64>"}],
///   "barricades": [{"id": 7, "guid": "...", "max_health": 250}],
///   "structures": [{"id": 31, "guid": "...", "max_health": 500}]
/// }
/// @endcode
class DefinitionCatalog : public ICatalog {
public:
    DefinitionCatalog() = default;

    // Non-copyable (definitions are handed out by pointer)
    DefinitionCatalog(const DefinitionCatalog&) = delete;
    DefinitionCatalog& operator=(const DefinitionCatalog&) = delete;
    DefinitionCatalog(DefinitionCatalog&&) = default;
    DefinitionCatalog& operator=(DefinitionCatalog&&) = default;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register a definition; fails on id 0 or on a GUID/id already taken
    [[nodiscard]] convoy_core::Result<void> register_vehicle(VehicleDef def);
    [[nodiscard]] convoy_core::Result<void> register_item(ItemDef def);
    [[nodiscard]] convoy_core::Result<void> register_barricade(BarricadeDef def);
    [[nodiscard]] convoy_core::Result<void> register_structure(StructureDef def);

    /// Load every definition array in the document; on failure the catalog
    /// is left exactly as it was before the call
    [[nodiscard]] convoy_core::Result<void> load_json(const nlohmann::json& document);

    /// Read and load a catalog file
    [[nodiscard]] convoy_core::Result<void> load_file(const std::filesystem::path& path);

    // =========================================================================
    // ICatalog
    // =========================================================================

    [[nodiscard]] const VehicleDef* find_vehicle(const convoy_core::Guid& guid, std::uint16_t id) const override;
    [[nodiscard]] const ItemDef* find_item(std::uint16_t id) const override;
    [[nodiscard]] const BarricadeDef* find_barricade(const convoy_core::Guid& guid, std::uint16_t id) const override;
    [[nodiscard]] const StructureDef* find_structure(const convoy_core::Guid& guid, std::uint16_t id) const override;
    [[nodiscard]] convoy_core::Blob default_state(const ItemDef& item) const override;

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] std::size_t vehicle_count() const { return m_vehicles.entries.size(); }
    [[nodiscard]] std::size_t item_count() const { return m_items.entries.size(); }
    [[nodiscard]] std::size_t barricade_count() const { return m_barricades.entries.size(); }
    [[nodiscard]] std::size_t structure_count() const { return m_structures.entries.size(); }

private:
    /// Owning storage plus GUID and legacy id indices
    template<typename Def>
    struct Table {
        std::vector<std::unique_ptr<Def>> entries;
        std::unordered_map<convoy_core::Guid, const Def*> by_guid;
        std::unordered_map<std::uint16_t, const Def*> by_id;

        [[nodiscard]] const Def* find(const convoy_core::Guid& guid, std::uint16_t id) const {
            if (!guid.is_empty()) {
                auto it = by_guid.find(guid);
                if (it != by_guid.end()) return it->second;
            }
            auto it = by_id.find(id);
            return it != by_id.end() ? it->second : nullptr;
        }

        [[nodiscard]] convoy_core::Result<void> insert(Def def, const char* kind_name);

        /// Drop every entry registered after the first `count`
        void truncate(std::size_t count) {
            while (entries.size() > count) {
                const Def* last = entries.back().get();
                if (!last->guid.is_empty()) {
                    by_guid.erase(last->guid);
                }
                by_id.erase(last->id);
                entries.pop_back();
            }
        }
    };

    /// Body of load_json without rollback
    [[nodiscard]] convoy_core::Result<void> load_sections(const nlohmann::json& document);

    Table<VehicleDef> m_vehicles;
    Table<ItemDef> m_items;
    Table<BarricadeDef> m_barricades;
    Table<StructureDef> m_structures;
};

} // namespace convoy_catalog
