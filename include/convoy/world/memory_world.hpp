#pragma once

/// @file memory_world.hpp
/// @brief Deterministic in-memory world
///
/// MemoryWorld implements IWorld without any engine behind it. It applies
/// the same clamping and region rules a live server does, which makes it
/// suitable for tests and for offline inspection of snapshots. It also
/// exposes fault injection so failure paths can be exercised.
///
/// Not thread-safe.

#include "world.hpp"
#include <convoy/catalog/catalog.hpp>

#include <map>
#include <memory>
#include <vector>

namespace convoy_world {

// =============================================================================
// MemoryItemContainer
// =============================================================================

/// Grid container; one item per cell, anchored at its top-left cell
class MemoryItemContainer : public IItemContainer {
public:
    MemoryItemContainer(std::uint8_t width, std::uint8_t height)
        : m_width(width), m_height(height) {}

    [[nodiscard]] std::uint8_t width() const override { return m_width; }
    [[nodiscard]] std::uint8_t height() const override { return m_height; }
    [[nodiscard]] const std::vector<ItemJar>& items() const override { return m_items; }

    /// Rejects out-of-page positions, rotations above 3 and occupied cells
    [[nodiscard]] bool try_add(const Item& item, std::uint8_t x, std::uint8_t y, std::uint8_t rotation) override;

    void clear() { m_items.clear(); }

private:
    std::uint8_t m_width;
    std::uint8_t m_height;
    std::vector<ItemJar> m_items;
};

// =============================================================================
// MemoryVehicle
// =============================================================================

/// Live vehicle held by MemoryWorld
class MemoryVehicle : public IVehicle {
public:
    MemoryVehicle(std::uint32_t instance_id, const convoy_catalog::VehicleDef& def);

    // IVehicle
    [[nodiscard]] std::uint32_t instance_id() const override { return m_instance_id; }
    [[nodiscard]] std::uint16_t definition_id() const override;
    [[nodiscard]] convoy_core::Guid definition_guid() const override;

    [[nodiscard]] std::uint16_t skin_variant() const override { return m_skin; }
    [[nodiscard]] std::uint16_t mythic_variant() const override { return m_mythic; }
    [[nodiscard]] float placement_offset() const override { return m_placement_offset; }
    [[nodiscard]] convoy_math::Frame frame() const override { return m_frame; }
    [[nodiscard]] std::optional<convoy_math::Color32> paint_color() const override { return m_paint; }

    [[nodiscard]] std::uint16_t integrity() const override { return m_integrity; }
    [[nodiscard]] std::uint16_t fuel_level() const override { return m_fuel; }
    [[nodiscard]] std::uint16_t auxiliary_charge() const override { return m_charge; }

    [[nodiscard]] std::uint64_t owner() const override { return m_owner; }
    [[nodiscard]] std::uint64_t group() const override { return m_group; }
    [[nodiscard]] bool is_locked() const override { return m_locked; }

    [[nodiscard]] std::size_t tire_count() const override { return m_tires.size(); }
    [[nodiscard]] bool is_tire_alive(std::size_t index) const override;
    void set_tire_alive(std::size_t index, bool alive) override;
    void send_tire_alive_mask_update() override { ++m_tire_mask_updates; }

    [[nodiscard]] std::size_t turret_count() const override { return m_turrets.size(); }
    [[nodiscard]] std::optional<convoy_core::Blob> turret_state(std::size_t index) const override;
    bool set_turret_state(std::size_t index, convoy_core::Blob state) override;

    [[nodiscard]] IItemContainer* trunk() override { return m_trunk.get(); }
    [[nodiscard]] const IItemContainer* trunk() const override { return m_trunk.get(); }

    // Direct mutation (world setup and tests)
    void set_frame(const convoy_math::Frame& frame) { m_frame = frame; }
    void set_paint(std::optional<convoy_math::Color32> paint) { m_paint = paint; }
    void set_cosmetics(std::uint16_t skin, std::uint16_t mythic) { m_skin = skin; m_mythic = mythic; }
    void set_placement_offset(float offset) { m_placement_offset = offset; }
    void set_resources(std::uint16_t fuel, std::uint16_t integrity, std::uint16_t charge);
    void set_ownership(std::uint64_t owner, std::uint64_t group, bool locked);

    /// Drop the live backing of a mount (turret_state reports nullopt)
    void clear_turret_backing(std::size_t index);

    [[nodiscard]] const convoy_catalog::VehicleDef& definition() const { return *m_def; }
    [[nodiscard]] MemoryItemContainer* memory_trunk() { return m_trunk.get(); }

    /// Number of send_tire_alive_mask_update calls
    [[nodiscard]] std::size_t tire_mask_updates() const { return m_tire_mask_updates; }

private:
    friend class MemoryWorld;

    std::uint32_t m_instance_id;
    const convoy_catalog::VehicleDef* m_def;

    std::uint16_t m_skin = 0;
    std::uint16_t m_mythic = 0;
    float m_placement_offset = 0.0f;
    convoy_math::Frame m_frame;
    std::optional<convoy_math::Color32> m_paint;

    std::uint16_t m_integrity = 0;
    std::uint16_t m_fuel = 0;
    std::uint16_t m_charge = 0;

    std::uint64_t m_owner = 0;
    std::uint64_t m_group = 0;
    bool m_locked = false;

    std::vector<bool> m_tires;
    std::vector<std::optional<convoy_core::Blob>> m_turrets;
    std::unique_ptr<MemoryItemContainer> m_trunk;
    std::size_t m_tire_mask_updates = 0;
};

// =============================================================================
// MemoryWorld
// =============================================================================

/// IWorld backed by plain containers
class MemoryWorld : public IWorld {
public:
    /// The catalog supplies turret default states for new vehicles
    explicit MemoryWorld(const convoy_catalog::ICatalog& catalog);

    // Non-copyable (hands out vehicle pointers)
    MemoryWorld(const MemoryWorld&) = delete;
    MemoryWorld& operator=(const MemoryWorld&) = delete;

    // =========================================================================
    // IWorld
    // =========================================================================

    [[nodiscard]] convoy_core::Result<IVehicle*> spawn_vehicle(const VehicleSpawnParams& params) override;
    [[nodiscard]] convoy_core::Result<void> destroy_vehicle(std::uint32_t instance_id) override;
    [[nodiscard]] std::optional<RegionHandle> find_attached_region(const IVehicle& vehicle) const override;
    [[nodiscard]] std::vector<BarricadeDrop> barricades_in(const RegionHandle& region) const override;
    [[nodiscard]] std::vector<StructureDrop> structures_in(const RegionHandle& region) const override;
    [[nodiscard]] convoy_core::Result<std::uint32_t> place_barricade(
        const convoy_catalog::BarricadeDef& def, const BarricadePlacement& placement, const IVehicle& anchor) override;
    [[nodiscard]] convoy_core::Result<std::uint32_t> place_structure(
        const convoy_catalog::StructureDef& def, const StructurePlacement& placement, const IVehicle& anchor) override;

    // =========================================================================
    // Inspection
    // =========================================================================

    [[nodiscard]] MemoryVehicle* find_vehicle(std::uint32_t instance_id);
    [[nodiscard]] const MemoryVehicle* find_vehicle(std::uint32_t instance_id) const;

    [[nodiscard]] std::size_t vehicle_count() const { return m_vehicles.size(); }
    [[nodiscard]] std::size_t region_count() const { return m_regions.size(); }

    /// Mark a planted child destroyed; it stays in region order until removed
    bool mark_destroyed(std::uint32_t child_instance_id);

    // =========================================================================
    // Fault Injection
    // =========================================================================

    /// Make the next spawn_vehicle call fail
    void fail_next_spawn(bool fail = true) { m_fail_next_spawn = fail; }

    /// Make the n-th next placement (barricade or structure) fail, 0 = the next one
    void fail_next_placement(std::size_t skip = 0) { m_fail_placement_in = skip; }

    /// Seed every backed mount of the next spawned vehicle with this state
    /// instead of the item default
    void seed_next_spawn_turrets(convoy_core::Blob state) { m_spawn_turret_seed = std::move(state); }

private:
    struct Region {
        std::vector<BarricadeDrop> barricades;
        std::vector<StructureDrop> structures;
    };

    /// Region for a live anchor, created on first use
    convoy_core::Result<Region*> region_for(const IVehicle& anchor);

    /// Consume a pending placement fault
    bool take_placement_fault();

private:
    const convoy_catalog::ICatalog& m_catalog;
    std::map<std::uint32_t, std::unique_ptr<MemoryVehicle>> m_vehicles;
    std::map<std::uint32_t, Region> m_regions;
    std::uint32_t m_next_instance_id = 1;
    bool m_fail_next_spawn = false;
    std::optional<std::size_t> m_fail_placement_in;
    std::optional<convoy_core::Blob> m_spawn_turret_seed;
};

} // namespace convoy_world
