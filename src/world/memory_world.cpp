/// @file memory_world.cpp
/// @brief In-memory world implementation

#include <convoy/world/memory_world.hpp>
#include <convoy/core/log.hpp>

#include <algorithm>

namespace convoy_world {

// =============================================================================
// MemoryItemContainer
// =============================================================================

bool MemoryItemContainer::try_add(const Item& item, std::uint8_t x, std::uint8_t y, std::uint8_t rotation) {
    if (x >= m_width || y >= m_height || rotation > 3) {
        return false;
    }

    bool occupied = std::any_of(m_items.begin(), m_items.end(),
        [x, y](const ItemJar& jar) { return jar.x == x && jar.y == y; });
    if (occupied) {
        return false;
    }

    m_items.push_back(ItemJar{x, y, rotation, item});
    return true;
}

// =============================================================================
// MemoryVehicle
// =============================================================================

MemoryVehicle::MemoryVehicle(std::uint32_t instance_id, const convoy_catalog::VehicleDef& def)
    : m_instance_id(instance_id)
    , m_def(&def)
    , m_tires(def.tire_count, true)
    , m_turrets(def.turrets.size())
{
    if (def.has_trunk()) {
        m_trunk = std::make_unique<MemoryItemContainer>(def.trunk_width, def.trunk_height);
    }
}

std::uint16_t MemoryVehicle::definition_id() const {
    return m_def->id;
}

convoy_core::Guid MemoryVehicle::definition_guid() const {
    return m_def->guid;
}

bool MemoryVehicle::is_tire_alive(std::size_t index) const {
    return index < m_tires.size() && m_tires[index];
}

void MemoryVehicle::set_tire_alive(std::size_t index, bool alive) {
    if (index < m_tires.size()) {
        m_tires[index] = alive;
    }
}

std::optional<convoy_core::Blob> MemoryVehicle::turret_state(std::size_t index) const {
    if (index >= m_turrets.size()) {
        return std::nullopt;
    }
    return m_turrets[index];
}

bool MemoryVehicle::set_turret_state(std::size_t index, convoy_core::Blob state) {
    if (index >= m_turrets.size() || !m_turrets[index]) {
        return false;
    }
    m_turrets[index] = std::move(state);
    return true;
}

void MemoryVehicle::set_resources(std::uint16_t fuel, std::uint16_t integrity, std::uint16_t charge) {
    m_fuel = std::min(fuel, m_def->max_fuel);
    m_integrity = std::min(integrity, m_def->max_health);
    m_charge = std::min(charge, m_def->max_battery);
}

void MemoryVehicle::set_ownership(std::uint64_t owner, std::uint64_t group, bool locked) {
    m_owner = owner;
    m_group = group;
    m_locked = locked;
}

void MemoryVehicle::clear_turret_backing(std::size_t index) {
    if (index < m_turrets.size()) {
        m_turrets[index].reset();
    }
}

// =============================================================================
// MemoryWorld
// =============================================================================

MemoryWorld::MemoryWorld(const convoy_catalog::ICatalog& catalog)
    : m_catalog(catalog) {}

convoy_core::Result<IVehicle*> MemoryWorld::spawn_vehicle(const VehicleSpawnParams& params) {
    if (m_fail_next_spawn) {
        m_fail_next_spawn = false;
        convoy_core::Error error = convoy_core::WorldError::spawn_failed("injected fault");
        convoy_core::debug::record_error(error);
        return error;
    }

    if (!params.definition) {
        return convoy_core::Error(convoy_core::WorldError::spawn_failed("no vehicle definition"));
    }
    const auto& def = *params.definition;

    std::uint32_t instance_id = m_next_instance_id++;
    auto vehicle = std::make_unique<MemoryVehicle>(instance_id, def);

    vehicle->set_cosmetics(params.skin_variant, params.mythic_variant);
    vehicle->set_placement_offset(params.placement_offset);
    vehicle->set_frame(params.frame);
    vehicle->set_paint(params.paint);
    vehicle->set_resources(params.fuel, params.integrity, params.auxiliary_charge);
    vehicle->set_ownership(params.owner, params.group, params.locked);

    // Every mount starts with its item's default state; unknown items leave the mount unbacked
    for (std::size_t i = 0; i < def.turrets.size(); ++i) {
        const auto* item = m_catalog.find_item(def.turrets[i].item_id);
        if (item) {
            vehicle->m_turrets[i] = m_spawn_turret_seed ? *m_spawn_turret_seed : m_catalog.default_state(*item);
        } else {
            convoy_core::world_logger()->warn("Vehicle {} mount {} uses unknown item {}; mount left unbacked",
                def.id, i, def.turrets[i].item_id);
        }
    }

    m_spawn_turret_seed.reset();

    MemoryVehicle* ptr = vehicle.get();
    m_vehicles.emplace(instance_id, std::move(vehicle));

    convoy_core::world_logger()->debug("Spawned vehicle {} (definition {}) as instance {}",
        def.name, def.id, instance_id);
    return convoy_core::Ok<IVehicle*>(ptr);
}

convoy_core::Result<void> MemoryWorld::destroy_vehicle(std::uint32_t instance_id) {
    auto it = m_vehicles.find(instance_id);
    if (it == m_vehicles.end()) {
        return convoy_core::Error(convoy_core::WorldError::not_found(instance_id));
    }

    std::size_t children = 0;
    auto region = m_regions.find(instance_id);
    if (region != m_regions.end()) {
        children = region->second.barricades.size() + region->second.structures.size();
        m_regions.erase(region);
    }
    m_vehicles.erase(it);

    convoy_core::world_logger()->debug("Destroyed vehicle instance {} with {} children", instance_id, children);
    return convoy_core::Ok();
}

std::optional<RegionHandle> MemoryWorld::find_attached_region(const IVehicle& vehicle) const {
    if (m_regions.count(vehicle.instance_id()) == 0) {
        return std::nullopt;
    }
    return RegionHandle{vehicle.instance_id()};
}

std::vector<BarricadeDrop> MemoryWorld::barricades_in(const RegionHandle& region) const {
    auto it = m_regions.find(region.vehicle_instance_id);
    if (it == m_regions.end()) {
        return {};
    }
    return it->second.barricades;
}

std::vector<StructureDrop> MemoryWorld::structures_in(const RegionHandle& region) const {
    auto it = m_regions.find(region.vehicle_instance_id);
    if (it == m_regions.end()) {
        return {};
    }
    return it->second.structures;
}

convoy_core::Result<MemoryWorld::Region*> MemoryWorld::region_for(const IVehicle& anchor) {
    if (m_vehicles.count(anchor.instance_id()) == 0) {
        return convoy_core::Error(convoy_core::WorldError::not_found(anchor.instance_id()));
    }
    return convoy_core::Ok(&m_regions[anchor.instance_id()]);
}

bool MemoryWorld::take_placement_fault() {
    if (!m_fail_placement_in) {
        return false;
    }
    if (*m_fail_placement_in == 0) {
        m_fail_placement_in.reset();
        return true;
    }
    --*m_fail_placement_in;
    return false;
}

convoy_core::Result<std::uint32_t> MemoryWorld::place_barricade(
    const convoy_catalog::BarricadeDef& def, const BarricadePlacement& placement, const IVehicle& anchor)
{
    if (take_placement_fault()) {
        return convoy_core::Error(convoy_core::WorldError::placement_failed("injected fault for barricade " + std::to_string(def.id)));
    }

    auto region = region_for(anchor);
    if (!region) {
        return region.error();
    }

    BarricadeDrop drop;
    drop.instance_id = m_next_instance_id++;
    drop.id = def.id;
    drop.guid = def.guid;
    drop.health = def.max_health > 0 ? std::min(placement.health, def.max_health) : placement.health;
    drop.owner = placement.owner;
    drop.group = placement.group;
    drop.state = placement.state;
    drop.local = placement.local;
    (*region)->barricades.push_back(drop);

    convoy_core::world_logger()->trace("Planted barricade {} as instance {} on vehicle {}",
        def.id, drop.instance_id, anchor.instance_id());
    return convoy_core::Ok(drop.instance_id);
}

convoy_core::Result<std::uint32_t> MemoryWorld::place_structure(
    const convoy_catalog::StructureDef& def, const StructurePlacement& placement, const IVehicle& anchor)
{
    if (take_placement_fault()) {
        return convoy_core::Error(convoy_core::WorldError::placement_failed("injected fault for structure " + std::to_string(def.id)));
    }

    auto region = region_for(anchor);
    if (!region) {
        return region.error();
    }

    StructureDrop drop;
    drop.instance_id = m_next_instance_id++;
    drop.id = def.id;
    drop.guid = def.guid;
    drop.health = def.max_health > 0 ? std::min(placement.health, def.max_health) : placement.health;
    drop.owner = placement.owner;
    drop.group = placement.group;
    drop.local = placement.local;
    (*region)->structures.push_back(drop);

    convoy_core::world_logger()->trace("Planted structure {} as instance {} on vehicle {}",
        def.id, drop.instance_id, anchor.instance_id());
    return convoy_core::Ok(drop.instance_id);
}

MemoryVehicle* MemoryWorld::find_vehicle(std::uint32_t instance_id) {
    auto it = m_vehicles.find(instance_id);
    return it != m_vehicles.end() ? it->second.get() : nullptr;
}

const MemoryVehicle* MemoryWorld::find_vehicle(std::uint32_t instance_id) const {
    auto it = m_vehicles.find(instance_id);
    return it != m_vehicles.end() ? it->second.get() : nullptr;
}

bool MemoryWorld::mark_destroyed(std::uint32_t child_instance_id) {
    for (auto& [_, region] : m_regions) {
        for (auto& drop : region.barricades) {
            if (drop.instance_id == child_instance_id) {
                drop.destroyed = true;
                return true;
            }
        }
        for (auto& drop : region.structures) {
            if (drop.instance_id == child_instance_id) {
                drop.destroyed = true;
                return true;
            }
        }
    }
    return false;
}

} // namespace convoy_world
