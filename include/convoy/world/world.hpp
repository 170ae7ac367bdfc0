#pragma once

/// @file world.hpp
/// @brief Narrow interfaces onto the live world
///
/// The world owns object instances, spatial frames, regions and resource
/// clamping. Everything here is called from the world-owning thread.

#include "types.hpp"
#include <convoy/core/error.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace convoy_world {

// =============================================================================
// IItemContainer
// =============================================================================

/// Grid item storage (a vehicle trunk)
class IItemContainer {
public:
    virtual ~IItemContainer() = default;

    [[nodiscard]] virtual std::uint8_t width() const = 0;
    [[nodiscard]] virtual std::uint8_t height() const = 0;

    /// Items in insertion order
    [[nodiscard]] virtual const std::vector<ItemJar>& items() const = 0;

    /// Place an item at a grid position; false if the slot is rejected
    [[nodiscard]] virtual bool try_add(const Item& item, std::uint8_t x, std::uint8_t y, std::uint8_t rotation) = 0;

    [[nodiscard]] std::size_t item_count() const { return items().size(); }
    [[nodiscard]] bool empty() const { return items().empty(); }
};

// =============================================================================
// IVehicle
// =============================================================================

/// Live vehicle instance
class IVehicle {
public:
    virtual ~IVehicle() = default;

    // Identity
    [[nodiscard]] virtual std::uint32_t instance_id() const = 0;
    [[nodiscard]] virtual std::uint16_t definition_id() const = 0;
    [[nodiscard]] virtual convoy_core::Guid definition_guid() const = 0;

    // Cosmetics and placement
    [[nodiscard]] virtual std::uint16_t skin_variant() const = 0;
    [[nodiscard]] virtual std::uint16_t mythic_variant() const = 0;
    [[nodiscard]] virtual float placement_offset() const = 0;
    [[nodiscard]] virtual convoy_math::Frame frame() const = 0;

    /// Current paint; nullopt when the vehicle has no paint applied
    [[nodiscard]] virtual std::optional<convoy_math::Color32> paint_color() const = 0;

    // Resources
    [[nodiscard]] virtual std::uint16_t integrity() const = 0;
    [[nodiscard]] virtual std::uint16_t fuel_level() const = 0;
    [[nodiscard]] virtual std::uint16_t auxiliary_charge() const = 0;

    // Ownership
    [[nodiscard]] virtual std::uint64_t owner() const = 0;
    [[nodiscard]] virtual std::uint64_t group() const = 0;
    [[nodiscard]] virtual bool is_locked() const = 0;

    // Tires
    [[nodiscard]] virtual std::size_t tire_count() const = 0;
    [[nodiscard]] virtual bool is_tire_alive(std::size_t index) const = 0;
    virtual void set_tire_alive(std::size_t index, bool alive) = 0;

    /// Publish the tire alive mask once after a batch of set_tire_alive
    virtual void send_tire_alive_mask_update() = 0;

    // Turrets
    [[nodiscard]] virtual std::size_t turret_count() const = 0;

    /// Mount state; nullopt when the mount has no live backing
    [[nodiscard]] virtual std::optional<convoy_core::Blob> turret_state(std::size_t index) const = 0;

    /// Replace a mount's state; false when the mount has no live backing
    virtual bool set_turret_state(std::size_t index, convoy_core::Blob state) = 0;

    // Cargo
    /// Trunk storage, or nullptr for vehicles without one
    [[nodiscard]] virtual IItemContainer* trunk() = 0;
    [[nodiscard]] virtual const IItemContainer* trunk() const = 0;
};

// =============================================================================
// IWorld
// =============================================================================

/// Live world: creation, lookup and destruction of vehicles and children
class IWorld {
public:
    virtual ~IWorld() = default;

    /// Create a vehicle; resource values are clamped to the definition
    [[nodiscard]] virtual convoy_core::Result<IVehicle*> spawn_vehicle(const VehicleSpawnParams& params) = 0;

    /// Destroy a vehicle together with its attached region and children
    [[nodiscard]] virtual convoy_core::Result<void> destroy_vehicle(std::uint32_t instance_id) = 0;

    /// Region holding the vehicle's children; nullopt if nothing was ever planted
    [[nodiscard]] virtual std::optional<RegionHandle> find_attached_region(const IVehicle& vehicle) const = 0;

    /// Barricades in region order, destroyed ones included
    [[nodiscard]] virtual std::vector<BarricadeDrop> barricades_in(const RegionHandle& region) const = 0;

    /// Structures in region order, destroyed ones included
    [[nodiscard]] virtual std::vector<StructureDrop> structures_in(const RegionHandle& region) const = 0;

    /// Plant a barricade on the anchor vehicle; returns the new instance id
    [[nodiscard]] virtual convoy_core::Result<std::uint32_t> place_barricade(
        const convoy_catalog::BarricadeDef& def, const BarricadePlacement& placement, const IVehicle& anchor) = 0;

    /// Plant a structure on the anchor vehicle; returns the new instance id
    [[nodiscard]] virtual convoy_core::Result<std::uint32_t> place_structure(
        const convoy_catalog::StructureDef& def, const StructurePlacement& placement, const IVehicle& anchor) = 0;
};

} // namespace convoy_world
