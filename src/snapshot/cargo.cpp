/// @file cargo.cpp
/// @brief Trunk contents capture and reinsertion

#include <convoy/snapshot/cargo.hpp>
#include <convoy/world/world.hpp>
#include <convoy/core/log.hpp>

namespace convoy_snapshot {

CargoSnapshot CargoSnapshot::capture(const convoy_world::IItemContainer* trunk) {
    CargoSnapshot cargo;
    if (!trunk || trunk->empty()) {
        return cargo;
    }

    cargo.width = trunk->width();
    cargo.height = trunk->height();
    cargo.items.reserve(trunk->item_count());
    for (const auto& jar : trunk->items()) {
        cargo.items.push_back(ItemJarSnapshot{
            jar.x, jar.y, jar.rotation,
            ItemSnapshot{jar.item.id, jar.item.amount, jar.item.quality, jar.item.state}});
    }
    return cargo;
}

CargoSnapshot::InsertCounts CargoSnapshot::restore_into(convoy_world::IItemContainer& trunk) const {
    InsertCounts counts;
    for (const auto& jar : items) {
        convoy_world::Item item{jar.item.id, jar.item.amount, jar.item.quality, jar.item.state};
        if (trunk.try_add(item, jar.x, jar.y, jar.rotation)) {
            ++counts.inserted;
        } else {
            ++counts.rejected;
            convoy_core::snapshot_logger()->warn("Trunk rejected item {} x{} at ({}, {}) rot {}",
                jar.item.id, jar.item.amount, jar.x, jar.y, jar.rotation);
        }
    }
    return counts;
}

} // namespace convoy_snapshot
