#pragma once

/// @file cargo.hpp
/// @brief Trunk contents snapshot

#include "fwd.hpp"
#include <convoy/core/blob.hpp>
#include <convoy/world/fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace convoy_snapshot {

/// One item's payload
struct ItemSnapshot {
    std::uint16_t id = 0;
    std::uint8_t amount = 0;
    std::uint8_t quality = 0;
    convoy_core::Blob state;

    bool operator==(const ItemSnapshot&) const = default;
};

/// An item at its grid position
struct ItemJarSnapshot {
    std::uint8_t x = 0;
    std::uint8_t y = 0;
    std::uint8_t rotation = 0;
    ItemSnapshot item;

    bool operator==(const ItemJarSnapshot&) const = default;
};

/// Trunk page size and ordered contents; always present, possibly empty
struct CargoSnapshot {
    std::uint8_t width = 0;
    std::uint8_t height = 0;
    std::vector<ItemJarSnapshot> items;

    [[nodiscard]] bool empty() const noexcept { return items.empty(); }

    /// Capture a trunk; a missing or empty trunk yields an empty snapshot
    [[nodiscard]] static CargoSnapshot capture(const convoy_world::IItemContainer* trunk);

    struct InsertCounts {
        std::size_t inserted = 0;
        std::size_t rejected = 0;
    };

    /// Insert every jar in stored order at its recorded position; no merging
    InsertCounts restore_into(convoy_world::IItemContainer& trunk) const;

    bool operator==(const CargoSnapshot&) const = default;
};

} // namespace convoy_snapshot
