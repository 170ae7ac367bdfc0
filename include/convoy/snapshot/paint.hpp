#pragma once

/// @file paint.hpp
/// @brief Paint sentinel handling
///
/// On the wire paint is always 4 bytes. {0,0,0,0} means "no paint", it
/// never means "paint black"; opaque black is {0,0,0,255}.

#include <convoy/math/color.hpp>

#include <array>
#include <cstdint>
#include <optional>

namespace convoy_snapshot {

using PaintBytes = std::array<std::uint8_t, 4>;

/// Wire value for "no paint"
inline constexpr PaintBytes NO_PAINT = {0, 0, 0, 0};

/// Normalize a live paint value: absent or fully transparent becomes nullopt
[[nodiscard]] inline std::optional<convoy_math::Color32> normalize_paint(
    const std::optional<convoy_math::Color32>& live) noexcept
{
    if (!live || live->is_transparent()) {
        return std::nullopt;
    }
    return live;
}

[[nodiscard]] inline PaintBytes paint_to_bytes(const std::optional<convoy_math::Color32>& paint) noexcept {
    return paint ? paint->to_bytes() : NO_PAINT;
}

/// Only the exact sentinel maps to nullopt; {r,g,b,0} with color bits is kept
[[nodiscard]] inline std::optional<convoy_math::Color32> paint_from_bytes(const PaintBytes& bytes) noexcept {
    if (bytes == NO_PAINT) {
        return std::nullopt;
    }
    return convoy_math::Color32::from_bytes(bytes);
}

} // namespace convoy_snapshot
