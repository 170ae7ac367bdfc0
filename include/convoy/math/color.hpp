#pragma once

/// @file color.hpp
/// @brief 8-bit RGBA color for convoy_math

#include "fwd.hpp"
#include <array>
#include <cstdint>

namespace convoy_math {

/// 32-bit RGBA color
struct Color32 {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    constexpr Color32() noexcept = default;
    constexpr Color32(std::uint8_t red, std::uint8_t green, std::uint8_t blue, std::uint8_t alpha = 255) noexcept
        : r(red), g(green), b(blue), a(alpha) {}

    /// Fully transparent black
    [[nodiscard]] static constexpr Color32 clear() noexcept { return Color32(0, 0, 0, 0); }

    /// Build from RGBA byte order
    [[nodiscard]] static constexpr Color32 from_bytes(const std::array<std::uint8_t, 4>& rgba) noexcept {
        return Color32(rgba[0], rgba[1], rgba[2], rgba[3]);
    }

    /// RGBA byte order
    [[nodiscard]] constexpr std::array<std::uint8_t, 4> to_bytes() const noexcept {
        return {r, g, b, a};
    }

    /// Alpha channel is zero
    [[nodiscard]] constexpr bool is_transparent() const noexcept { return a == 0; }

    constexpr bool operator==(const Color32&) const noexcept = default;
};

} // namespace convoy_math
