#pragma once

/// @file guid.hpp
/// @brief 128-bit stable identifiers for catalog definitions

#include "fwd.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace convoy_core {

// =============================================================================
// Guid
// =============================================================================

/// 128-bit identifier stored in canonical text order
/// Text form: "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" (lowercase hex)
struct Guid {
    std::array<std::uint8_t, 16> bytes{};

    /// Default constructor (empty GUID)
    constexpr Guid() noexcept = default;

    /// Construct from raw bytes
    constexpr explicit Guid(const std::array<std::uint8_t, 16>& raw) noexcept : bytes(raw) {}

    /// Construct from two 64-bit halves (high half first)
    [[nodiscard]] static constexpr Guid from_halves(std::uint64_t high, std::uint64_t low) noexcept {
        Guid g;
        for (int i = 0; i < 8; ++i) {
            g.bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(high >> (56 - 8 * i));
            g.bytes[static_cast<std::size_t>(i + 8)] = static_cast<std::uint8_t>(low >> (56 - 8 * i));
        }
        return g;
    }

    /// Empty GUID
    [[nodiscard]] static constexpr Guid empty_guid() noexcept { return Guid{}; }

    /// Parse dashed ("8-4-4-4-12") or plain 32-digit hex form, optionally braced
    [[nodiscard]] static std::optional<Guid> parse(std::string_view text);

    /// Check if all bytes are zero
    [[nodiscard]] constexpr bool is_empty() const noexcept {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Upper 64 bits
    [[nodiscard]] constexpr std::uint64_t high() const noexcept {
        std::uint64_t v = 0;
        for (std::size_t i = 0; i < 8; ++i) v = (v << 8) | bytes[i];
        return v;
    }

    /// Lower 64 bits
    [[nodiscard]] constexpr std::uint64_t low() const noexcept {
        std::uint64_t v = 0;
        for (std::size_t i = 8; i < 16; ++i) v = (v << 8) | bytes[i];
        return v;
    }

    /// Canonical dashed lowercase text
    [[nodiscard]] std::string to_string() const;

    constexpr bool operator==(const Guid& other) const noexcept = default;

    constexpr bool operator<(const Guid& other) const noexcept {
        return high() < other.high() || (high() == other.high() && low() < other.low());
    }
};

inline std::ostream& operator<<(std::ostream& os, const Guid& guid) {
    return os << guid.to_string();
}

} // namespace convoy_core

template<>
struct std::hash<convoy_core::Guid> {
    std::size_t operator()(const convoy_core::Guid& guid) const noexcept {
        return std::hash<std::uint64_t>{}(guid.high() ^ (guid.low() * 0x9e3779b97f4a7c15ULL));
    }
};
