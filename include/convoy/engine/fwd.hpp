#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for convoy_engine (configuration layer)

#include <cstdint>
#include <string>
#include <variant>

namespace convoy_engine {

// =============================================================================
// Config Value
// =============================================================================

/// Configuration value variant
///
/// Non-negative JSON integers and command-line values above INT64_MAX are
/// kept as std::uint64_t so 64-bit owner and group identities survive.
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    std::uint64_t,
    double,
    std::string
>;

// =============================================================================
// Forward Declarations
// =============================================================================

enum class ConfigLayerPriority : std::int32_t;
class ConfigLayer;
class ConfigManager;

} // namespace convoy_engine
