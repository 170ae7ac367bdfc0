#pragma once

/// @file codec.hpp
/// @brief JSON form of vehicle snapshots
///
/// Blobs are base64 strings, GUIDs dashed hex, paint a 4-number array
/// ({0,0,0,0} = no paint), rotations [w, x, y, z]. Turret entries without
/// a recorded state are null.

#include "vehicle.hpp"
#include <convoy/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace convoy_snapshot::codec {

/// Current document version
inline constexpr std::int64_t FORMAT_VERSION = 1;

[[nodiscard]] nlohmann::json encode(const VehicleSnapshot& snapshot);

/// Validate and decode; errors name the offending field path
[[nodiscard]] convoy_core::Result<VehicleSnapshot> decode(const nlohmann::json& document);

/// encode + dump (indent < 0 means compact)
[[nodiscard]] std::string to_string(const VehicleSnapshot& snapshot, int indent = 2);

/// parse + decode
[[nodiscard]] convoy_core::Result<VehicleSnapshot> from_string(std::string_view text);

} // namespace convoy_snapshot::codec
