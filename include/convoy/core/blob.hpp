#pragma once

/// @file blob.hpp
/// @brief Opaque byte payload helpers (base64 text form)

#include "fwd.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace convoy_core {

/// Encode a blob as standard base64 (with padding)
[[nodiscard]] std::string base64_encode(const Blob& data);

/// Decode standard base64; nullopt on malformed input
[[nodiscard]] std::optional<Blob> base64_decode(std::string_view text);

} // namespace convoy_core
