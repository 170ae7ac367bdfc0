#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for convoy_core module

#include <cstdint>
#include <vector>

namespace convoy_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct CatalogError;
struct WorldError;
struct CodecError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Identifiers
// =============================================================================

struct Guid;

// =============================================================================
// Opaque Payloads
// =============================================================================

/// Opaque byte payload owned by the world's item system
using Blob = std::vector<std::uint8_t>;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace convoy_core
