/// @file error.cpp
/// @brief Error handling implementation for convoy_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <convoy/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace convoy_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_catalog_error(const CatalogError& err) {
    std::ostringstream oss;
    oss << "[CatalogError] " << err.message;

    if (!err.definition_kind.empty()) {
        oss << " (kind: " << err.definition_kind << ")";
    }
    if (!err.guid.empty() || err.legacy_id != 0) {
        oss << " (guid: " << err.guid << ", id: " << err.legacy_id << ")";
    }

    return oss.str();
}

std::string format_world_error(const WorldError& err) {
    std::ostringstream oss;
    oss << "[WorldError] " << err.message;
    return oss.str();
}

std::string format_codec_error(const CodecError& err) {
    std::ostringstream oss;
    oss << "[CodecError] " << err.message;

    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, CatalogError>) {
            oss << detail::format_catalog_error(err);
        } else if constexpr (std::is_same_v<T, WorldError>) {
            oss << detail::format_world_error(err);
        } else if constexpr (std::is_same_v<T, CodecError>) {
            oss << detail::format_codec_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> catalog_errors{0};
    std::atomic<std::uint64_t> world_errors{0};
    std::atomic<std::uint64_t> codec_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<CatalogError>()) {
        s_error_stats.catalog_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<WorldError>()) {
        s_error_stats.world_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<CodecError>()) {
        s_error_stats.codec_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t catalog_error_count() {
    return s_error_stats.catalog_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.catalog_errors.store(0, std::memory_order_relaxed);
    s_error_stats.world_errors.store(0, std::memory_order_relaxed);
    s_error_stats.codec_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Catalog: " << s_error_stats.catalog_errors.load() << "\n"
        << "  World: " << s_error_stats.world_errors.load() << "\n"
        << "  Codec: " << s_error_stats.codec_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace convoy_core
