#pragma once

/// @file log.hpp
/// @brief spdlog setup and subsystem loggers for convoy

#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros (default logger)
// =============================================================================

#define CONVOY_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define CONVOY_LOG_WARN(...) spdlog::warn(__VA_ARGS__)

namespace convoy_core {

/// @brief Basic pattern and level for the default logger, before config is read
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Configuration
// =============================================================================

/// Sink and level settings shared by every subsystem logger
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;                      ///< convoy.log is written here
    std::size_t max_file_size = 10 * 1024 * 1024;   // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Rebuild the shared sinks and apply the level to existing loggers
void configure_logging(const LogConfig& config);

/// Flush and drop every subsystem logger; they are recreated on next use
void shutdown_logging();

/// "warn", "warning", "error", "err", ... ; nullopt for anything else
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);

/// Canonical name accepted by parse_log_level
[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Subsystem Loggers
// =============================================================================

enum class Subsystem : std::uint8_t {
    Snapshot,   ///< convoy_snapshot: capture and restore
    World,      ///< convoy_world: live world implementations
    Catalog,    ///< convoy_catalog: definition catalogs
};

/// Logger for a subsystem, created with the current sinks on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> logger_for(Subsystem subsystem);

[[nodiscard]] inline std::shared_ptr<spdlog::logger> snapshot_logger() { return logger_for(Subsystem::Snapshot); }
[[nodiscard]] inline std::shared_ptr<spdlog::logger> world_logger() { return logger_for(Subsystem::World); }
[[nodiscard]] inline std::shared_ptr<spdlog::logger> catalog_logger() { return logger_for(Subsystem::Catalog); }

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a block with its elapsed time
class LogScope {
public:
    explicit LogScope(std::string name, Subsystem subsystem = Subsystem::Snapshot);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    spdlog::stopwatch m_watch;
};

#define CONVOY_LOG_CONCAT_INNER(a, b) a##b
#define CONVOY_LOG_CONCAT(a, b) CONVOY_LOG_CONCAT_INNER(a, b)
#define CONVOY_LOG_SCOPE(name) ::convoy_core::LogScope CONVOY_LOG_CONCAT(convoy_log_scope_, __LINE__)(name)

} // namespace convoy_core
