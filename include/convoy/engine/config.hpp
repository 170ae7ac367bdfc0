/// @file config.hpp
/// @brief Configuration system for convoy
///
/// Provides layered configuration with:
/// - Default values
/// - JSON configuration files
/// - Environment variables
/// - Command-line argument parsing

#pragma once

#include "fwd.hpp"

#include <convoy/core/error.hpp>
#include <convoy/core/log.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace convoy_engine {

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    User = 0,               ///< User configuration file
    Project = 100,          ///< Project configuration file
    System = 500,           ///< System defaults
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// One source of configuration values
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::User)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);

    /// Get all keys (sorted)
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration for convoy_inspect and RestoreOptions
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    /// Check if key exists in any layer
    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value (from highest priority layer that contains it)
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    /// Get bool value (accepts "true"/"1"/"yes" strings and non-zero integers)
    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;

    /// Get unsigned 64-bit value (parses strings, negative values fall back to default)
    [[nodiscard]] std::uint64_t get_uint(const std::string& key, std::uint64_t default_value = 0) const;

    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // =========================================================================
    // File Operations
    // =========================================================================

    /// Load configuration from JSON file (nested objects become dotted keys)
    convoy_core::Result<void> load_json(const std::filesystem::path& path, const std::string& layer_name);

    /// Load configuration from an already parsed JSON document
    convoy_core::Result<void> load_json_document(const nlohmann::json& document, const std::string& layer_name);

    // =========================================================================
    // Command Line
    // =========================================================================

    /// Parse command-line arguments (--key=value, --key value, --flag)
    convoy_core::Result<void> parse_args(int argc, char** argv);

    /// Parse command-line arguments from vector
    convoy_core::Result<void> parse_args(const std::vector<std::string>& args);

    /// Positional (non-option) arguments seen by the last parse_args call
    [[nodiscard]] const std::vector<std::string>& positional_args() const { return m_positional; }

    // =========================================================================
    // Environment
    // =========================================================================

    /// Load environment variables for known keys, e.g. CONVOY_LOG_LEVEL -> log.level
    void load_environment(const std::string& prefix = "CONVOY_");

    // =========================================================================
    // Defaults
    // =========================================================================

    /// Create the cmdline, environment, user, project, system and defaults
    /// layers and fill in built-in defaults
    void setup_defaults();

private:
    /// Get layers sorted by priority (highest to lowest)
    [[nodiscard]] std::vector<ConfigLayer*> sorted_layers() const;

    /// Find or create a layer without holding the lock
    ConfigLayer* ensure_layer(const std::string& name, ConfigLayerPriority priority);

private:
    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    std::vector<std::string> m_positional;
    mutable std::mutex m_mutex;
};

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {

// Logging
constexpr const char* LOG_LEVEL = "log.level";
constexpr const char* LOG_FILE = "log.file";
constexpr const char* LOG_DIRECTORY = "log.directory";

// Restore
constexpr const char* RESTORE_ROLLBACK_ON_ERROR = "restore.rollback_on_error";
constexpr const char* RESTORE_REBIND_CHILD_OWNERSHIP = "restore.rebind_child_ownership";
constexpr const char* RESTORE_OWNER = "restore.owner";
constexpr const char* RESTORE_GROUP = "restore.group";

// Inputs
constexpr const char* CATALOG_PATH = "catalog.path";
constexpr const char* SNAPSHOT_PATH = "snapshot.path";
constexpr const char* CONFIG_PATH = "config";

// Tool
constexpr const char* INSPECT_RESTORE = "inspect.restore";

/// Every key known to setup_defaults and load_environment
inline constexpr const char* ALL[] = {
    LOG_LEVEL, LOG_FILE, LOG_DIRECTORY,
    RESTORE_ROLLBACK_ON_ERROR, RESTORE_REBIND_CHILD_OWNERSHIP, RESTORE_OWNER, RESTORE_GROUP,
    CATALOG_PATH, SNAPSHOT_PATH, INSPECT_RESTORE,
};

} // namespace config_keys

// =============================================================================
// Conversion
// =============================================================================

/// Build the logging setup from log.level, log.file and log.directory
[[nodiscard]] convoy_core::LogConfig log_config_from(const ConfigManager& config);

} // namespace convoy_engine
