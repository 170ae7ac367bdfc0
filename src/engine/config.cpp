/// @file config.cpp
/// @brief Configuration system implementation for convoy

#include <convoy/engine/config.hpp>
#include <convoy/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace convoy_engine {

namespace {

std::optional<std::int64_t> parse_int(const std::string& text) {
    if (text.empty()) return std::nullopt;
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return v;
}

std::optional<std::uint64_t> parse_uint(const std::string& text) {
    if (text.empty()) return std::nullopt;
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return v;
}

/// Infer the value type of a command-line or environment string
ConfigValue parse_scalar(const std::string& text) {
    if (text == "true" || text == "false") {
        return ConfigValue{text == "true"};
    }

    if (auto int_val = parse_int(text)) {
        return ConfigValue{*int_val};
    }
    // Identities above INT64_MAX
    if (auto uint_val = parse_uint(text)) {
        return ConfigValue{*uint_val};
    }

    char* end = nullptr;
    double float_val = std::strtod(text.c_str(), &end);
    if (!text.empty() && end == text.c_str() + text.size()) {
        return ConfigValue{float_val};
    }

    return ConfigValue{text};
}

/// Flatten a JSON object into dotted keys
convoy_core::Result<void> flatten_into(const nlohmann::json& node, const std::string& prefix, ConfigLayer& layer) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& v = it.value();

        if (v.is_object()) {
            auto nested = flatten_into(v, key, layer);
            if (!nested) return nested;
        } else if (v.is_boolean()) {
            layer.set(key, ConfigValue{v.get<bool>()});
        } else if (v.is_number_unsigned()) {
            layer.set(key, ConfigValue{v.get<std::uint64_t>()});
        } else if (v.is_number_integer()) {
            layer.set(key, ConfigValue{v.get<std::int64_t>()});
        } else if (v.is_number_float()) {
            layer.set(key, ConfigValue{v.get<double>()});
        } else if (v.is_string()) {
            layer.set(key, ConfigValue{v.get<std::string>()});
        } else if (v.is_null()) {
            continue;
        } else {
            return convoy_core::Error(convoy_core::ErrorCode::ParseError,
                "Unsupported value type for config key '" + key + "'");
        }
    }
    return convoy_core::Ok();
}

/// log.level -> CONVOY_LOG_LEVEL
std::string env_name_for(const std::string& prefix, const std::string& key) {
    std::string name = prefix;
    for (char c : key) {
        name.push_back(c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return name;
}

} // anonymous namespace

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigManager
// =============================================================================

ConfigLayer* ConfigManager::ensure_layer(const std::string& name, ConfigLayerPriority priority) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        if (*v == "true" || *v == "1" || *v == "yes") return true;
        if (*v == "false" || *v == "0" || *v == "no") return false;
        return default_value;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }
    if (auto* v = std::get_if<std::uint64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::uint64_t ConfigManager::get_uint(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::uint64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v < 0 ? default_value : static_cast<std::uint64_t>(*v);
    }
    // Environment values arrive as strings
    if (auto* v = std::get_if<std::string>(&*value)) {
        return parse_uint(*v).value_or(default_value);
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<std::uint64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return std::to_string(*v);
    }

    return default_value;
}

convoy_core::Result<void> ConfigManager::load_json(
    const std::filesystem::path& path,
    const std::string& layer_name)
{
    std::ifstream file(path);
    if (!file) {
        return convoy_core::Error(convoy_core::ErrorCode::IOError, "Failed to open file: " + path.string());
    }

    nlohmann::json document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        return convoy_core::Error(convoy_core::ErrorCode::ParseError, "Malformed JSON in " + path.string());
    }

    auto result = load_json_document(document, layer_name);
    if (!result) {
        result.error().with_context("path", path.string());
        return result;
    }

    CONVOY_LOG_DEBUG("Loaded config layer '{}' from {}", layer_name, path.string());
    return convoy_core::Ok();
}

convoy_core::Result<void> ConfigManager::load_json_document(
    const nlohmann::json& document,
    const std::string& layer_name)
{
    if (!document.is_object()) {
        return convoy_core::Error(convoy_core::ErrorCode::ParseError, "Config root must be a JSON object");
    }

    // Parse into a scratch layer so a bad document leaves the target untouched
    ConfigLayer scratch(layer_name);
    auto result = flatten_into(document, "", scratch);
    if (!result) {
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* layer = ensure_layer(layer_name, ConfigLayerPriority::User);
    for (const auto& key : scratch.keys()) {
        layer->set(key, *scratch.get(key));
    }
    return convoy_core::Ok();
}

convoy_core::Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

convoy_core::Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* layer = ensure_layer("cmdline", ConfigLayerPriority::CommandLine);
    m_positional.clear();

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg.starts_with("--")) {
            std::string key_value = arg.substr(2);
            auto eq_pos = key_value.find('=');

            std::string key;
            std::string value;

            if (eq_pos != std::string::npos) {
                key = key_value.substr(0, eq_pos);
                value = key_value.substr(eq_pos + 1);
            } else if (i + 1 < args.size() && !args[i + 1].starts_with("-")) {
                key = key_value;
                value = args[++i];
            } else {
                key = key_value;
                value = "true";
            }

            if (key.empty()) {
                return convoy_core::Error(convoy_core::ErrorCode::InvalidArgument, "Empty option name in '" + arg + "'");
            }

            // --inspect-restore -> inspect.restore
            std::replace(key.begin(), key.end(), '-', '.');

            layer->set(key, parse_scalar(value));
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return convoy_core::Error(convoy_core::ErrorCode::InvalidArgument, "Unknown short option: " + arg);
        } else {
            m_positional.push_back(arg);
        }
    }

    return convoy_core::Ok();
}

void ConfigManager::load_environment(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ConfigLayer* layer = ensure_layer("environment", ConfigLayerPriority::Environment);

    for (const char* key : config_keys::ALL) {
        std::string env_name = env_name_for(prefix, key);
        const char* value = std::getenv(env_name.c_str());
        if (value) {
            layer->set(key, ConfigValue{std::string(value)});
        }
    }
}

void ConfigManager::setup_defaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensure_layer("cmdline", ConfigLayerPriority::CommandLine);
    ensure_layer("environment", ConfigLayerPriority::Environment);
    ensure_layer("user", ConfigLayerPriority::User);
    ensure_layer("project", ConfigLayerPriority::Project);
    ensure_layer("system", ConfigLayerPriority::System);
    ConfigLayer* defaults = ensure_layer("defaults", ConfigLayerPriority::Default);

    // Logging
    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    defaults->set(config_keys::LOG_FILE, ConfigValue{false});
    defaults->set(config_keys::LOG_DIRECTORY, ConfigValue{std::string("logs")});

    // Restore
    defaults->set(config_keys::RESTORE_ROLLBACK_ON_ERROR, ConfigValue{true});
    defaults->set(config_keys::RESTORE_REBIND_CHILD_OWNERSHIP, ConfigValue{false});

    // Tool
    defaults->set(config_keys::INSPECT_RESTORE, ConfigValue{false});
}

std::vector<ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<ConfigLayer*> result;
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Sort by priority (lower value = higher priority)
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

// =============================================================================
// Conversion
// =============================================================================

convoy_core::LogConfig log_config_from(const ConfigManager& config) {
    convoy_core::LogConfig log_config;

    auto level_name = config.get_string(config_keys::LOG_LEVEL, "info");
    if (auto level = convoy_core::parse_log_level(level_name)) {
        log_config.level = *level;
    } else {
        CONVOY_LOG_WARN("Unknown log level '{}', keeping '{}'", level_name,
            convoy_core::log_level_name(log_config.level));
    }

    log_config.file_enabled = config.get_bool(config_keys::LOG_FILE, false);
    log_config.log_directory = config.get_string(config_keys::LOG_DIRECTORY, "logs");
    return log_config;
}

} // namespace convoy_engine
