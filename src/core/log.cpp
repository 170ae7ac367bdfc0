/// @file log.cpp
/// @brief Subsystem logger registry for convoy_core
///
/// All subsystem loggers share one set of sinks: a colored stderr sink and,
/// when enabled, a rotating convoy.log in the configured directory.

#include <convoy/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <filesystem>
#include <mutex>
#include <vector>

namespace convoy_core {

namespace {

constexpr std::array<const char*, 3> SUBSYSTEM_NAMES = {
    "convoy_snapshot",
    "convoy_world",
    "convoy_catalog",
};

struct LevelName {
    spdlog::level::level_enum level;
    const char* name;
};

/// Canonical names first; the rest are accepted spellings
constexpr LevelName LEVEL_NAMES[] = {
    {spdlog::level::trace, "trace"},
    {spdlog::level::debug, "debug"},
    {spdlog::level::info, "info"},
    {spdlog::level::warn, "warn"},
    {spdlog::level::err, "error"},
    {spdlog::level::critical, "critical"},
    {spdlog::level::off, "off"},
    {spdlog::level::warn, "warning"},
    {spdlog::level::err, "err"},
    {spdlog::level::critical, "fatal"},
};

std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        auto path = std::filesystem::path(config.log_directory) / "convoy.log";
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Cannot open log file {}: {}", path.string(), ex.what());
        }
    }

    return sinks;
}

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    std::shared_ptr<spdlog::logger> get(Subsystem subsystem) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto index = static_cast<std::size_t>(subsystem);
        auto& logger = m_loggers[index];
        if (!logger) {
            logger = std::make_shared<spdlog::logger>(SUBSYSTEM_NAMES[index], m_sinks.begin(), m_sinks.end());
            logger->set_level(m_config.level);
            if (!spdlog::get(logger->name())) {
                spdlog::register_logger(logger);
            }
        }
        return logger;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        m_sinks = make_sinks(config);

        for (auto& logger : m_loggers) {
            if (logger) {
                logger->sinks() = m_sinks;
                logger->set_level(config.level);
            }
        }
        spdlog::set_level(config.level);
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& logger : m_loggers) {
            if (logger) {
                logger->flush();
                spdlog::drop(logger->name());
                logger.reset();
            }
        }
        spdlog::default_logger()->flush();
    }

private:
    LoggerRegistry() : m_sinks(make_sinks(m_config)) {}

    std::mutex m_mutex;
    LogConfig m_config;
    std::vector<spdlog::sink_ptr> m_sinks;
    std::array<std::shared_ptr<spdlog::logger>, SUBSYSTEM_NAMES.size()> m_loggers;
};

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

void shutdown_logging() {
    LoggerRegistry::instance().shutdown();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
    for (const auto& entry : LEVEL_NAMES) {
        if (text == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "unknown";
}

// =============================================================================
// Subsystem Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> logger_for(Subsystem subsystem) {
    return LoggerRegistry::instance().get(subsystem);
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::string name, Subsystem subsystem)
    : m_name(std::move(name))
    , m_logger(logger_for(subsystem))
{
    m_logger->trace(">>> {}", m_name);
}

LogScope::~LogScope() {
    m_logger->trace("<<< {} ({:.3f} ms)", m_name, m_watch.elapsed().count() * 1000.0);
}

} // namespace convoy_core
