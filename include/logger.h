#pragma once

#include <string>
#include <memory>

namespace viva {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse a level name ("debug", "INFO", "warning", ...), case-insensitive
 * @return fallback when name is not a known level
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

const char* log_level_name(LogLevel level);

/**
 * @brief Process-wide leveled logger
 *
 * Capture threads, connection threads and the main loop all write through here.
 * Before initialize() lines go to the console unformatted at INFO and above.
 * Lines are "[LEVEL] YYYY-MM-DD HH:MM:SS.mmm: [Component] message"; ERROR goes to stderr.
 */
class Logger {
public:
    /**
     * @param output_file Appended to when non-empty; console output is always kept
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                           const std::string& output_file = "");
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /// Emit with a component tag such as "Gate" or "Server"
    static void tagged(LogLevel level, const char* component, const std::string& message);

    /// True when a line at this level would be written; lets callers skip building it
    static bool enabled(LogLevel level);

    static void set_level(LogLevel level);
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) do { if (viva::Logger::enabled(viva::LogLevel::DEBUG)) \
    viva::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + (msg)); } while (0)
#define LOG_INFO(msg) viva::Logger::info(msg)
#define LOG_WARN(msg) viva::Logger::warn(msg)
#define LOG_ERROR(msg) viva::Logger::error(msg)

#define VIVA_LOG_TAGGED(level, component, msg) do { if (viva::Logger::enabled(level)) \
    viva::Logger::tagged(level, component, (msg)); } while (0)

// Per-frame components stay at DEBUG
#define LOG_AUDIO(msg) VIVA_LOG_TAGGED(viva::LogLevel::DEBUG, "Audio", msg)
#define LOG_GATE(msg) VIVA_LOG_TAGGED(viva::LogLevel::DEBUG, "Gate", msg)
#define LOG_STT(msg) VIVA_LOG_TAGGED(viva::LogLevel::INFO, "STT", msg)
#define LOG_LLM(msg) VIVA_LOG_TAGGED(viva::LogLevel::INFO, "LLM", msg)
#define LOG_TTS(msg) VIVA_LOG_TAGGED(viva::LogLevel::INFO, "TTS", msg)
#define LOG_POLICY(msg) VIVA_LOG_TAGGED(viva::LogLevel::INFO, "Policy", msg)
#define LOG_SESSION(msg) VIVA_LOG_TAGGED(viva::LogLevel::INFO, "Session", msg)
#define LOG_SERVER(msg) VIVA_LOG_TAGGED(viva::LogLevel::INFO, "Server", msg)

} // namespace viva
