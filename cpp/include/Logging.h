#pragma once
/**
 * @file Logging.h
 * @brief Engine-wide leveled logging.
 *
 * Thread-safe and never throws. WARN and ERROR go to stderr, the rest to stdout,
 * unless a sink has been installed.
 */
#include <functional>
#include <string>

namespace ensemble {
    enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

    /** Receives every message that passes the level threshold. */
    using LogSink = std::function<void(LogLevel, const std::string&)>;

    /** @brief Set the global verbosity (default INFO). */
    void setLogLevel(LogLevel level) noexcept;

    LogLevel getLogLevel() noexcept;

    /**
     * @brief Parse "DEBUG", "info", "Warn", "ERROR", ...
     * @throws ConfigurationError on an unknown name
     */
    LogLevel parseLogLevel(const std::string& name);

    const char* toString(LogLevel level) noexcept;

    /**
     * @brief Replace the stream output with `sink`; an empty sink restores the default streams.
     */
    void setLogSink(LogSink sink);

    /** @brief Core logging call. */
    void log(LogLevel level, const std::string& msg) noexcept;

    inline void logDebug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    inline void logInfo(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    inline void logWarn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    inline void logError(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
}
