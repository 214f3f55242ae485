#pragma once
#include <string>
#include <string_view>
#include <atomic>
#include <cstdint>
#include <exception>

namespace flotilla {

enum class LogLevel : uint8_t { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3 };

const char* logLevelName(LogLevel level);

/**
 * Parse a level name ("debug", "info", "warning"/"warn", "error"), case-insensitive.
 * @throws std::invalid_argument on an unknown name
 */
LogLevel parseLogLevel(std::string_view name);

class Logger {
public:
    virtual ~Logger() = default;

    /**
     * Sink entry point. Implementations receive only messages that passed
     * the level filter.
     */
    virtual void write(LogLevel level, std::string_view msg) = 0;

    void log(LogLevel level, std::string_view msg);
    void logDebug(std::string_view msg) { log(LogLevel::DEBUG, msg); }
    void logMessage(std::string_view msg) { log(LogLevel::INFO, msg); }
    void logWarning(std::string_view msg) { log(LogLevel::WARNING, msg); }
    void logError(std::string_view msg) { log(LogLevel::ERROR, msg); }

    /**
     * Log the current exception with a context message.
     * Should be called from within a catch block.
     * Combines the provided message with the exception details.
     */
    void logCurrentError(std::string_view context_msg);

    void setLevel(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel getLevel() const { return min_level_.load(std::memory_order_relaxed); }
    bool enabled(LogLevel level) const { return level >= getLevel(); }

    static void setGlobalLogger(Logger* ptr);
    static Logger& getInstance();

private:
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
};


} // namespace flotilla
