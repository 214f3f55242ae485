#include "flotilla/logger/Logger.hpp"
#include "flotilla/logger/ConsoleLogger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <string>

namespace {
    static std::atomic<flotilla::Logger*> logger{nullptr};
}
namespace flotilla {

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    }
    return "INFO";
}

LogLevel parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    throw std::invalid_argument("unknown log level: " + std::string(name));
}

void Logger::log(LogLevel level, std::string_view msg) {
    if (!enabled(level)) {
        return;
    }
    write(level, msg);
}

void Logger::logCurrentError(std::string_view context_msg) {
    auto eptr = std::current_exception();
    std::string full_message = std::string(context_msg);

    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            full_message += ": ";
            full_message += e.what();
        } catch (...) {
            full_message += ": unknown exception type";
        }
    } else {
        full_message += ": no current exception";
    }

    logError(full_message);
}

void Logger::setGlobalLogger(Logger* ptr) {
    logger.store(ptr, std::memory_order_release);
}

Logger& Logger::getInstance() {
    auto* ptr = logger.load(std::memory_order_acquire);
    if (!ptr) {
        // Fallback: console logger until a global one is installed
        static flotilla::ConsoleLogger* fallback_logger = new flotilla::ConsoleLogger();
        return *fallback_logger;
    }
    return *ptr;
}

}
