#pragma once

#include "flotilla/logger/Logger.hpp"
#include <fstream>
#include <string>

namespace flotilla {

/**
 * File logger that writes logs to a file.
 * NOT thread-safe - should be used with AsyncLogger for concurrent access.
 */
class FileLogger : public Logger {
  public:
    /**
     * Create a file logger.
     * @param filepath Path to log file (will be created/appended to)
     * @param auto_flush If true, flush after each log message (safer but slower)
     */
    explicit FileLogger(const std::string& filepath, bool auto_flush = true);
    ~FileLogger();

    void write(LogLevel level, std::string_view msg) override;

    // Manually flush the log file
    void flush();

    // Reopen the log file (after an external rotation renamed it)
    void reopen();

    bool isOpen() const { return file_.is_open(); }

  private:
    void writeLine(LogLevel level, std::string_view msg);

    std::ofstream file_;
    bool auto_flush_;
    std::string filepath_;
};

} // namespace flotilla
