#pragma once

#include "flotilla/logger/Logger.hpp"

#include <memory>
#include <string_view>

namespace flotilla {
/**
 * Decorator that moves sink I/O off the caller's thread.
 * Messages are filtered by this logger's level; the delegate's own level
 * is applied again on the writer thread.
 */
class AsyncLogger : public Logger {
  public:
    explicit AsyncLogger(std::unique_ptr<Logger> delegate);
    ~AsyncLogger();

    void write(LogLevel level, std::string_view msg) override;

  private:
    class Impl;
    std::unique_ptr<Impl> fImpl;
};
} // namespace flotilla
