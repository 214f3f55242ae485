#pragma once

#include "flotilla/logger/Logger.hpp"

namespace flotilla {
// DEBUG/INFO go to stdout, WARNING/ERROR to stderr
class ConsoleLogger : public Logger {
  public:
    void write(LogLevel level, std::string_view msg) override;
};
} // namespace flotilla
