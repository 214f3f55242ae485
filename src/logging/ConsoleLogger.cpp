#include "flotilla/logger/ConsoleLogger.hpp"

#include <iostream>

namespace flotilla {
void ConsoleLogger::write(LogLevel level, std::string_view msg) {
    if (level >= LogLevel::WARNING) {
        std::cerr << "[" << logLevelName(level) << "] " << msg << std::endl;
    } else {
        std::cout << "[" << logLevelName(level) << "] " << msg << std::endl;
    }
}
}
