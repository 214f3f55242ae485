#pragma once

// Debug configuration
// Set to 1 to enable verbose dispatch/pool tracing, 0 for production builds
#ifndef FLOTILLA_DEBUG
#define FLOTILLA_DEBUG 0
#endif

// Debug logging macro - compiles to nothing when FLOTILLA_DEBUG is 0
#if FLOTILLA_DEBUG
#include "flotilla/logger/Logger.hpp"
#include <sstream>
#define FLOTILLA_DEBUG_LOG(msg) \
    do { \
        std::ostringstream oss; \
        oss << msg; \
        flotilla::Logger::getInstance().logDebug(oss.str()); \
    } while(0)
#else
#define FLOTILLA_DEBUG_LOG(msg) ((void)0)
#endif
