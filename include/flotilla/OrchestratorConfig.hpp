#pragma once

#include "flotilla/dispatch/DispatcherConfig.hpp"
#include "flotilla/logger/Logger.hpp"
#include "flotilla/pool/PoolConfig.hpp"
#include <optional>

namespace flotilla {

struct OrchestratorConfig {
    PoolConfig pool;
    DispatcherConfig dispatcher;
    std::optional<LogLevel> logLevel;  // applied to the global logger on initialize()

    /**
     * @throws std::invalid_argument
     */
    void validate() const;

    /**
     * Overlay FLOTILLA_* environment variables onto the current values.
     * Unset variables leave fields untouched.
     * @throws std::invalid_argument naming the variable on a malformed value
     */
    void applyEnvironment();

    /**
     * Defaults plus applyEnvironment().
     */
    static OrchestratorConfig fromEnvironment();
};

} // namespace flotilla
