#pragma once

#include "flotilla/stats/PoolStats.hpp"

namespace flotilla {

class PoolManager;
class Dispatcher;

/**
 * Composes PoolStats from the live instance set and the dispatcher's
 * counters. Holds no state of its own.
 */
class StatsAggregator {
public:
    /**
     * @param dispatcher May be null; job counters are then zero
     */
    StatsAggregator(const PoolManager& pool, const Dispatcher* dispatcher);

    PoolStats snapshot() const;

private:
    const PoolManager& pool_;
    const Dispatcher* dispatcher_;
};

} // namespace flotilla
