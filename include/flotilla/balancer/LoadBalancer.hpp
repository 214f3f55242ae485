#pragma once

#include "flotilla/pool/PoolManager.hpp"
#include "flotilla/pool/WorkerInstance.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace flotilla {

enum class Strategy : uint8_t {
    ROUND_ROBIN,
    LEAST_CONNECTIONS,
    WEIGHTED_RANDOM,
    RESPONSE_TIME
};

/**
 * "round-robin", "least-connections", "weighted-random", "response-time"
 */
const char* strategyName(Strategy strategy);

/**
 * Inverse of strategyName().
 * @throws std::invalid_argument on an unknown name
 */
Strategy parseStrategy(std::string_view name);

/**
 * Picks one instance out of a non-empty eligible set.
 */
class BalancingStrategy {
public:
    virtual ~BalancingStrategy() = default;
    virtual WorkerInstance* pick(const std::vector<WorkerInstance*>& eligible) = 0;
    virtual Strategy kind() const = 0;
};

/**
 * Result of a selection. `eligible` is false when nothing was free and the
 * least-loaded instance overall was reported instead; such an instance must
 * not be dispatched to.
 */
struct Selection {
    WorkerInstance* instance = nullptr;
    bool eligible = false;
};

/**
 * Stateless apart from the round-robin cursor and the random engine; both
 * are shared by every caller so concurrent selections spread out.
 */
class LoadBalancer {
public:
    explicit LoadBalancer(Strategy default_strategy = Strategy::ROUND_ROBIN);

    /**
     * @param seed Fixes the weighted-random sequence
     */
    LoadBalancer(Strategy default_strategy, uint32_t seed);

    Selection select(const std::vector<WorkerInstance*>& candidates) const {
        return select(candidates, default_strategy_);
    }

    /**
     * Filter `candidates` to free, healthy instances and apply `strategy`.
     * With nothing eligible, falls back to the least-loaded candidate.
     */
    Selection select(const std::vector<WorkerInstance*>& candidates, Strategy strategy) const;

    /**
     * Adapter for PoolManager::acquire: yields only eligible picks.
     */
    InstanceSelector selector(Strategy strategy) const;

    Strategy defaultStrategy() const { return default_strategy_; }

private:
    Strategy default_strategy_;
    std::array<std::unique_ptr<BalancingStrategy>, 4> strategies_;
};

} // namespace flotilla
