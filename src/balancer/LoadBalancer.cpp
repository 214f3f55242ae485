#include "flotilla/balancer/LoadBalancer.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

namespace flotilla {

const char* strategyName(Strategy strategy) {
    switch (strategy) {
    case Strategy::ROUND_ROBIN: return "round-robin";
    case Strategy::LEAST_CONNECTIONS: return "least-connections";
    case Strategy::WEIGHTED_RANDOM: return "weighted-random";
    case Strategy::RESPONSE_TIME: return "response-time";
    }
    return "unknown";
}

Strategy parseStrategy(std::string_view name) {
    for (Strategy s : {Strategy::ROUND_ROBIN, Strategy::LEAST_CONNECTIONS, Strategy::WEIGHTED_RANDOM,
                       Strategy::RESPONSE_TIME}) {
        if (name == strategyName(s)) {
            return s;
        }
    }
    throw std::invalid_argument("unknown load balancing strategy: " + std::string(name));
}

namespace {

// ============================================================================
// Built-in strategies
// ============================================================================

class RoundRobinStrategy : public BalancingStrategy {
public:
    WorkerInstance* pick(const std::vector<WorkerInstance*>& eligible) override {
        uint64_t cursor = cursor_.fetch_add(1, std::memory_order_relaxed);
        return eligible[cursor % eligible.size()];
    }

    Strategy kind() const override { return Strategy::ROUND_ROBIN; }

private:
    std::atomic<uint64_t> cursor_{0};
};

class LeastConnectionsStrategy : public BalancingStrategy {
public:
    WorkerInstance* pick(const std::vector<WorkerInstance*>& eligible) override {
        // min_element keeps the first of equal elements
        return *std::min_element(eligible.begin(), eligible.end(),
                                 [](const WorkerInstance* a, const WorkerInstance* b) {
                                     return a->currentLoad() < b->currentLoad();
                                 });
    }

    Strategy kind() const override { return Strategy::LEAST_CONNECTIONS; }
};

class WeightedRandomStrategy : public BalancingStrategy {
public:
    explicit WeightedRandomStrategy(uint32_t seed) : engine_(seed) {}

    WorkerInstance* pick(const std::vector<WorkerInstance*>& eligible) override {
        uint64_t total = 0;
        for (const auto* instance : eligible) {
            total += instance->weight();
        }

        uint64_t draw;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::uniform_int_distribution<uint64_t> dist(0, total - 1);
            draw = dist(engine_);
        }

        uint64_t cumulative = 0;
        for (auto* instance : eligible) {
            cumulative += instance->weight();
            if (draw < cumulative) {
                return instance;
            }
        }
        return eligible.back();
    }

    Strategy kind() const override { return Strategy::WEIGHTED_RANDOM; }

private:
    std::mutex mutex_;
    std::mt19937 engine_;
};

class ResponseTimeStrategy : public BalancingStrategy {
public:
    WorkerInstance* pick(const std::vector<WorkerInstance*>& eligible) override {
        return *std::min_element(eligible.begin(), eligible.end(),
                                 [](const WorkerInstance* a, const WorkerInstance* b) {
                                     return a->averageResponseTime() < b->averageResponseTime();
                                 });
    }

    Strategy kind() const override { return Strategy::RESPONSE_TIME; }
};

} // namespace

LoadBalancer::LoadBalancer(Strategy default_strategy)
    : LoadBalancer(default_strategy, std::random_device{}()) {
}

LoadBalancer::LoadBalancer(Strategy default_strategy, uint32_t seed)
    : default_strategy_(default_strategy) {
    strategies_[static_cast<size_t>(Strategy::ROUND_ROBIN)] = std::make_unique<RoundRobinStrategy>();
    strategies_[static_cast<size_t>(Strategy::LEAST_CONNECTIONS)] = std::make_unique<LeastConnectionsStrategy>();
    strategies_[static_cast<size_t>(Strategy::WEIGHTED_RANDOM)] = std::make_unique<WeightedRandomStrategy>(seed);
    strategies_[static_cast<size_t>(Strategy::RESPONSE_TIME)] = std::make_unique<ResponseTimeStrategy>();
}

Selection LoadBalancer::select(const std::vector<WorkerInstance*>& candidates, Strategy strategy) const {
    std::vector<WorkerInstance*> eligible;
    eligible.reserve(candidates.size());
    for (auto* instance : candidates) {
        if (!instance->busy() && instance->healthy()) {
            eligible.push_back(instance);
        }
    }

    if (!eligible.empty()) {
        return Selection{strategies_[static_cast<size_t>(strategy)]->pick(eligible), true};
    }

    if (candidates.empty()) {
        return Selection{};
    }

    auto least = std::min_element(candidates.begin(), candidates.end(),
                                  [](const WorkerInstance* a, const WorkerInstance* b) {
                                      return a->currentLoad() < b->currentLoad();
                                  });
    return Selection{*least, false};
}

InstanceSelector LoadBalancer::selector(Strategy strategy) const {
    return [this, strategy](const std::vector<WorkerInstance*>& candidates) -> WorkerInstance* {
        Selection selection = select(candidates, strategy);
        return selection.eligible ? selection.instance : nullptr;
    };
}

} // namespace flotilla
