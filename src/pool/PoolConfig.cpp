#include "flotilla/pool/PoolConfig.hpp"
#include <stdexcept>
#include <string>

namespace flotilla {

namespace {
void requirePositive(std::chrono::milliseconds value, const char* name) {
    if (value.count() <= 0) {
        throw std::invalid_argument(std::string("PoolConfig: ") + name + " must be positive");
    }
}
}

void PoolConfig::validate() const {
    if (maxInstances < 1) {
        throw std::invalid_argument("PoolConfig: maxInstances must be at least 1");
    }
    if (minInstances > maxInstances) {
        throw std::invalid_argument("PoolConfig: minInstances (" + std::to_string(minInstances) +
                                    ") exceeds maxInstances (" + std::to_string(maxInstances) + ")");
    }
    if (maxMessagesPerInstance == 0) {
        throw std::invalid_argument("PoolConfig: maxMessagesPerInstance must be positive");
    }
    requirePositive(maxInstanceAge, "maxInstanceAge");
    requirePositive(staleTimeout, "staleTimeout");
    requirePositive(healthCheckInterval, "healthCheckInterval");
    requirePositive(acquireTimeout, "acquireTimeout");
}

} // namespace flotilla
