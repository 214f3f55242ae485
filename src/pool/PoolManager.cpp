#include "flotilla/pool/PoolManager.hpp"
#include "flotilla/Config.hpp"
#include "flotilla/Errors.hpp"
#include "flotilla/events/EventBus.hpp"
#include "flotilla/logger/Logger.hpp"
#include "flotilla/util/IdGenerator.hpp"
#include <algorithm>
#include <stdexcept>

namespace flotilla {

namespace {
std::string recycleReason(const WorkerInstance& instance, const PoolConfig& config,
                          WorkerInstance::Clock::time_point now) {
    if (!instance.healthy()) {
        return "unhealthy";
    }
    if (instance.messageCount() > config.maxMessagesPerInstance) {
        return "message budget exhausted";
    }
    if (now - instance.createdAt() > config.maxInstanceAge) {
        return "max age reached";
    }
    return "requested";
}
}

PoolManager::PoolManager(PoolConfig config, BackendFactory factory, EventBus* events)
    : config_(std::move(config)), factory_(std::move(factory)), events_(events) {
    config_.validate();
    if (!factory_) {
        throw std::invalid_argument("PoolManager: backend factory is required");
    }
}

PoolManager::~PoolManager() {
    shutdown();
}

size_t PoolManager::initialize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) {
            throw std::logic_error("PoolManager: already initialized");
        }
        if (shutting_down_) {
            throw ShuttingDown("PoolManager: shutting down");
        }
        initialized_ = true;
    }

    size_t created = 0;
    for (size_t i = 0; i < config_.minInstances; ++i) {
        try {
            createInstance();
            ++created;
        } catch (const PoolError& e) {
            Logger::getInstance().logWarning("PoolManager: failed to create instance " +
                                             std::to_string(i + 1) + "/" +
                                             std::to_string(config_.minInstances) + ": " + e.what());
        }
    }

    if (created < config_.minInstances) {
        Logger::getInstance().logWarning("PoolManager: started under-provisioned with " +
                                         std::to_string(created) + "/" +
                                         std::to_string(config_.minInstances) + " instances");
    } else {
        Logger::getInstance().logMessage("PoolManager: initialized with " + std::to_string(created) +
                                         " instances");
    }

    if (config_.warmupOnStart) {
        size_t failed = 0;
        for (const auto& id : idleInstanceIds()) {
            if (probeInstance(id) == ProbeResult::FAILED) {
                ++failed;
            }
        }
        Logger::getInstance().logMessage("PoolManager: warm-up finished, " + std::to_string(failed) +
                                         " instance(s) failed their probe");
    }

    return created;
}

std::string PoolManager::createInstance() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (shutting_down_) {
        throw ShuttingDown("PoolManager: shutting down");
    }
    if (instances_.size() + pending_creates_ >= config_.maxInstances) {
        throw CapacityError("PoolManager: pool at capacity (" + std::to_string(config_.maxInstances) + ")");
    }

    ++pending_creates_;
    std::string id = provision(lock);
    auto it = findLocked(id);
    if (it != instances_.end()) {
        offerLocked(**it);
    }
    return id;
}

InstanceLease PoolManager::acquire(std::chrono::milliseconds timeout, const InstanceSelector& selector,
                                   std::stop_token stop) {
    const auto deadline = Clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (shutting_down_) {
            throw ShuttingDown("PoolManager: shutting down");
        }
        if (stop.stop_requested()) {
            throw ShuttingDown("PoolManager: acquire abandoned");
        }

        auto now = Clock::now();
        auto candidates = eligibleLocked(now);
        if (!candidates.empty()) {
            WorkerInstance* chosen = selector ? selector(candidates) : candidates.front();
            if (chosen && chosen->available()) {
                FLOTILLA_DEBUG_LOG("PoolManager: leased " << chosen->id());
                return leaseLocked(*chosen, now);
            }
        }

        if (instances_.size() + pending_creates_ >= config_.maxInstances) {
            break;
        }

        ++pending_creates_;
        std::string id;
        try {
            id = provision(lock);
        } catch (const ProvisioningError& e) {
            if (instances_.empty() && pending_creates_ == 0) {
                throw;
            }
            Logger::getInstance().logWarning(std::string(e.what()) + "; waiting for an existing instance");
            break;
        }

        auto it = findLocked(id);
        if (it == instances_.end()) {
            continue;
        }
        // Older waiters get the new instance first
        if (waiters_.empty() && (*it)->available()) {
            return leaseLocked(**it, Clock::now());
        }
        offerLocked(**it);
    }

    Waiter waiter;
    waiters_.push_back(&waiter);
    FLOTILLA_DEBUG_LOG("PoolManager: parked waiter, " << waiters_.size() << " waiting");

    // The callback runs inline when stop was already requested and takes
    // mutex_, so it is registered and destroyed with the lock released.
    lock.unlock();
    {
        std::stop_callback on_stop(stop, [this, &waiter] {
            std::lock_guard<std::mutex> guard(mutex_);
            auto it = std::find(waiters_.begin(), waiters_.end(), &waiter);
            if (it != waiters_.end()) {
                waiters_.erase(it);
                waiter.abandoned = true;
                waiter.cv.notify_one();
            }
        });

        lock.lock();
        while (!waiter.lease && !waiter.shutdown && !waiter.abandoned) {
            if (waiter.cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                break;
            }
        }
        if (!waiter.lease && !waiter.shutdown) {
            waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), &waiter), waiters_.end());
        }
        lock.unlock();
    }

    if (waiter.lease) {
        return std::move(*waiter.lease);
    }
    if (waiter.shutdown) {
        throw ShuttingDown("PoolManager: shutting down");
    }
    if (waiter.abandoned) {
        throw ShuttingDown("PoolManager: acquire abandoned");
    }
    throw NoInstanceAvailable("PoolManager: no instance available within " +
                              std::to_string(timeout.count()) + "ms");
}

void PoolManager::release(const std::string& id, ReleaseDisposition disposition,
                          std::chrono::milliseconds latency) {
    std::optional<Retired> retired;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLocked(id);
        if (it == instances_.end()) {
            FLOTILLA_DEBUG_LOG("PoolManager: release of departed instance " << id);
            return;
        }

        WorkerInstance& instance = **it;
        auto now = Clock::now();
        instance.markReleased(disposition, latency, now);

        if (instance.dueForRecycle(config_, now)) {
            reason = recycleReason(instance, config_, now);
            retired = retireLocked(it);
        } else {
            offerLocked(instance);
        }
    }

    if (retired) {
        disposeRetired(*retired, reason);
        replenish();
    }
}

void PoolManager::recycle(const std::string& id) {
    Retired retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLocked(id);
        if (it == instances_.end()) {
            throw NotFound("PoolManager: unknown instance " + id);
        }
        retired = retireLocked(it);
    }
    disposeRetired(retired, "requested");
    replenish();
}

bool PoolManager::recycleIfStale(const std::string& id) {
    Retired retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLocked(id);
        if (it == instances_.end()) {
            return false;
        }
        const WorkerInstance& instance = **it;
        if (instance.probing() || !instance.stale(config_, Clock::now())) {
            return false;
        }
        retired = retireLocked(it);
    }
    disposeRetired(retired, "stale");
    replenish();
    return true;
}

std::shared_ptr<WorkerBackend> PoolManager::beginProbe(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = findLocked(id);
    if (it == instances_.end() || (*it)->busy() || (*it)->probing()) {
        return nullptr;
    }
    (*it)->beginProbe();
    return (*it)->backend();
}

void PoolManager::endProbe(const std::string& id, bool ok) {
    Retired retired;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLocked(id);
        if (it == instances_.end()) {
            return;
        }
        WorkerInstance& instance = **it;
        instance.endProbe(ok);

        auto now = Clock::now();
        if (!instance.dueForRecycle(config_, now)) {
            offerLocked(instance);
            return;
        }
        reason = ok ? recycleReason(instance, config_, now) : "probe failed";
        retired = retireLocked(it);
    }
    disposeRetired(retired, reason);
    replenish();
}

ProbeResult PoolManager::probeInstance(const std::string& id) {
    auto backend = beginProbe(id);
    if (!backend) {
        return ProbeResult::SKIPPED;
    }

    bool ok = false;
    try {
        ok = backend->probe();
    } catch (const std::exception& e) {
        Logger::getInstance().logWarning("PoolManager: probe of " + id + " threw: " + e.what());
    }

    if (!ok) {
        Logger::getInstance().logWarning("PoolManager: instance " + id + " failed its health probe");
    }
    endProbe(id, ok);
    return ok ? ProbeResult::HEALTHY : ProbeResult::FAILED;
}

size_t PoolManager::replenish() {
    size_t created = 0;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutting_down_ && creationDeficitLocked() > 0) {
        ++pending_creates_;
        try {
            std::string id = provision(lock);
            ++created;
            auto it = findLocked(id);
            if (it != instances_.end()) {
                offerLocked(**it);
            }
        } catch (const PoolError& e) {
            // Next health pass tries again
            Logger::getInstance().logWarning(std::string("PoolManager: replenish stopped: ") + e.what());
            break;
        }
    }
    return created;
}

void PoolManager::shutdown() {
    std::vector<Retired> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return;
        }
        shutting_down_ = true;

        retired.reserve(instances_.size());
        for (auto& instance : instances_) {
            retired.push_back({instance->id(), instance->backend(), instance->busy()});
        }
        recycled_count_ += instances_.size();
        instances_.clear();

        for (Waiter* waiter : waiters_) {
            waiter->shutdown = true;
            waiter->cv.notify_one();
        }
        waiters_.clear();
    }

    for (const auto& r : retired) {
        disposeRetired(r, "shutdown");
    }
    Logger::getInstance().logMessage("PoolManager: shut down, disposed " + std::to_string(retired.size()) +
                                     " instance(s)");
}

std::vector<std::string> PoolManager::idleInstanceIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& instance : instances_) {
        if (!instance->busy() && !instance->probing()) {
            ids.push_back(instance->id());
        }
    }
    return ids;
}

std::vector<InstanceStats> PoolManager::instanceStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    std::vector<InstanceStats> stats;
    stats.reserve(instances_.size());
    for (const auto& instance : instances_) {
        stats.push_back(instance->snapshot(now));
    }
    return stats;
}

void PoolManager::recordExchange(const std::string& id, const std::string& input, const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = findLocked(id);
    if (it != instances_.end()) {
        (*it)->recordExchange(input, output);
    }
}

size_t PoolManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

size_t PoolManager::waiterCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

uint64_t PoolManager::recycledCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recycled_count_;
}

bool PoolManager::isShuttingDown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutting_down_;
}

PoolManager::InstanceList::iterator PoolManager::findLocked(const std::string& id) {
    return std::find_if(instances_.begin(), instances_.end(),
                        [&id](const auto& instance) { return instance->id() == id; });
}

PoolManager::InstanceList::const_iterator PoolManager::findLocked(const std::string& id) const {
    return std::find_if(instances_.begin(), instances_.end(),
                        [&id](const auto& instance) { return instance->id() == id; });
}

std::vector<WorkerInstance*> PoolManager::eligibleLocked(Clock::time_point now) const {
    std::vector<WorkerInstance*> eligible;
    for (const auto& instance : instances_) {
        if (instance->available() && !instance->dueForRecycle(config_, now)) {
            eligible.push_back(instance.get());
        }
    }
    return eligible;
}

bool PoolManager::offerLocked(WorkerInstance& instance) {
    auto now = Clock::now();
    if (waiters_.empty() || !instance.available() || instance.dueForRecycle(config_, now)) {
        return false;
    }

    Waiter* waiter = waiters_.front();
    waiters_.pop_front();
    waiter->lease = leaseLocked(instance, now);
    waiter->cv.notify_one();
    FLOTILLA_DEBUG_LOG("PoolManager: handed " << instance.id() << " to oldest waiter");
    return true;
}

InstanceLease PoolManager::leaseLocked(WorkerInstance& instance, Clock::time_point now) {
    instance.markAcquired(now);
    return InstanceLease{instance.id(), instance.backend()};
}

std::string PoolManager::provision(std::unique_lock<std::mutex>& lock) {
    lock.unlock();

    std::string id;
    std::shared_ptr<WorkerBackend> backend;
    std::unique_ptr<WorkerInstance> instance;
    std::string failure;
    try {
        id = IdGenerator::generate("inst");
        backend = factory_(id);
        if (backend) {
            instance = std::make_unique<WorkerInstance>(id, backend);
        } else {
            failure = "factory returned no backend";
        }
    } catch (const std::exception& e) {
        failure = e.what();
    }

    lock.lock();
    --pending_creates_;

    if (!failure.empty()) {
        throw ProvisioningError("PoolManager: failed to create instance: " + failure);
    }

    if (shutting_down_) {
        lock.unlock();
        try {
            backend->dispose();
        } catch (const std::exception& e) {
            Logger::getInstance().logWarning("PoolManager: dispose of " + id + " failed: " + e.what());
        }
        lock.lock();
        throw ShuttingDown("PoolManager: shutting down");
    }

    instances_.push_back(std::move(instance));
    size_t pool_size = instances_.size();

    lock.unlock();
    Logger::getInstance().logMessage("PoolManager: created instance " + id + " (pool size " +
                                     std::to_string(pool_size) + ")");
    publishCreated(id);
    lock.lock();
    return id;
}

PoolManager::Retired PoolManager::retireLocked(InstanceList::iterator it) {
    Retired retired{(*it)->id(), (*it)->backend(), (*it)->busy()};
    instances_.erase(it);
    ++recycled_count_;
    return retired;
}

void PoolManager::disposeRetired(const Retired& retired, const std::string& reason) {
    if (retired.wasBusy) {
        try {
            retired.backend->cancel();
        } catch (const std::exception& e) {
            Logger::getInstance().logWarning("PoolManager: cancel of " + retired.id + " failed: " + e.what());
        }
    }
    try {
        retired.backend->dispose();
    } catch (const std::exception& e) {
        Logger::getInstance().logWarning("PoolManager: dispose of " + retired.id + " failed: " + e.what());
    }

    Logger::getInstance().logMessage("PoolManager: recycled instance " + retired.id + " (" + reason + ")");
    if (events_) {
        events_->publish(PoolEvent::instance(PoolEventType::INSTANCE_RECYCLED, retired.id, reason));
    }
}

size_t PoolManager::creationDeficitLocked() const {
    size_t total = instances_.size() + pending_creates_;
    size_t below_min = config_.minInstances > total ? config_.minInstances - total : 0;
    size_t headroom = config_.maxInstances > total ? config_.maxInstances - total : 0;
    size_t unserved = waiters_.size() > pending_creates_ ? waiters_.size() - pending_creates_ : 0;
    return std::max(below_min, std::min(unserved, headroom));
}

void PoolManager::publishCreated(const std::string& id) {
    if (events_) {
        events_->publish(PoolEvent::instance(PoolEventType::INSTANCE_CREATED, id));
    }
}

} // namespace flotilla
