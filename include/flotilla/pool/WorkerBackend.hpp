#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace flotilla {

/**
 * The only way the orchestrator talks to a downstream worker (a CLI process,
 * an SDK session, a browser tab, ...). Implementations are supplied by the
 * embedding service through a BackendFactory.
 *
 * Thread model: execute() and probe() are never called concurrently on the
 * same backend. cancel() may be called from another thread while execute()
 * is in flight. dispose() is called once, after which the pool drops its
 * handle.
 *
 * dispose() can overlap execute(). When execute() outlives its deadline the
 * dispatcher calls cancel(), recycles the instance and moves on without
 * waiting; pool shutdown does the same to busy instances. If execute() did
 * not return after cancel(), dispose() then runs while it is still in
 * flight on another thread, so it must be safe to call concurrently with
 * execute() (for example by killing the worker process execute() waits
 * on). The execution thread holds its own reference, so the object itself
 * stays alive until execute() returns.
 */
class WorkerBackend {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~WorkerBackend() = default;

    /**
     * Run one job.
     * @param input Job payload
     * @param deadline Point after which the result is no longer wanted
     * @return Backend output
     * @throws ExecutionError on downstream failure (or any std::exception)
     */
    virtual std::string execute(const std::string& input, Clock::time_point deadline) = 0;

    /**
     * Cheap liveness check.
     * @return false (or throw) if the worker can no longer serve jobs
     */
    virtual bool probe() = 0;

    /**
     * Release downstream resources. Errors are logged by the caller.
     * May run while an abandoned execute() is still in flight.
     */
    virtual void dispose() = 0;

    /**
     * Interrupt an in-flight execute(). Default: nothing to interrupt.
     */
    virtual void cancel() {}

    /**
     * Static weight for weighted-random selection.
     */
    virtual unsigned weight() const { return 1; }
};

using BackendFactory = std::function<std::shared_ptr<WorkerBackend>(const std::string& id)>;

} // namespace flotilla
