#pragma once

#include "flotilla/ring_buffer/MPMCRingBuffer.hpp"
#include <atomic>

namespace flotilla {

/**
 * MPMCRingBuffer with a blocking consumer side.
 *
 * Consumers park on a C++20 atomic flag instead of spinning; every
 * successful enqueue raises the flag. Backs the AsyncLogger queue and the
 * EventBus delivery queue.
 */
template<typename T, size_t N>
class NotifyingRingBuffer {
public:
    NotifyingRingBuffer() = default;

    NotifyingRingBuffer(const NotifyingRingBuffer&) = delete;
    NotifyingRingBuffer& operator=(const NotifyingRingBuffer&) = delete;

    // false when full; the caller decides whether to drop or fall back
    bool enqueue(T&& item) {
        if (!ring_.enqueue(std::move(item))) {
            return false;
        }
        raise(false);
        return true;
    }

    /**
     * Blocks until an item is available. Returns false once shutdown() has
     * been called, even if items remain; drain those with tryDequeue().
     */
    bool dequeue(T& item) {
        while (!closed_.load(std::memory_order_acquire)) {
            if (ring_.dequeue(item)) {
                return true;
            }
            ready_.store(false, std::memory_order_release);
            // Re-check after lowering the flag so a concurrent enqueue is not missed
            if (ring_.dequeue(item)) {
                return true;
            }
            ready_.wait(false, std::memory_order_acquire);
        }
        return false;
    }

    bool tryDequeue(T& item) {
        return ring_.dequeue(item);
    }

    void shutdown() {
        closed_.store(true, std::memory_order_release);
        raise(true);
    }

private:
    void raise(bool all) {
        ready_.store(true, std::memory_order_release);
        if (all) {
            ready_.notify_all();
        } else {
            ready_.notify_one();
        }
    }

    MPMCRingBuffer<T, N> ring_;
    std::atomic<bool> ready_{false};
    std::atomic<bool> closed_{false};
};

} // namespace flotilla
