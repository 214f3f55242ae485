#include "flotilla/logger/AsyncLogger.hpp"
#include "../ring_buffer/NotifyingRingBuffer.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace flotilla {

// Fixed-size record so enqueueing never allocates
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level = LogLevel::INFO;
    char message[1024];
    size_t length = 0;

    LogRecord() = default;

    LogRecord(LogLevel lvl, std::string_view msg)
        : timestamp(std::chrono::system_clock::now()), level(lvl),
          length(std::min(msg.size(), sizeof(message) - 1)) {
        std::memcpy(message, msg.data(), length);
        message[length] = '\0';
    }

    std::string_view text() const { return std::string_view(message, length); }
};

class AsyncLogger::Impl {
  public:
    explicit Impl(std::unique_ptr<Logger> delegate)
        : fDelegate(std::move(delegate)), fRunning(true),
          fWorkerThread(&Impl::workerThreadFunc, this) {}

    ~Impl() {
        fRunning.store(false, std::memory_order_release);

        // Wake the writer so it observes fRunning == false
        fRingBuffer.shutdown();

        // Writer must be gone before the ring and delegate are destroyed
        if (fWorkerThread.joinable()) {
            fWorkerThread.join();
        }
    }

    void enqueue(LogLevel level, std::string_view msg) {
        if (!fRunning.load(std::memory_order_acquire)) {
            // Shutting down: the delegate may already be draining
            return;
        }

        LogRecord record(level, msg);

        if (!fRingBuffer.enqueue(std::move(record))) {
            if (!fRunning.load(std::memory_order_acquire)) {
                return;
            }

            std::string fallbackMsg = "[ASYNC_BUFFER_FULL] ";
            fallbackMsg += msg;
            fDelegate->log(level, fallbackMsg);
        }
    }

  private:
    void workerThreadFunc() {
        LogRecord record;
        while (fRunning.load(std::memory_order_relaxed)) {
            if (fRingBuffer.dequeue(record)) {
                fDelegate->log(record.level, record.text());
            } else {
                break;
            }
        }

        // Drain what was accepted before shutdown
        while (fRingBuffer.tryDequeue(record)) {
            fDelegate->log(record.level, record.text());
        }
    }

    std::unique_ptr<Logger> fDelegate;
    NotifyingRingBuffer<LogRecord, 4096> fRingBuffer;
    std::atomic<bool> fRunning;
    std::thread fWorkerThread;
};

AsyncLogger::AsyncLogger(std::unique_ptr<Logger> delegate) {
    // Let everything through to the delegate unless the caller narrows it
    setLevel(LogLevel::DEBUG);
    fImpl = std::make_unique<AsyncLogger::Impl>(std::move(delegate));
}

AsyncLogger::~AsyncLogger() = default;

void AsyncLogger::write(LogLevel level, std::string_view msg) { fImpl->enqueue(level, msg); }

} // namespace flotilla
