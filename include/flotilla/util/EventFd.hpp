#pragma once

#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <system_error>

namespace flotilla {

/**
 * Owning handle for a non-blocking eventfd counter.
 *
 * TimerRing keeps one read outstanding on fd(); signal() from any thread
 * completes that read and wakes the ring.
 */
class EventFd {
public:
    EventFd() : fd_(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)) {
        if (fd_ < 0) {
            throw std::system_error(errno, std::system_category(), "EventFd: eventfd");
        }
    }

    ~EventFd() { ::close(fd_); }

    EventFd(const EventFd&) = delete;
    EventFd& operator=(const EventFd&) = delete;

    int fd() const { return fd_; }

    void signal() {
        const uint64_t one = 1;
        if (::write(fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
            // EAGAIN means the counter is saturated and a wake-up is already due
            throw std::system_error(errno, std::system_category(), "EventFd: write");
        }
    }

    /**
     * Drains the counter. 0 when no signal was pending.
     */
    uint64_t consume() {
        uint64_t pending = 0;
        if (::read(fd_, &pending, sizeof(pending)) < 0) {
            if (errno == EAGAIN) {
                return 0;
            }
            throw std::system_error(errno, std::system_category(), "EventFd: read");
        }
        return pending;
    }

private:
    int fd_;
};

} // namespace flotilla
