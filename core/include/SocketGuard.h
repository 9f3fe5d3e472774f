#pragma once

/**
 * @file SocketGuard.h
 * @brief RAII wrapper for socket file descriptors
 *
 * Every decoy session and listening socket is held in a guard so the
 * descriptor is closed on all exit paths.
 */

#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace lnt {

/**
 * @brief RAII wrapper for socket file descriptors
 *
 * Usage:
 * @code
 * SocketGuard client(accept(listenFd, ...));
 * if (!client) { // handle error }
 * send(client.get(), ...);
 * // Socket automatically closed when client goes out of scope
 * @endcode
 */
class SocketGuard {
public:
    SocketGuard() noexcept : fd_(-1) {}

    /// Take ownership of a socket fd
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~SocketGuard() {
        reset();
    }

    /// Get the raw file descriptor
    int get() const noexcept { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

    /// Close current socket (if any) and take ownership of new one
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /// Shut down both directions without releasing the descriptor
    void shutdownBoth() noexcept {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

private:
    int fd_;
};

} // namespace lnt
