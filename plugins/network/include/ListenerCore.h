#pragma once

#include "Logger.h"
#include "MetricsCollector.h"
#include "Result.h"
#include "SocketGuard.h"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace LureNet {

struct PeerAddress {
    std::string ip;
    int port{0};
};

/**
 * @brief Client connection shared by its session thread and the core
 *
 * Only the session thread reads fd() or calls close(). abort() may come
 * from any thread and wakes a blocked read without freeing the descriptor.
 */
class SessionSocket {
public:
    explicit SessionSocket(lnt::SocketGuard sock) : sock_(std::move(sock)), fd_(sock_.get()) {}

    SessionSocket(const SessionSocket&) = delete;
    SessionSocket& operator=(const SessionSocket&) = delete;

    int fd() const { return fd_; }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        sock_.reset();
    }

    void abort() {
        std::lock_guard<std::mutex> lock(mutex_);
        sock_.shutdownBoth();
    }

private:
    std::mutex mutex_;
    lnt::SocketGuard sock_;
    const int fd_;
};

/**
 * @brief Listening socket, accept loop and session threads of one decoy
 *
 * Each accepted connection is handed to the session handler on its own
 * thread. stop() leaves running sessions alone. The destructor shuts
 * down every live client socket and then waits for the session threads,
 * so a handler may safely reference its decoy and still records what it
 * read before the abort.
 */
class ListenerCore {
public:
    using SessionHandler = std::function<void(SessionSocket& client, const PeerAddress& peer)>;

    /**
     * @param name Log component, e.g. "SSHDecoy"
     * @param maxSessions Concurrent session cap, 0 for unbounded
     */
    ListenerCore(std::string name, SessionHandler handler, std::size_t maxSessions = 0);
    ~ListenerCore();

    ListenerCore(const ListenerCore&) = delete;
    ListenerCore& operator=(const ListenerCore&) = delete;

    lnt::Result<void> start(const std::string& host, int port);
    void stop();

    bool isRunning() const { return running_; }
    std::string host() const;
    int port() const { return port_; }

    std::size_t activeSessions() const { return activeSessions_; }
    bool waitForIdle(int timeoutMs) const;

private:
    struct Session {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
        std::shared_ptr<SessionSocket> socket;
    };

    std::string name_;
    SessionHandler handler_;
    std::size_t maxSessions_;

    Logger& logger_{Logger::instance()};
    MetricsCollector& metrics_{MetricsCollector::instance()};

    lnt::SocketGuard serverSocket_;
    std::atomic<bool> running_{false};
    std::thread acceptThread_;

    mutable std::mutex stateMutex_;
    std::string host_;
    std::atomic<int> port_{0};

    std::mutex sessionMutex_;
    std::list<Session> sessions_;
    std::atomic<std::size_t> activeSessions_{0};
    mutable std::mutex idleMutex_;
    mutable std::condition_variable idleCv_;

    lnt::Result<void> bindFailure(const std::string& host, int port, const std::string& reason);
    void acceptLoop();
    void spawnSession(lnt::SocketGuard client, PeerAddress peer);
    void reapFinishedSessions();
    void abortSessions();
    void joinAllSessions();
};

} // namespace LureNet
