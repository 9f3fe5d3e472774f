#include "ListenerCore.h"
#include "Constants.h"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <system_error>

namespace LureNet {

ListenerCore::ListenerCore(std::string name, SessionHandler handler, std::size_t maxSessions)
    : name_(std::move(name))
    , handler_(std::move(handler))
    , maxSessions_(maxSessions)
{
}

ListenerCore::~ListenerCore() {
    stop();
    abortSessions();
    joinAllSessions();
}

std::string ListenerCore::host() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return host_;
}

lnt::Result<void> ListenerCore::bindFailure(const std::string& host, int port, const std::string& reason) {
    logger_.log(LogLevel::ERROR, "Failed to bind " + host + ":" + std::to_string(port) + ": " + reason, name_);
    metrics_.incrementBindFailures();
    return lnt::Err(lnt::ErrorCode::BindFailed, name_ + " cannot bind " + host + ":" + std::to_string(port) + ": " + reason);
}

lnt::Result<void> ListenerCore::start(const std::string& host, int port) {
    if (running_) {
        return lnt::Err(lnt::ErrorCode::BindFailed,
                        name_ + " already running on " + this->host() + ":" + std::to_string(port_));
    }
    if (port < 0 || port > 65535) {
        return bindFailure(host, port, "port out of range");
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    struct addrinfo* resolved = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &resolved);
    if (rc != 0 || resolved == nullptr) {
        return bindFailure(host, port, rc != 0 ? gai_strerror(rc) : "no address");
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> resolvedGuard(resolved, &freeaddrinfo);

    lnt::SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        return bindFailure(host, port, std::strerror(errno));
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return bindFailure(host, port, std::strerror(errno));
    }

    if (::bind(sock.get(), resolved->ai_addr, resolved->ai_addrlen) < 0) {
        return bindFailure(host, port, std::strerror(errno));
    }

    if (::listen(sock.get(), lnt::config::LISTEN_BACKLOG) < 0) {
        return bindFailure(host, port, std::strerror(errno));
    }

    struct sockaddr_in bound;
    socklen_t boundLen = sizeof(bound);
    if (getsockname(sock.get(), reinterpret_cast<struct sockaddr*>(&bound), &boundLen) < 0) {
        return bindFailure(host, port, std::strerror(errno));
    }

    serverSocket_ = std::move(sock);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        host_ = host;
    }
    port_ = ntohs(bound.sin_port);
    running_ = true;
    acceptThread_ = std::thread(&ListenerCore::acceptLoop, this);

    logger_.log(LogLevel::INFO, name_ + " listening on " + host + ":" + std::to_string(port_), name_);
    return lnt::Ok();
}

void ListenerCore::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    logger_.log(LogLevel::INFO, "Stopping " + name_ + " on port " + std::to_string(port_), name_);

    // Wakes the accept loop; the descriptor is closed only after the join
    serverSocket_.shutdownBoth();
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    serverSocket_.reset();

    logger_.log(LogLevel::INFO, name_ + " stopped, " + std::to_string(activeSessions_) +
                " session(s) still in flight", name_);
}

bool ListenerCore::waitForIdle(int timeoutMs) const {
    std::unique_lock<std::mutex> lock(idleMutex_);
    return idleCv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                            [this] { return activeSessions_ == 0; });
}

void ListenerCore::acceptLoop() {
    const int fd = serverSocket_.get();

    while (running_) {
        reapFinishedSessions();

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(fd, &readfds);

        struct timeval tv;
        tv.tv_sec = lnt::config::ACCEPT_POLL_INTERVAL_MS / 1000;
        tv.tv_usec = (lnt::config::ACCEPT_POLL_INTERVAL_MS % 1000) * 1000;

        int activity = select(fd + 1, &readfds, nullptr, nullptr, &tv);
        if (!running_) break;
        if (activity == 0) continue;
        if (activity < 0) {
            if (errno != EINTR) {
                logger_.log(LogLevel::WARN, "select() failed: " + std::string(std::strerror(errno)), name_);
                std::this_thread::sleep_for(std::chrono::milliseconds(lnt::config::ACCEPT_POLL_INTERVAL_MS));
            }
            continue;
        }

        struct sockaddr_in clientAddr;
        socklen_t len = sizeof(clientAddr);
        lnt::SocketGuard client(::accept(fd, reinterpret_cast<struct sockaddr*>(&clientAddr), &len));
        if (!client) {
            if (!running_) break;
            if (errno != EINTR && errno != ECONNABORTED && errno != EAGAIN && errno != EWOULDBLOCK) {
                logger_.log(LogLevel::WARN, "accept() failed: " + std::string(std::strerror(errno)), name_);
            }
            continue;
        }

        char ipBuf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &clientAddr.sin_addr, ipBuf, INET_ADDRSTRLEN);
        PeerAddress peer{ipBuf, ntohs(clientAddr.sin_port)};

        metrics_.incrementConnectionsAccepted();

        if (maxSessions_ > 0 && activeSessions_ >= maxSessions_) {
            metrics_.incrementSessionsRejected();
            logger_.log(LogLevel::WARN, "Session limit (" + std::to_string(maxSessions_) +
                        ") reached, dropping " + peer.ip + ":" + std::to_string(peer.port), name_);
            continue;
        }

        logger_.log(LogLevel::DEBUG, "New connection from " + peer.ip + ":" + std::to_string(peer.port), name_);
        spawnSession(std::move(client), std::move(peer));
    }
}

void ListenerCore::spawnSession(lnt::SocketGuard client, PeerAddress peer) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    auto socket = std::make_shared<SessionSocket>(std::move(client));
    activeSessions_++;

    auto finish = [this, done]() {
        {
            std::lock_guard<std::mutex> lock(idleMutex_);
            activeSessions_--;
        }
        idleCv_.notify_all();
        *done = true;
    };

    try {
        std::thread worker([this, finish, peer, socket]() {
            try {
                handler_(*socket, peer);
            } catch (const std::exception& e) {
                logger_.log(LogLevel::ERROR, "Session from " + peer.ip + ":" + std::to_string(peer.port) +
                            " failed: " + e.what(), name_);
            }
            socket->close();
            finish();
        });

        std::lock_guard<std::mutex> lock(sessionMutex_);
        sessions_.push_back(Session{std::move(worker), done, socket});
    } catch (const std::system_error& e) {
        logger_.log(LogLevel::ERROR, "Cannot start session thread for " + peer.ip + ": " + e.what(), name_);
        finish();
    }
}

void ListenerCore::reapFinishedSessions() {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (*it->done) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

void ListenerCore::abortSessions() {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    std::size_t aborted = 0;
    for (auto& session : sessions_) {
        if (!*session.done) {
            session.socket->abort();
            ++aborted;
        }
    }
    if (aborted > 0) {
        logger_.log(LogLevel::INFO, "Aborted " + std::to_string(aborted) + " in-flight session(s)", name_);
    }
}

void ListenerCore::joinAllSessions() {
    std::list<Session> pending;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        pending.swap(sessions_);
    }
    for (auto& session : pending) {
        if (session.thread.joinable()) {
            session.thread.join();
        }
    }
}

} // namespace LureNet
