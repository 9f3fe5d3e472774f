#pragma once

#include "AttackTypes.h"
#include "Constants.h"
#include "Result.h"
#include <cstddef>
#include <string>

namespace LureNet {

/// Per-decoy session tuning
struct DecoyOptions {
    int readTimeoutSec{lnt::config::SESSION_READ_TIMEOUT_SEC};  // 0 blocks until the peer sends or closes
    std::size_t maxSessions{0};     // 0 for unbounded
};

/**
 * @brief A protocol decoy bound to one TCP endpoint
 *
 * start() returns once the socket is listening; sessions are served on
 * background threads. stop() closes the listening socket and lets
 * in-flight sessions run to completion. Destruction aborts them instead.
 */
class IDecoyListener {
public:
    virtual ~IDecoyListener() = default;

    /**
     * @param port 0 binds an ephemeral port, reported by port() afterwards
     * @return BindFailed when already running or the endpoint is unavailable
     */
    virtual lnt::Result<void> start(const std::string& host, int port) = 0;

    virtual void stop() = 0;

    virtual Protocol protocol() const = 0;
    virtual std::string host() const = 0;
    virtual int port() const = 0;
    virtual bool isRunning() const = 0;

    /// Block until no session is in flight or the timeout passes
    virtual bool waitForIdle(int timeoutMs) const = 0;
};

} // namespace LureNet
