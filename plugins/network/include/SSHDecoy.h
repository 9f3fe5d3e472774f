#pragma once

#include "CapturePipeline.h"
#include "IDecoyListener.h"
#include "ListenerCore.h"
#include <string>

namespace LureNet {

/**
 * @brief SSH decoy: version banner, one read, disconnect
 *
 * No key exchange happens. Whatever the client sends after the banner
 * (typically its own version string) is the capture.
 */
class SSHDecoy : public IDecoyListener {
public:
    explicit SSHDecoy(CapturePipeline& pipeline,
                      DecoyOptions options = DecoyOptions());
    ~SSHDecoy() override = default;

    lnt::Result<void> start(const std::string& host, int port) override { return core_.start(host, port); }
    void stop() override { core_.stop(); }

    Protocol protocol() const override { return Protocol::SSH; }
    std::string host() const override { return core_.host(); }
    int port() const override { return core_.port(); }
    bool isRunning() const override { return core_.isRunning(); }
    bool waitForIdle(int timeoutMs) const override { return core_.waitForIdle(timeoutMs); }

    static constexpr const char* BANNER = "SSH-2.0-OpenSSH_8.2p1 Ubuntu-4ubuntu0.3\r\n";

    /// Send the banner and return the trimmed reply, empty on timeout
    static std::string exchange(int fd, int readTimeoutSec);

private:
    CapturePipeline& pipeline_;
    DecoyOptions options_;
    ListenerCore core_;

    void handleSession(SessionSocket& client, const PeerAddress& peer);
};

} // namespace LureNet
