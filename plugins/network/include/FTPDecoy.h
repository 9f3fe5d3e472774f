#pragma once

#include "CapturePipeline.h"
#include "IDecoyListener.h"
#include "ListenerCore.h"
#include <string>

namespace LureNet {

/**
 * @brief FTP decoy: banner, then a short USER/PASS dialogue
 *
 * At most FTP_MAX_TURNS command lines are read. PASS always fails and
 * ends the session.
 */
class FTPDecoy : public IDecoyListener {
public:
    explicit FTPDecoy(CapturePipeline& pipeline,
                      DecoyOptions options = DecoyOptions());
    ~FTPDecoy() override = default;

    lnt::Result<void> start(const std::string& host, int port) override { return core_.start(host, port); }
    void stop() override { core_.stop(); }

    Protocol protocol() const override { return Protocol::FTP; }
    std::string host() const override { return core_.host(); }
    int port() const override { return core_.port(); }
    bool isRunning() const override { return core_.isRunning(); }
    bool waitForIdle(int timeoutMs) const override { return core_.waitForIdle(timeoutMs); }

    static constexpr const char* BANNER = "220 FTP Server Ready\r\n";
    static constexpr const char* USER_OK = "331 Password required\r\n";
    static constexpr const char* PASS_FAIL = "530 Login incorrect\r\n";
    static constexpr const char* NOT_UNDERSTOOD = "500 Command not understood\r\n";

    /// Run the login dialogue and return "USER=<u> PASS=<p>"
    static std::string exchange(int fd, int readTimeoutSec);

private:
    CapturePipeline& pipeline_;
    DecoyOptions options_;
    ListenerCore core_;

    void handleSession(SessionSocket& client, const PeerAddress& peer);
};

} // namespace LureNet
