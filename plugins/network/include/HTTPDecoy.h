#pragma once

#include "CapturePipeline.h"
#include "IDecoyListener.h"
#include "ListenerCore.h"
#include <string>

namespace LureNet {

/// HTTP decoy: reads one request frame and answers with a stock Apache page
class HTTPDecoy : public IDecoyListener {
public:
    explicit HTTPDecoy(CapturePipeline& pipeline,
                       DecoyOptions options = DecoyOptions());
    ~HTTPDecoy() override = default;

    lnt::Result<void> start(const std::string& host, int port) override { return core_.start(host, port); }
    void stop() override { core_.stop(); }

    Protocol protocol() const override { return Protocol::HTTP; }
    std::string host() const override { return core_.host(); }
    int port() const override { return core_.port(); }
    bool isRunning() const override { return core_.isRunning(); }
    bool waitForIdle(int timeoutMs) const override { return core_.waitForIdle(timeoutMs); }

    static const std::string& fakeResponse();

    /// Read one frame, reply, and return the described request
    static std::string exchange(int fd, int readTimeoutSec);

    /// Capture text for a raw request; empty for an empty request
    static std::string payloadFor(const std::string& rawRequest);

private:
    CapturePipeline& pipeline_;
    DecoyOptions options_;
    ListenerCore core_;

    void handleSession(SessionSocket& client, const PeerAddress& peer);
};

} // namespace LureNet
