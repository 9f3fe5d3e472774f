#pragma once

#include "AttackTypes.h"
#include "CapturePipeline.h"
#include "IDecoyListener.h"
#include "Result.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace LureNet {

struct ListenerInfo {
    Protocol protocol{Protocol::SSH};
    std::string host;
    int port{0};
    bool isRunning{false};
};

/**
 * @brief Start/stop/list commands over the decoys, one per protocol
 *
 * A stopped decoy stays registered (isRunning == false) until the next
 * start for its protocol replaces it. Sessions the replaced decoy still
 * holds are aborted outside the registry lock; what they read is stored.
 */
class ListenerRegistry {
public:
    explicit ListenerRegistry(CapturePipeline& pipeline,
                              std::map<Protocol, DecoyOptions> options = {});
    ~ListenerRegistry();

    ListenerRegistry(const ListenerRegistry&) = delete;
    ListenerRegistry& operator=(const ListenerRegistry&) = delete;

    /**
     * @brief Start the decoy for a protocol
     * @return BindFailed if that protocol is already running or the bind fails
     */
    lnt::Result<void> start(Protocol protocol, const std::string& host, int port);

    /// Protocol names are case-insensitive; an unknown name is InvalidArgument
    lnt::Result<void> start(const std::string& protocolName, const std::string& host, int port);

    /// NotRunning if the protocol has no running decoy
    lnt::Result<void> stop(Protocol protocol);
    lnt::Result<void> stop(const std::string& protocolName);

    /// Registered decoys in protocol order
    std::vector<ListenerInfo> list() const;

    /// Running decoy for a protocol, or nullptr
    IDecoyListener* find(Protocol protocol) const;

    void stopAll();

    static std::unique_ptr<IDecoyListener> createListener(Protocol protocol,
                                                          CapturePipeline& pipeline,
                                                          const DecoyOptions& options);

private:
    CapturePipeline& pipeline_;
    std::map<Protocol, DecoyOptions> options_;

    mutable std::mutex mutex_;
    std::map<Protocol, std::unique_ptr<IDecoyListener>> listeners_;

    DecoyOptions optionsFor(Protocol protocol) const;
};

} // namespace LureNet
