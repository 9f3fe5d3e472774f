#include "ListenerRegistry.h"
#include "FTPDecoy.h"
#include "HTTPDecoy.h"
#include "Logger.h"
#include "SSHDecoy.h"

namespace LureNet {

ListenerRegistry::ListenerRegistry(CapturePipeline& pipeline, std::map<Protocol, DecoyOptions> options)
    : pipeline_(pipeline)
    , options_(std::move(options))
{
}

ListenerRegistry::~ListenerRegistry() {
    stopAll();
}

std::unique_ptr<IDecoyListener> ListenerRegistry::createListener(Protocol protocol,
                                                                 CapturePipeline& pipeline,
                                                                 const DecoyOptions& options) {
    switch (protocol) {
        case Protocol::SSH: return std::make_unique<SSHDecoy>(pipeline, options);
        case Protocol::HTTP: return std::make_unique<HTTPDecoy>(pipeline, options);
        case Protocol::FTP: return std::make_unique<FTPDecoy>(pipeline, options);
    }
    return nullptr;
}

DecoyOptions ListenerRegistry::optionsFor(Protocol protocol) const {
    auto it = options_.find(protocol);
    return it != options_.end() ? it->second : DecoyOptions();
}

lnt::Result<void> ListenerRegistry::start(Protocol protocol, const std::string& host, int port) {
    // Declared before the lock so a replaced decoy is torn down after it is released
    std::unique_ptr<IDecoyListener> retired;
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = listeners_.find(protocol);
    if (it != listeners_.end() && it->second->isRunning()) {
        return lnt::Err(lnt::ErrorCode::BindFailed,
                        std::string(toString(protocol)) + " decoy already running on " +
                        it->second->host() + ":" + std::to_string(it->second->port()));
    }

    auto listener = createListener(protocol, pipeline_, optionsFor(protocol));
    if (!listener) {
        return lnt::Err(lnt::ErrorCode::InvalidArgument, "Unsupported protocol");
    }

    auto started = listener->start(host, port);
    if (!started) {
        return started;
    }

    Logger::instance().log(LogLevel::INFO, std::string(toString(protocol)) + " decoy started on " +
                           host + ":" + std::to_string(listener->port()), "ListenerRegistry");
    auto& slot = listeners_[protocol];
    retired = std::move(slot);
    slot = std::move(listener);
    return lnt::Ok();
}

lnt::Result<void> ListenerRegistry::start(const std::string& protocolName, const std::string& host, int port) {
    auto protocol = protocolFromString(protocolName);
    if (!protocol) {
        return lnt::Err(lnt::ErrorCode::InvalidArgument, "Unknown protocol: " + protocolName);
    }
    return start(*protocol, host, port);
}

lnt::Result<void> ListenerRegistry::stop(Protocol protocol) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = listeners_.find(protocol);
    if (it == listeners_.end() || !it->second->isRunning()) {
        return lnt::Err(lnt::ErrorCode::NotRunning,
                        std::string(toString(protocol)) + " decoy is not running");
    }

    it->second->stop();
    Logger::instance().log(LogLevel::INFO, std::string(toString(protocol)) + " decoy stopped", "ListenerRegistry");
    return lnt::Ok();
}

lnt::Result<void> ListenerRegistry::stop(const std::string& protocolName) {
    auto protocol = protocolFromString(protocolName);
    if (!protocol) {
        return lnt::Err(lnt::ErrorCode::InvalidArgument, "Unknown protocol: " + protocolName);
    }
    return stop(*protocol);
}

std::vector<ListenerInfo> ListenerRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ListenerInfo> infos;
    infos.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
        const auto& listener = entry.second;
        infos.push_back(ListenerInfo{entry.first, listener->host(), listener->port(), listener->isRunning()});
    }
    return infos;
}

IDecoyListener* ListenerRegistry::find(Protocol protocol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(protocol);
    if (it == listeners_.end() || !it->second->isRunning()) {
        return nullptr;
    }
    return it->second.get();
}

void ListenerRegistry::stopAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : listeners_) {
        entry.second->stop();
    }
}

} // namespace LureNet
