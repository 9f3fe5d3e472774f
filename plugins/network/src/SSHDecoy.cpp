#include "SSHDecoy.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include "SessionIO.h"
#include "TextUtils.h"

namespace LureNet {

SSHDecoy::SSHDecoy(CapturePipeline& pipeline, DecoyOptions options)
    : pipeline_(pipeline)
    , options_(options)
    , core_("SSHDecoy",
            [this](SessionSocket& client, const PeerAddress& peer) { handleSession(client, peer); },
            options.maxSessions)
{
}

std::string SSHDecoy::exchange(int fd, int readTimeoutSec) {
    if (!SessionIO::sendAll(fd, BANNER)) {
        return "";
    }
    if (!SessionIO::setReadTimeout(fd, readTimeoutSec)) {
        LOG_DEBUG_COMP_IF("Could not set read timeout", "SSHDecoy");
    }

    auto reply = SessionIO::receive(fd, lnt::config::SESSION_READ_SIZE);
    if (!reply.hasData()) {
        return "";
    }
    return TextUtils::trim(reply.data);
}

void SSHDecoy::handleSession(SessionSocket& client, const PeerAddress& peer) {
    std::string captured = exchange(client.fd(), options_.readTimeoutSec);
    client.close();

    auto event = pipeline_.process(peer.ip, peer.port, Protocol::SSH, AttackType::SSH_BRUTE_FORCE, captured);
    if (!event) {
        LOG_DEBUG_COMP_IF("Capture from " + peer.ip + " discarded: " + event.error().message, "SSHDecoy");
    }
}

} // namespace LureNet
