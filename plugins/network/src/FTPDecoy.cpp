#include "FTPDecoy.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include "SessionIO.h"
#include "TextUtils.h"

namespace LureNet {

FTPDecoy::FTPDecoy(CapturePipeline& pipeline, DecoyOptions options)
    : pipeline_(pipeline)
    , options_(options)
    , core_("FTPDecoy",
            [this](SessionSocket& client, const PeerAddress& peer) { handleSession(client, peer); },
            options.maxSessions)
{
}

std::string FTPDecoy::exchange(int fd, int readTimeoutSec) {
    std::string username;
    std::string password;

    if (SessionIO::sendAll(fd, BANNER)) {
        if (!SessionIO::setReadTimeout(fd, readTimeoutSec)) {
            LOG_DEBUG_COMP_IF("Could not set read timeout", "FTPDecoy");
        }
        LineReader reader(fd, lnt::config::SESSION_READ_SIZE);

        for (int turn = 0; turn < lnt::config::FTP_MAX_TURNS; ++turn) {
            auto next = reader.nextLine();
            if (!next.hasData()) {
                break;
            }

            std::string line = TextUtils::trim(next.data);
            if (TextUtils::startsWithIgnoreCase(line, "USER")) {
                username = TextUtils::trim(line.substr(4));
                if (!SessionIO::sendAll(fd, USER_OK)) break;
            } else if (TextUtils::startsWithIgnoreCase(line, "PASS")) {
                password = TextUtils::trim(line.substr(4));
                if (!SessionIO::sendAll(fd, PASS_FAIL)) {
                    LOG_DEBUG_COMP_IF("Login failure reply not delivered", "FTPDecoy");
                }
                break;
            } else if (!SessionIO::sendAll(fd, NOT_UNDERSTOOD)) {
                break;
            }
        }
    }

    return "USER=" + username + " PASS=" + password;
}

void FTPDecoy::handleSession(SessionSocket& client, const PeerAddress& peer) {
    std::string captured = exchange(client.fd(), options_.readTimeoutSec);
    client.close();

    auto event = pipeline_.process(peer.ip, peer.port, Protocol::FTP, AttackType::FTP_BRUTE_FORCE, captured);
    if (!event) {
        LOG_DEBUG_COMP_IF("Capture from " + peer.ip + " discarded: " + event.error().message, "FTPDecoy");
    }
}

} // namespace LureNet
