#include "HTTPDecoy.h"
#include "Constants.h"
#include "HttpRequest.h"
#include "LoggerMacros.h"
#include "SessionIO.h"

namespace LureNet {

HTTPDecoy::HTTPDecoy(CapturePipeline& pipeline, DecoyOptions options)
    : pipeline_(pipeline)
    , options_(options)
    , core_("HTTPDecoy",
            [this](SessionSocket& client, const PeerAddress& peer) { handleSession(client, peer); },
            options.maxSessions)
{
}

const std::string& HTTPDecoy::fakeResponse() {
    static const std::string response =
        "HTTP/1.1 200 OK\r\n"
        "Server: Apache/2.4.41 (Ubuntu)\r\n"
        "Content-Type: text/html; charset=UTF-8\r\n"
        "Content-Length: 45\r\n"
        "Connection: close\r\n"
        "\r\n"
        "<html><body><h1>It works!</h1></body></html>";
    return response;
}

std::string HTTPDecoy::payloadFor(const std::string& rawRequest) {
    auto request = HttpRequest::parse(rawRequest);
    return request ? request->describe() : std::string();
}

std::string HTTPDecoy::exchange(int fd, int readTimeoutSec) {
    if (!SessionIO::setReadTimeout(fd, readTimeoutSec)) {
        LOG_DEBUG_COMP_IF("Could not set read timeout", "HTTPDecoy");
    }

    auto frame = SessionIO::receive(fd, lnt::config::HTTP_FRAME_SIZE);
    if (frame.status == ReadStatus::TimedOut || frame.status == ReadStatus::Error) {
        return "";
    }

    // Same page whatever was asked for
    if (!SessionIO::sendAll(fd, fakeResponse())) {
        LOG_DEBUG_COMP_IF("Decoy page not delivered", "HTTPDecoy");
    }
    return payloadFor(frame.data);
}

void HTTPDecoy::handleSession(SessionSocket& client, const PeerAddress& peer) {
    std::string captured = exchange(client.fd(), options_.readTimeoutSec);
    client.close();

    auto event = pipeline_.process(peer.ip, peer.port, Protocol::HTTP, AttackType::HTTP_PROBE, captured);
    if (!event) {
        LOG_DEBUG_COMP_IF("Capture from " + peer.ip + " discarded: " + event.error().message, "HTTPDecoy");
    }
}

} // namespace LureNet
