#include "HttpRequest.h"
#include "TextUtils.h"
#include <algorithm>
#include <vector>

namespace LureNet {

namespace {
const char* const KNOWN_METHODS[] = {
    "GET", "POST", "PUT", "DELETE", "HEAD", "OPTIONS", "PATCH", "TRACE", "CONNECT"
};
}

bool HttpRequest::isKnownMethod(const std::string& method) {
    return std::find(std::begin(KNOWN_METHODS), std::end(KNOWN_METHODS), method) != std::end(KNOWN_METHODS);
}

std::optional<HttpRequest> HttpRequest::parse(const std::string& raw) {
    auto lines = TextUtils::splitLines(raw);
    if (lines.empty()) {
        return std::nullopt;
    }

    HttpRequest request;
    auto parts = TextUtils::splitWhitespace(lines.front());
    if (!parts.empty() && isKnownMethod(parts[0])) {
        request.method = parts[0];
    }
    if (parts.size() > 1) {
        request.path = parts[1];
    }

    for (size_t i = 1; i < lines.size(); ++i) {
        auto colon = lines[i].find(':');
        if (colon == std::string::npos) {
            continue;
        }
        request.headers[TextUtils::trim(lines[i].substr(0, colon))] = TextUtils::trim(lines[i].substr(colon + 1));
    }
    return request;
}

std::string HttpRequest::describe() const {
    std::vector<std::string> keys;
    keys.reserve(headers.size());
    for (const auto& header : headers) {
        keys.push_back(header.first);
    }
    std::sort(keys.begin(), keys.end());

    std::string out = "method=" + method + " path=" + path + " headers={";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) out += ", ";
        out += keys[i] + ": " + headers.at(keys[i]);
    }
    out += "}";
    return out;
}

} // namespace LureNet
