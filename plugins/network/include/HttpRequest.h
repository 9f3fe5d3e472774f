#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace LureNet {

/**
 * @brief Loose view of a captured HTTP request
 *
 * Nothing is rejected: an unknown method becomes "UNKNOWN", a missing
 * path becomes "/", and every line holding a colon counts as a header.
 */
struct HttpRequest {
    std::string method{"UNKNOWN"};
    std::string path{"/"};
    std::unordered_map<std::string, std::string> headers;

    /// nullopt for an empty capture
    static std::optional<HttpRequest> parse(const std::string& raw);

    static bool isKnownMethod(const std::string& method);

    /// method=<M> path=<P> headers={k: v, ...} with keys sorted
    std::string describe() const;
};

} // namespace LureNet
