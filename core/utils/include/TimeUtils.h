#pragma once

#include <chrono>
#include <string>

namespace LureNet {

class TimeUtils {
public:
    /// ISO-8601 UTC with microseconds, e.g. 2024-05-01T12:00:00.123456+00:00
    static std::string toIso8601(std::chrono::system_clock::time_point tp);
    static std::string nowIso8601();
};

} // namespace LureNet
