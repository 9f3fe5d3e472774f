#include "TimeUtils.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace LureNet {

std::string TimeUtils::toIso8601(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
    std::time_t t = std::chrono::system_clock::to_time_t(seconds);

    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros
       << "+00:00";
    return ss.str();
}

std::string TimeUtils::nowIso8601() {
    return toIso8601(std::chrono::system_clock::now());
}

} // namespace LureNet
