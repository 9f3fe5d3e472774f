#pragma once

#include <cstddef>
#include <string>

namespace LureNet {

enum class ReadStatus {
    Data,
    Closed,     // orderly shutdown by the peer
    TimedOut,
    Error
};

struct ReadResult {
    ReadStatus status{ReadStatus::Error};
    std::string data;

    bool hasData() const { return status == ReadStatus::Data; }
};

/**
 * @brief Blocking socket helpers for decoy sessions
 *
 * None of these throw; callers treat every non-Data outcome as the end
 * of the exchange.
 */
class SessionIO {
public:
    /// Bound each recv; 0 disables the timeout
    static bool setReadTimeout(int fd, int seconds);

    /// Write the whole buffer, retrying on EINTR and short writes
    static bool sendAll(int fd, const std::string& data);

    /// One recv of at most maxBytes
    static ReadResult receive(int fd, std::size_t maxBytes);
};

/**
 * @brief Splits a byte stream into lines for line-oriented decoys
 *
 * A trailing fragment without a terminator is returned once the peer
 * closes, so nothing already received is dropped.
 */
class LineReader {
public:
    LineReader(int fd, std::size_t readSize) : fd_(fd), readSize_(readSize) {}

    /// Next line without its terminator
    ReadResult nextLine();

private:
    int fd_;
    std::size_t readSize_;
    std::string buffer_;
    bool eof_ = false;

    bool takeLine(std::string& line);
};

} // namespace LureNet
