#include "SessionIO.h"
#include <cerrno>
#include <sys/socket.h>
#include <sys/time.h>
#include <vector>

namespace LureNet {

bool SessionIO::setReadTimeout(int fd, int seconds) {
    struct timeval tv;
    tv.tv_sec = seconds > 0 ? seconds : 0;
    tv.tv_usec = 0;
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

bool SessionIO::sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

ReadResult SessionIO::receive(int fd, std::size_t maxBytes) {
    std::vector<char> buf(maxBytes);
    while (true) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n > 0) {
            return ReadResult{ReadStatus::Data, std::string(buf.data(), static_cast<size_t>(n))};
        }
        if (n == 0) {
            return ReadResult{ReadStatus::Closed, {}};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return ReadResult{ReadStatus::TimedOut, {}};
        }
        return ReadResult{ReadStatus::Error, {}};
    }
}

bool LineReader::takeLine(std::string& line) {
    auto pos = buffer_.find_first_of("\r\n");
    if (pos == std::string::npos) {
        return false;
    }
    line = buffer_.substr(0, pos);
    size_t skip = 1;
    if (buffer_[pos] == '\r' && pos + 1 < buffer_.size() && buffer_[pos + 1] == '\n') {
        skip = 2;
    }
    buffer_.erase(0, pos + skip);
    return true;
}

ReadResult LineReader::nextLine() {
    std::string line;
    while (!takeLine(line)) {
        if (eof_) {
            if (buffer_.empty()) {
                return ReadResult{ReadStatus::Closed, {}};
            }
            line.swap(buffer_);
            return ReadResult{ReadStatus::Data, line};
        }

        auto chunk = SessionIO::receive(fd_, readSize_);
        if (chunk.hasData()) {
            buffer_ += chunk.data;
            continue;
        }
        if (chunk.status != ReadStatus::Closed && buffer_.empty()) {
            return chunk;
        }
        eof_ = true;
    }
    return ReadResult{ReadStatus::Data, line};
}

} // namespace LureNet
