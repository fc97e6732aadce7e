#include "LineChannel.hpp"
#include "TransportError.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

// Poll slice so cancellation is noticed while waiting for data
constexpr int kPollSliceMs = 50;

}

LineChannel::LineChannel(int fd) : fd_(fd) {}

LineChannel::~LineChannel() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void LineChannel::write_line(const std::string& line) {
    std::string data = line;
    data.push_back('\n');

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("write failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

std::optional<std::string> LineChannel::take_line() {
    size_t end = buffer_.find('\n');
    if (end == std::string::npos) return std::nullopt;

    std::string line = buffer_.substr(0, end);
    buffer_.erase(0, end + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::optional<std::string> LineChannel::read_line(const CancellationToken& cancel) {
    char chunk[4096];
    while (true) {
        if (auto line = take_line()) return line;

        if (cancel.is_cancellation_requested()) {
            throw OperationCancelled("Operation cancelled while waiting for a response");
        }

        pollfd pfd{fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, kPollSliceMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready == 0) continue;

        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n == 0) return std::nullopt;
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (errno == ECONNRESET) return std::nullopt;
            throw TransportError(std::string("read failed: ") + std::strerror(errno));
        }

        buffer_.append(chunk, static_cast<size_t>(n));
        if (buffer_.size() > kMaxLineLength && buffer_.find('\n') == std::string::npos) {
            throw TransportError("line exceeds " + std::to_string(kMaxLineLength) + " bytes");
        }
    }
}

void LineChannel::shutdown() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}
