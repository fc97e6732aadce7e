#pragma once

#include "CancellationToken.hpp"
#include <cstddef>
#include <optional>
#include <string>

// Newline-delimited framing over a connected stream socket. Owns the descriptor.
class LineChannel {
public:
    static constexpr size_t kMaxLineLength = 16 * 1024 * 1024;

    explicit LineChannel(int fd);
    ~LineChannel();

    LineChannel(const LineChannel&) = delete;
    LineChannel& operator=(const LineChannel&) = delete;

    // Throws TransportError when the peer is gone
    void write_line(const std::string& line);

    // Next line without its terminator; empty at end of stream.
    // Throws OperationCancelled once the token fires, TransportError on a read failure.
    std::optional<std::string> read_line(const CancellationToken& cancel = {});

    // Wake a reader blocked on this channel from another thread
    void shutdown();

    int fd() const { return fd_; }

private:
    std::optional<std::string> take_line();

    int fd_;
    std::string buffer_;
};
